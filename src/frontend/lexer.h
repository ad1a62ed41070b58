#pragma once

#include "token.h"
#include <string>
#include <vector>

// Lexes the code of one expression; positions are offset to where the code sits in the template
class Lexer {
    private:
        std::string source;
        size_t pos = 0;
        int line = 1;
        int column = 1;

        char current();
        char peek(int offset = 1);
        void advance();
        void skip_whitespace();
        Token make_token(TokenType type, const std::string& value = "");
        Token read_number();
        Token read_string();
        Token read_atom();
        Token read_identifier();
    public:
        Lexer(const std::string& src, int start_line = 1, int start_column = 1);
        std::vector<Token> tokenize();
};
