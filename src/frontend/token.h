#pragma once

#include <string>

// Tokens of the embedded expression language (inside <%= %> and attr={...})
enum class TokenType {
    // Keywords
    IF, UNLESS, ELSE, FOR, DO, END, WHEN, NOT, AND_KW, OR_KW, NIL, TRUE, FALSE,
    // Literals
    INT_LITERAL, FLOAT_LITERAL, STRING_LITERAL, ATOM_LITERAL, KEYWORD_KEY,
    // Identifiers
    IDENTIFIER, ASSIGN_REF,
    // Operators
    PLUS, MINUS, STAR, SLASH, CONCAT, EQ, NEQ, STRICT_EQ, STRICT_NEQ, LT, GT, LTE, GTE,
    AND, OR, BANG, QUESTION, LEFT_ARROW, FAT_ARROW, RANGE,
    // Delimiters
    LPAREN, RPAREN, LBRACE, RBRACE, LBRACKET, RBRACKET, MAP_OPEN,
    COMMA, DOT, COLON,
    // Special
    END_OF_FILE, UNKNOWN
};

struct Token {
    TokenType type;
    std::string value;
    int line;
    int column;
};
