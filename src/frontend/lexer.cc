#include "lexer.h"
#include <cctype>
#include <unordered_map>

Lexer::Lexer(const std::string& src, int start_line, int start_column)
    : source(src), line(start_line), column(start_column){}

char Lexer::current(){
    return pos < source.size() ? source[pos] : '\0';
}

char Lexer::peek(int offset){
    return (pos + offset) < source.size() ? source[pos + offset] : '\0';
}

void Lexer::advance(){
    if(current() == '\n'){
        line++;
        column = 1;
    }else{
        column++;
    }
    pos++;
}

void Lexer::skip_whitespace(){
    while(std::isspace(static_cast<unsigned char>(current()))) advance();
}

Token Lexer::make_token(TokenType type, const std::string& value){
    return Token{type, value, line, column};
}

Token Lexer::read_number(){
    int start_line = line;
    int start_column = column;
    std::string num;
    bool is_float = false;

    while(std::isdigit(static_cast<unsigned char>(current())) || current() == '_' || current() == '.'){
        if(current() == '.'){
            // 1..3 is a range, not a float
            if(is_float || !std::isdigit(static_cast<unsigned char>(peek()))) break;
            is_float = true;
        }
        if(current() != '_') num += current();
        advance();
    }

    // Exponent part: 1.0e10
    if(is_float && (current() == 'e' || current() == 'E')){
        num += current();
        advance();
        if(current() == '-' || current() == '+'){
            num += current();
            advance();
        }
        while(std::isdigit(static_cast<unsigned char>(current()))){
            num += current();
            advance();
        }
    }

    return Token{is_float ? TokenType::FLOAT_LITERAL : TokenType::INT_LITERAL, num, start_line, start_column};
}

Token Lexer::read_string(){
    int start_line = line;
    int start_column = column;
    char quote = current();
    std::string str;
    advance(); // skip opening quote

    while(current() != quote && current() != '\0'){
        if(current() == '\\'){
            advance();
            switch (current()) {
                case 'n' : str += '\n'; break;
                case 't' : str += '\t'; break;
                case 'r' : str += '\r'; break;
                case '\\' : str += '\\'; break;
                case '"' : str += '"'; break;
                case '\'' : str += '\''; break;
                case '\0' : return Token{TokenType::UNKNOWN, std::string(1, quote), start_line, start_column};
                default: str += '\\'; str += current();
            }
        }else{
            str += current();
        }
        advance();
    }

    if(current() != quote){
        return Token{TokenType::UNKNOWN, std::string(1, quote), start_line, start_column};
    }
    advance(); // skip closing quote
    return Token{TokenType::STRING_LITERAL, str, start_line, start_column};
}

Token Lexer::read_atom(){
    int start_line = line;
    int start_column = column;
    advance(); // skip ':'

    if(current() == '"'){
        Token quoted = read_string();
        if(quoted.type == TokenType::UNKNOWN) return quoted;
        return Token{TokenType::ATOM_LITERAL, quoted.value, start_line, start_column};
    }

    std::string name;
    while(std::isalnum(static_cast<unsigned char>(current())) || current() == '_' ||
          current() == '?' || current() == '!'){
        name += current();
        advance();
    }
    return Token{TokenType::ATOM_LITERAL, name, start_line, start_column};
}

Token Lexer::read_identifier(){
    int start_line = line;
    int start_column = column;
    std::string id;
    id.reserve(32);

    while(std::isalnum(static_cast<unsigned char>(current())) || current() == '_'){
        id += current();
        advance();
    }
    // Elixir-style predicate/bang suffix
    if((current() == '?' || current() == '!') && peek() != '='){
        id += current();
        advance();
    }

    // `name:` inside maps and keyword lists
    if(current() == ':' && peek() != ':' && !std::isalnum(static_cast<unsigned char>(peek())) && peek() != '"'){
        advance();
        return Token{TokenType::KEYWORD_KEY, id, start_line, start_column};
    }

    static const std::unordered_map<std::string, TokenType> keywords = {
        {"if", TokenType::IF},
        {"unless", TokenType::UNLESS},
        {"else", TokenType::ELSE},
        {"for", TokenType::FOR},
        {"do", TokenType::DO},
        {"end", TokenType::END},
        {"when", TokenType::WHEN},
        {"not", TokenType::NOT},
        {"and", TokenType::AND_KW},
        {"or", TokenType::OR_KW},
        {"nil", TokenType::NIL},
        {"true", TokenType::TRUE},
        {"false", TokenType::FALSE},
    };

    auto it = keywords.find(id);
    if(it != keywords.end()){
        return Token{it->second, id, start_line, start_column};
    }

    return Token{TokenType::IDENTIFIER, id, start_line, start_column};
}

std::vector<Token> Lexer::tokenize(){
    std::vector<Token> tokens;
    tokens.reserve(source.size() / 4 + 1);

    while(true){
        skip_whitespace();
        if(current() == '\0') break;

        // Numbers
        if(std::isdigit(static_cast<unsigned char>(current()))){
            tokens.push_back(read_number());
            continue;
        }

        // Strings
        if(current() == '"' || current() == '\''){
            tokens.push_back(read_string());
            continue;
        }

        // Identifiers, keywords and keyword keys
        if(std::isalpha(static_cast<unsigned char>(current())) || current() == '_'){
            tokens.push_back(read_identifier());
            continue;
        }

        // @assign
        if(current() == '@' && (std::isalpha(static_cast<unsigned char>(peek())) || peek() == '_')){
            int start_line = line;
            int start_column = column;
            advance();
            Token id = read_identifier();
            tokens.push_back(Token{TokenType::ASSIGN_REF, id.value, start_line, start_column});
            continue;
        }

        // :atom
        if(current() == ':' && (std::isalpha(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '"')){
            tokens.push_back(read_atom());
            continue;
        }

        // Three-character operators
        if(current() == '=' && peek() == '=' && peek(2) == '='){
            tokens.push_back(make_token(TokenType::STRICT_EQ, "==="));
            advance(); advance(); advance();
            continue;
        }
        if(current() == '!' && peek() == '=' && peek(2) == '='){
            tokens.push_back(make_token(TokenType::STRICT_NEQ, "!=="));
            advance(); advance(); advance();
            continue;
        }

        // Two-character operators
        if(current() == '=' && peek() == '='){
            tokens.push_back(make_token(TokenType::EQ, "=="));
            advance(); advance();
            continue;
        }
        if (current() == '!' && peek() == '=') {
            tokens.push_back(make_token(TokenType::NEQ, "!="));
            advance(); advance();
            continue;
        }
        if (current() == '<' && peek() == '=') {
            tokens.push_back(make_token(TokenType::LTE, "<="));
            advance(); advance();
            continue;
        }
        if (current() == '>' && peek() == '=') {
            tokens.push_back(make_token(TokenType::GTE, ">="));
            advance(); advance();
            continue;
        }
        if (current() == '<' && peek() == '>') {
            tokens.push_back(make_token(TokenType::CONCAT, "<>"));
            advance(); advance();
            continue;
        }
        if (current() == '<' && peek() == '-') {
            tokens.push_back(make_token(TokenType::LEFT_ARROW, "<-"));
            advance(); advance();
            continue;
        }
        if (current() == '=' && peek() == '>') {
            tokens.push_back(make_token(TokenType::FAT_ARROW, "=>"));
            advance(); advance();
            continue;
        }
        if (current() == '&' && peek() == '&') {
            tokens.push_back(make_token(TokenType::AND, "&&"));
            advance(); advance();
            continue;
        }
        if (current() == '|' && peek() == '|') {
            tokens.push_back(make_token(TokenType::OR, "||"));
            advance(); advance();
            continue;
        }
        if (current() == '.' && peek() == '.') {
            tokens.push_back(make_token(TokenType::RANGE, ".."));
            advance(); advance();
            continue;
        }
        if (current() == '%' && peek() == '{') {
            tokens.push_back(make_token(TokenType::MAP_OPEN, "%{"));
            advance(); advance();
            continue;
        }

        // Single-character tokens
        switch (current()) {
            case '+': tokens.push_back(make_token(TokenType::PLUS, "+")); break;
            case '-': tokens.push_back(make_token(TokenType::MINUS, "-")); break;
            case '*': tokens.push_back(make_token(TokenType::STAR, "*")); break;
            case '/': tokens.push_back(make_token(TokenType::SLASH, "/")); break;
            case '<': tokens.push_back(make_token(TokenType::LT, "<")); break;
            case '>': tokens.push_back(make_token(TokenType::GT, ">")); break;
            case '!': tokens.push_back(make_token(TokenType::BANG, "!")); break;
            case '?': tokens.push_back(make_token(TokenType::QUESTION, "?")); break;
            case '(': tokens.push_back(make_token(TokenType::LPAREN, "(")); break;
            case ')': tokens.push_back(make_token(TokenType::RPAREN, ")")); break;
            case '{': tokens.push_back(make_token(TokenType::LBRACE, "{")); break;
            case '}': tokens.push_back(make_token(TokenType::RBRACE, "}")); break;
            case '[': tokens.push_back(make_token(TokenType::LBRACKET, "[")); break;
            case ']': tokens.push_back(make_token(TokenType::RBRACKET, "]")); break;
            case ',': tokens.push_back(make_token(TokenType::COMMA, ",")); break;
            case '.': tokens.push_back(make_token(TokenType::DOT, ".")); break;
            case ':': tokens.push_back(make_token(TokenType::COLON, ":")); break;
            default:
                tokens.push_back(make_token(TokenType::UNKNOWN, std::string(1, current())));
        }
        advance();
    }

    tokens.push_back(make_token(TokenType::END_OF_FILE, ""));
    return tokens;
}
