#include "frontend/parser.h"
#include "frontend/lexer.h"
#include "cli/error.h"

Parser::Parser(const std::vector<Token> &toks, const std::string &file_name) : tokens(toks), file(file_name) {}

Token Parser::current()
{
    return pos < tokens.size() ? tokens[pos] : tokens.back();
}

Token Parser::peek(int offset)
{
    return (pos + offset) < tokens.size() ? tokens[pos + offset] : tokens.back();
}

void Parser::advance() { pos++; }

bool Parser::match(TokenType type)
{
    if (current().type == type)
    {
        advance();
        return true;
    }
    return false;
}

void Parser::expect(TokenType type, const std::string &msg)
{
    if (!match(type))
    {
        error(msg);
    }
}

Span Parser::span_of(const Token &tok)
{
    return Span{tok.line, tok.column, tok.line, tok.column + static_cast<int>(tok.value.size())};
}

void Parser::error(const std::string &msg)
{
    Token tok = current();
    std::string found = tok.type == TokenType::END_OF_FILE ? "end of expression" : "'" + tok.value + "'";
    ErrorHandler::compiler_error(ErrorKind::InvalidExpression, msg + ", got " + found, span_of(tok), file);
}

void Parser::expect_end(const std::string &what)
{
    if (current().type != TokenType::END_OF_FILE)
    {
        error("Unexpected token after " + what);
    }
}

// name | _ | %{key: name, ...}
Pattern Parser::parse_pattern()
{
    Pattern pattern;
    pattern.span = span_of(current());

    if (current().type == TokenType::IDENTIFIER)
    {
        pattern.variable = current().value;
        advance();
        return pattern;
    }

    if (match(TokenType::MAP_OPEN))
    {
        while (current().type != TokenType::RBRACE)
        {
            std::string key;
            if (current().type == TokenType::KEYWORD_KEY)
            {
                key = current().value;
                advance();
            }
            else if (current().type == TokenType::STRING_LITERAL || current().type == TokenType::ATOM_LITERAL)
            {
                key = current().value;
                advance();
                expect(TokenType::FAT_ARROW, "Expected '=>' in map pattern");
            }
            else
            {
                error("Expected a key in map pattern");
            }

            if (current().type != TokenType::IDENTIFIER)
            {
                error("Expected a variable name in map pattern");
            }
            pattern.fields.emplace_back(key, current().value);
            advance();

            if (!match(TokenType::COMMA)) break;
        }
        expect(TokenType::RBRACE, "Expected '}' to close map pattern");
        if (pattern.fields.empty())
        {
            pattern.variable = "_";
        }
        return pattern;
    }

    error("Expected a pattern");
}

// pattern <- source[, filter]
Generator Parser::parse_generator()
{
    Generator gen;
    gen.span = span_of(current());
    gen.pattern = parse_pattern();
    expect(TokenType::LEFT_ARROW, "Expected '<-' in generator");
    gen.source = parse_expression();
    if (match(TokenType::COMMA))
    {
        gen.filter = parse_expression();
    }
    return gen;
}

static std::vector<Token> lex_code(const std::string &code, const Span &at)
{
    Lexer lexer(code, at.line, at.column);
    return lexer.tokenize();
}

std::unique_ptr<Expression> parse_expression_code(const std::string &code, const Span &at, const std::string &file)
{
    Parser parser(lex_code(code, at), file);
    if (parser.at(TokenType::END_OF_FILE))
    {
        ErrorHandler::compiler_error(ErrorKind::InvalidExpression, "empty expression", at, file);
    }
    auto expr = parser.parse_expression();
    parser.expect_end("expression");
    return expr;
}

Pattern parse_pattern_code(const std::string &code, const Span &at, const std::string &file)
{
    Parser parser(lex_code(code, at), file);
    Pattern pattern = parser.parse_pattern();
    parser.expect_end("pattern");
    return pattern;
}

Generator parse_generator_code(const std::string &code, const Span &at, const std::string &file)
{
    Parser parser(lex_code(code, at), file);
    Generator gen = parser.parse_generator();
    parser.expect_end("generator");
    return gen;
}

AttrShape literal_shape(const Attribute &attr, const Expression *expr)
{
    switch (attr.kind)
    {
    case AttrValueKind::Literal:
        return AttrShape::String;
    case AttrValueKind::Boolean:
        return AttrShape::Boolean;
    case AttrValueKind::Expression:
        break;
    }
    if (!expr)
        return AttrShape::Expression;

    if (dynamic_cast<const StringLiteral *>(expr))
        return AttrShape::String;
    if (dynamic_cast<const BoolLiteral *>(expr))
        return AttrShape::Boolean;
    if (dynamic_cast<const AtomLiteral *>(expr) || dynamic_cast<const NilLiteral *>(expr))
        return AttrShape::Atom;
    if (dynamic_cast<const IntLiteral *>(expr))
        return AttrShape::Integer;
    if (dynamic_cast<const FloatLiteral *>(expr))
        return AttrShape::Float;
    if (auto unary = dynamic_cast<const UnaryOp *>(expr))
    {
        if (unary->op == "-" && dynamic_cast<const IntLiteral *>(unary->operand.get()))
            return AttrShape::Integer;
        if (unary->op == "-" && dynamic_cast<const FloatLiteral *>(unary->operand.get()))
            return AttrShape::Float;
    }
    if (auto list = dynamic_cast<const ListLiteral *>(expr))
    {
        if (list->is_static())
            return AttrShape::List;
    }
    if (auto map = dynamic_cast<const MapLiteral *>(expr))
    {
        if (map->is_static())
            return AttrShape::Map;
    }
    return AttrShape::Expression;
}
