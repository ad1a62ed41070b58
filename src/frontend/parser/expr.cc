#include "frontend/parser.h"
#include "cli/error.h"
#include <cstdlib>

std::unique_ptr<Expression> Parser::parse_expression()
{
    return parse_ternary();
}

std::unique_ptr<Expression> Parser::parse_ternary()
{
    Token start = current();
    auto expr = parse_or();

    if (current().type == TokenType::QUESTION)
    {
        advance();                           // skip '?'
        auto true_expr = parse_expression(); // Allow nested ternary
        expect(TokenType::COLON, "Expected ':' in ternary expression");
        auto false_expr = parse_ternary(); // Right-associative
        expr = std::make_unique<TernaryOp>(std::move(expr), std::move(true_expr), std::move(false_expr));
        expr->span = span_of(start);
    }

    return expr;
}

std::unique_ptr<Expression> Parser::parse_or()
{
    auto left = parse_and();

    while (current().type == TokenType::OR || current().type == TokenType::OR_KW)
    {
        std::string op = current().value;
        advance();
        auto right = parse_and();
        left = std::make_unique<BinaryOp>(std::move(left), op, std::move(right));
    }

    return left;
}

std::unique_ptr<Expression> Parser::parse_and()
{
    auto left = parse_equality();

    while (current().type == TokenType::AND || current().type == TokenType::AND_KW)
    {
        std::string op = current().value;
        advance();
        auto right = parse_equality();
        left = std::make_unique<BinaryOp>(std::move(left), op, std::move(right));
    }

    return left;
}

std::unique_ptr<Expression> Parser::parse_equality()
{
    auto left = parse_comparison();

    while (current().type == TokenType::EQ || current().type == TokenType::NEQ ||
           current().type == TokenType::STRICT_EQ || current().type == TokenType::STRICT_NEQ)
    {
        std::string op = current().value;
        advance();
        auto right = parse_comparison();
        left = std::make_unique<BinaryOp>(std::move(left), op, std::move(right));
    }

    return left;
}

std::unique_ptr<Expression> Parser::parse_comparison()
{
    auto left = parse_concat();

    while (current().type == TokenType::LT || current().type == TokenType::GT ||
           current().type == TokenType::LTE || current().type == TokenType::GTE)
    {
        std::string op = current().value;
        advance();
        auto right = parse_concat();
        left = std::make_unique<BinaryOp>(std::move(left), op, std::move(right));
    }

    return left;
}

// a <> b, right-associative
std::unique_ptr<Expression> Parser::parse_concat()
{
    auto left = parse_range();

    if (current().type == TokenType::CONCAT)
    {
        advance();
        auto right = parse_concat();
        left = std::make_unique<BinaryOp>(std::move(left), "<>", std::move(right));
    }

    return left;
}

std::unique_ptr<Expression> Parser::parse_range()
{
    auto left = parse_additive();

    if (current().type == TokenType::RANGE)
    {
        advance();
        auto right = parse_additive();
        left = std::make_unique<RangeExpr>(std::move(left), std::move(right));
    }

    return left;
}

std::unique_ptr<Expression> Parser::parse_additive()
{
    auto left = parse_multiplicative();

    while (current().type == TokenType::PLUS || current().type == TokenType::MINUS)
    {
        std::string op = current().value;
        advance();
        auto right = parse_multiplicative();
        left = std::make_unique<BinaryOp>(std::move(left), op, std::move(right));
    }

    return left;
}

std::unique_ptr<Expression> Parser::parse_multiplicative()
{
    auto left = parse_unary();

    while (current().type == TokenType::STAR || current().type == TokenType::SLASH)
    {
        std::string op = current().value;
        advance();
        auto right = parse_unary();
        left = std::make_unique<BinaryOp>(std::move(left), op, std::move(right));
    }

    return left;
}

std::unique_ptr<Expression> Parser::parse_unary()
{
    Token start = current();
    if (current().type == TokenType::MINUS || current().type == TokenType::BANG || current().type == TokenType::NOT)
    {
        std::string op = current().value;
        advance();
        auto operand = parse_unary();
        auto expr = std::make_unique<UnaryOp>(op, std::move(operand));
        expr->span = span_of(start);
        return expr;
    }
    return parse_postfix();
}

std::unique_ptr<Expression> Parser::parse_postfix()
{
    auto expr = parse_primary();

    while (true)
    {
        Token start = current();
        if (current().type == TokenType::DOT)
        {
            advance();
            if (current().type != TokenType::IDENTIFIER)
            {
                error("Expected field name after '.'");
            }
            std::string member = current().value;
            advance();
            auto access = std::make_unique<MemberAccess>(std::move(expr), member);
            access->span = span_of(start);
            expr = std::move(access);
        }
        else if (current().type == TokenType::LBRACKET)
        {
            advance();
            auto index = parse_expression();
            expect(TokenType::RBRACKET, "Expected ']'");
            auto access = std::make_unique<IndexAccess>(std::move(expr), std::move(index));
            access->span = span_of(start);
            expr = std::move(access);
        }
        else if (current().type == TokenType::LPAREN)
        {
            // Only names are callable: f(x), String.upcase(x)
            if (!dynamic_cast<Identifier *>(expr.get()) && !dynamic_cast<MemberAccess *>(expr.get()))
            {
                error("Expression is not callable");
            }
            advance();
            auto call = std::make_unique<FunctionCall>(expr->to_source());
            call->span = expr->span;
            while (current().type != TokenType::RPAREN)
            {
                call->args.push_back(parse_expression());
                if (!match(TokenType::COMMA))
                    break;
            }
            expect(TokenType::RPAREN, "Expected ')' after arguments");
            expr = std::move(call);
        }
        else
        {
            break;
        }
    }

    return expr;
}

std::unique_ptr<Expression> Parser::parse_list_literal()
{
    Token start = current();
    expect(TokenType::LBRACKET, "Expected '['");
    auto list = std::make_unique<ListLiteral>();
    list->span = span_of(start);
    while (current().type != TokenType::RBRACKET)
    {
        list->elements.push_back(parse_expression());
        if (!match(TokenType::COMMA))
            break;
    }
    expect(TokenType::RBRACKET, "Expected ']' to close list");
    return list;
}

// %{key: value, "key" => value}
std::unique_ptr<Expression> Parser::parse_map_literal()
{
    Token start = current();
    expect(TokenType::MAP_OPEN, "Expected '%{'");
    auto map = std::make_unique<MapLiteral>();
    map->span = span_of(start);
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
            expect(TokenType::FAT_ARROW, "Expected '=>' in map literal");
        }
        else
        {
            error("Expected a key in map literal");
        }
        map->entries.emplace_back(key, parse_expression());
        if (!match(TokenType::COMMA))
            break;
    }
    expect(TokenType::RBRACE, "Expected '}' to close map literal");
    return map;
}

std::unique_ptr<Expression> Parser::parse_primary()
{
    Token tok = current();
    std::unique_ptr<Expression> expr;

    switch (tok.type)
    {
    case TokenType::INT_LITERAL:
        advance();
        expr = std::make_unique<IntLiteral>(std::strtoll(tok.value.c_str(), nullptr, 10));
        break;
    case TokenType::FLOAT_LITERAL:
        advance();
        expr = std::make_unique<FloatLiteral>(std::strtod(tok.value.c_str(), nullptr));
        break;
    case TokenType::STRING_LITERAL:
        advance();
        expr = std::make_unique<StringLiteral>(tok.value);
        break;
    case TokenType::ATOM_LITERAL:
        advance();
        expr = std::make_unique<AtomLiteral>(tok.value);
        break;
    case TokenType::TRUE:
    case TokenType::FALSE:
        advance();
        expr = std::make_unique<BoolLiteral>(tok.type == TokenType::TRUE);
        break;
    case TokenType::NIL:
        advance();
        expr = std::make_unique<NilLiteral>();
        break;
    case TokenType::IDENTIFIER:
        advance();
        expr = std::make_unique<Identifier>(tok.value);
        break;
    case TokenType::ASSIGN_REF:
        advance();
        expr = std::make_unique<AssignRef>(tok.value);
        break;
    case TokenType::LPAREN:
    {
        advance();
        expr = parse_expression();
        expect(TokenType::RPAREN, "Expected ')'");
        return expr;
    }
    case TokenType::LBRACKET:
        return parse_list_literal();
    case TokenType::MAP_OPEN:
        return parse_map_literal();
    case TokenType::UNKNOWN:
        if (tok.value == "\"" || tok.value == "'")
        {
            error("Unterminated string literal");
        }
        error("Unexpected character");
    default:
        error("Expected an expression");
    }

    expr->span = span_of(tok);
    return expr;
}
