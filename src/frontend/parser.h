#pragma once

#include "token.h"
#include "markup.h"
#include "ast/ast.h"
#include <vector>
#include <memory>
#include <string>

// Recursive-descent parser for the expression language
class Parser{
    private:
        std::vector<Token> tokens;
        size_t pos = 0;
        std::string file;

        Token current();
        Token peek(int offset = 1);
        void advance();
        bool match(TokenType type);
        void expect(TokenType type, const std::string& msg);
        [[noreturn]] void error(const std::string& msg);
        Span span_of(const Token& tok);

        std::unique_ptr<Expression> parse_ternary();
        std::unique_ptr<Expression> parse_or();
        std::unique_ptr<Expression> parse_and();
        std::unique_ptr<Expression> parse_equality();
        std::unique_ptr<Expression> parse_comparison();
        std::unique_ptr<Expression> parse_concat();
        std::unique_ptr<Expression> parse_range();
        std::unique_ptr<Expression> parse_additive();
        std::unique_ptr<Expression> parse_multiplicative();
        std::unique_ptr<Expression> parse_unary();
        std::unique_ptr<Expression> parse_postfix();
        std::unique_ptr<Expression> parse_primary();
        std::unique_ptr<Expression> parse_map_literal();
        std::unique_ptr<Expression> parse_list_literal();

    public:
        Parser(const std::vector<Token>& toks, const std::string& file_name = "nofile");

        std::unique_ptr<Expression> parse_expression();
        Pattern parse_pattern();
        Generator parse_generator();
        void expect_end(const std::string& what);

        bool at(TokenType type) { return current().type == type; }
        bool accept(TokenType type) { return match(type); }
};

// Entry points over raw code found in the template
std::unique_ptr<Expression> parse_expression_code(const std::string& code, const Span& at, const std::string& file);
Pattern parse_pattern_code(const std::string& code, const Span& at, const std::string& file);
Generator parse_generator_code(const std::string& code, const Span& at, const std::string& file);

// Shape of a value known at compile time
AttrShape literal_shape(const Attribute& attr, const Expression* expr);

// Builds the template tree from markup tokens, validating tag structure
class TreeBuilder{
    private:
        struct OpenFrame {
            enum class Kind { Root, Element, Component, Slot, Block };
            Kind kind = Kind::Root;
            std::string name;
            Span open_span;
            std::unique_ptr<TemplateNode> node;
            NodeList* children = nullptr;
            std::unique_ptr<Generator> loop;  // :for on the element
        };

        std::vector<MarkupToken> tokens;
        std::string file;
        std::vector<OpenFrame> stack;
        NodeList root;

        OpenFrame& top() { return stack.back(); }
        void append(std::unique_ptr<TemplateNode> node);
        void close_frame(OpenFrame frame);

        void handle_text(MarkupToken& tok);
        void handle_expression(MarkupToken& tok);
        void handle_block_start(MarkupToken& tok);
        void handle_block_middle(MarkupToken& tok);
        void handle_block_end(MarkupToken& tok);
        void handle_tag_open(MarkupToken& tok);
        void handle_tag_close(MarkupToken& tok);

        void open_element(MarkupToken& tok);
        void open_component(MarkupToken& tok);
        void open_slot(MarkupToken& tok);

        // Component and slot attribute splitting (parser/component.cc)
        void split_component_attrs(const MarkupToken& tok, const std::string& context,
                                   std::vector<ParsedAttribute>& attrs, std::vector<ParsedAttribute>& roots,
                                   std::optional<Pattern>& let);
        ParsedAttribute parse_attribute(const Attribute& attr);
        void resolve_remote(ComponentCallNode& call, const MarkupToken& tok);
        void validate_element_attrs(const MarkupToken& tok);
        void check_unclosed_for_block(const MarkupToken& tok);

    public:
        TreeBuilder(std::vector<MarkupToken> toks, const std::string& file_name = "nofile");
        TemplateTree parse();
};

// lex_template + TreeBuilder
TemplateTree parse_template(const std::string& source, const std::string& file = "nofile");
