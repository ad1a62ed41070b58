#pragma once

#include "node.h"
#include "expressions.h"
#include "frontend/markup.h"
#include <optional>

// An attribute after parsing: expression code is parsed once here
struct ParsedAttribute {
    Attribute attr;
    std::unique_ptr<Expression> expr;  // Expression and spread attributes
    AttrShape shape = AttrShape::Expression;
};

// Base for nodes of the template tree
struct TemplateNode : ASTNode {};

using NodeList = std::vector<std::unique_ptr<TemplateNode>>;

struct TextNode : TemplateNode {
    std::string content;
};

// <%= expr %>
struct ExpressionHole : TemplateNode {
    std::unique_ptr<Expression> expr;
};

struct ElementNode : TemplateNode {
    std::string name;
    TagKind kind = TagKind::Element;
    std::vector<ParsedAttribute> attrs;
    NodeList children;
    bool self_close = false;
};

// Element carrying :for={pattern <- source}
struct LoopNode : TemplateNode {
    Generator generator;
    std::unique_ptr<ElementNode> body;
};

struct SlotEntryNode : TemplateNode {
    std::string name;                  // Without the leading ':'
    std::vector<ParsedAttribute> attrs;
    std::vector<ParsedAttribute> roots;
    std::optional<Pattern> let;
    NodeList children;
    bool self_close = false;
};

struct ComponentCallNode : TemplateNode {
    TagKind kind = TagKind::LocalComponent;
    std::string tag;                   // As written: Mod.fun or .fun
    std::string module;                // Empty for local calls
    std::string function;
    std::vector<ParsedAttribute> attrs;
    std::vector<ParsedAttribute> roots;
    std::optional<Pattern> let;        // Applies to the default slot
    std::vector<std::unique_ptr<SlotEntryNode>> slots;
    NodeList children;                 // Default slot content
    bool self_close = false;
};

// <%= if cond do %> ... <% else %> ... <% end %>
struct IfBlockNode : TemplateNode {
    std::unique_ptr<Expression> condition;
    bool negate = false;               // unless
    NodeList then_children;
    NodeList else_children;
    bool in_else = false;
};

// <%= for pattern <- source do %> ... <% end %>
struct ForBlockNode : TemplateNode {
    Generator generator;
    NodeList children;
};

struct TemplateTree {
    NodeList children;
    std::string file;
};
