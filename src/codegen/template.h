#pragma once

#include "ast/ast.h"
#include "runtime/value.h"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct Template;
using TemplatePtr = std::shared_ptr<const Template>;

// How an expression value is written into the output
enum class Encoding {
    Text,       // <%= %>: escaped text, or nested render trees
    AttrPair,   // name={expr}: ` name="v"`, ` name`, or nothing
    ClassAttr,  // class={expr}: value only, lists joined by spaces
    AttrValue,  // style={expr}: value only
    Spread      // {expr}: every pair of a map
};

// Attribute passed to a component or slot
struct AttrBinding {
    std::string name;
    std::unique_ptr<Expression> expr;  // nullptr for literal and boolean values
    Value literal;
    AttrShape shape = AttrShape::Expression;
    DependencySet deps;
    Span span;
};

// One <:name> entry (or the implicit inner_block) of a component call
struct SlotContent {
    std::string name;
    std::vector<AttrBinding> attrs;
    std::vector<AttrBinding> roots;
    std::optional<Pattern> let;
    TemplatePtr body;                  // nullptr when self-closing
    DependencySet deps;                // attrs + body, without the :let names
    bool reads_let = false;            // Body output depends on the value passed to render_slot
    Span span;
};

struct ComponentInvocation {
    TagKind kind = TagKind::LocalComponent;
    std::string module;                // Resolved: the compiling unit for local calls
    std::string function;
    std::vector<AttrBinding> attrs;
    std::vector<AttrBinding> roots;
    std::map<std::string, std::vector<SlotContent>> slots;
    Span span;

    std::string target() const { return module + "." + function; }
};

enum class PartKind { Expr, Attr, If, For, Component };

// A dynamic region of a compiled template
struct DynamicPart {
    PartKind kind = PartKind::Expr;
    DependencySet deps;
    Span span;

    // Expr / Attr / If condition
    std::unique_ptr<Expression> expr;
    Encoding encoding = Encoding::Text;
    std::string attr_name;

    // If
    bool negate = false;
    TemplatePtr then_branch;
    TemplatePtr else_branch;

    // For
    Generator generator;
    TemplatePtr body;

    // Component
    std::unique_ptr<ComponentInvocation> call;
};

// A compiled template: static fragments around dynamic parts, plus a shape fingerprint
struct Template {
    std::shared_ptr<const std::vector<std::string>> statics;
    std::vector<DynamicPart> parts;
    DependencySet deps;                // Union over all parts
    uint64_t fingerprint = 0;
    bool root = false;
    std::string module;
    std::string file;
};
