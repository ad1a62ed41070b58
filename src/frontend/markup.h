#pragma once

#include "span.h"
#include <string>
#include <vector>

// Tag classification, decided once from the tag name
enum class TagKind {
    Element,          // <div>
    Void,             // <br>, never pushed on the open-tag stack
    RemoteComponent,  // <Module.fun>
    LocalComponent,   // <.fun>
    Slot              // <:name>
};

TagKind classify_tag(const std::string& name);
bool is_void_tag(const std::string& name);
bool is_raw_text_tag(const std::string& name);

enum class AttrValueKind { Literal, Expression, Boolean };

// Statically known shape of an attribute value, recorded for declarative validation
enum class AttrShape { String, Boolean, Atom, Integer, Float, List, Map, Expression };

const char* attr_shape_name(AttrShape shape);

struct Attribute {
    std::string name;              // Empty for a root spread {expr}
    AttrValueKind kind = AttrValueKind::Boolean;
    std::string value;             // Literal text or expression code
    char delimiter = '"';          // Quote of a literal
    Span span;                     // Position of the name
    Span value_span;               // Position of the expression code

    bool is_spread() const { return name.empty(); }
    bool is_special() const { return !name.empty() && name[0] == ':'; }
};

// Role of an EEx marker inside a do-block
enum class BlockRole { None, Start, Middle, End };

enum class MarkupType { Text, TagOpen, TagClose, Expression };

struct MarkupToken {
    MarkupType type = MarkupType::Text;
    std::string content;           // Text: the run; Expression: the code
    std::string name;              // Tag name
    TagKind tag_kind = TagKind::Element;
    std::vector<Attribute> attrs;
    bool self_close = false;
    std::string marker;            // Expression: "=" for output, "" for exec
    BlockRole role = BlockRole::None;
    Span span;
};
