#pragma once

#include "frontend/markup.h"
#include "runtime/value.h"
#include "cli/error.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

// Closed set of declarable attribute types
enum class AttrType { Any, String, Atom, Boolean, Integer, Float, List, Map, Global, Struct };

const char* attr_type_name(AttrType type);

struct AttrSpec {
    std::string name;
    AttrType type = AttrType::Any;
    std::string struct_name;           // AttrType::Struct
    bool required = false;
    std::optional<Value> default_value;
    std::string doc;
    Span span;

    // "a :string", "an :integer", "a %User{}"
    std::string describe_type() const;
};

struct SlotSpec {
    std::string name;
    bool required = false;
    std::vector<AttrSpec> attrs;
    std::string doc;
    Span span;

    const AttrSpec* find_attr(const std::string& attr_name) const;
};

// Immutable declaration of one function component
struct ComponentSpec {
    std::string module;
    std::string function;
    std::vector<AttrSpec> attrs;
    std::vector<SlotSpec> slots;
    std::string file;
    Span span;

    const AttrSpec* find_attr(const std::string& attr_name) const;
    const SlotSpec* find_slot(const std::string& slot_name) const;
    const AttrSpec* global_attr() const;
    std::string display_name() const { return module + "." + function + "/1"; }
    // Components without declarations accept any attribute and slot
    bool declared() const { return !attrs.empty() || !slots.empty(); }
};

// What a call site passed, as recorded while compiling the caller
struct AttrUse {
    Span span;
    AttrShape shape = AttrShape::Expression;
    std::string source;                // Literal as written, for messages
};

struct SlotUse {
    Span span;
    std::map<std::string, AttrUse> attrs;
    bool has_root = false;
};

struct ComponentCallRecord {
    std::string module;
    std::string function;
    std::string file;
    Span span;
    std::map<std::string, AttrUse> attrs;
    bool has_root = false;
    std::map<std::string, std::vector<SlotUse>> slots;
};

// phx-*, aria-*, data-* and the standard global HTML attributes
bool is_global_attribute(const std::string& name);

// True when a statically known value shape cannot satisfy the declared type
bool shape_mismatch(const AttrSpec& decl, AttrShape shape);

// True when a default value fits the declared type
bool value_matches_type(const AttrSpec& decl, const Value& value);

// Reports every declarative problem of one call as a warning against the caller
void verify_component_call(const ComponentCallRecord& call, const ComponentSpec& spec, Diagnostics& diagnostics);
