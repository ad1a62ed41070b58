#pragma once

#include "analysis/declarative.h"
#include "codegen/template.h"
#include "cli/error.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct AttrOptions {
    bool required = false;
    std::optional<Value> default_value;
    std::string struct_name;           // AttrType::Struct
    std::string doc;
    Span span;
};

struct SlotOptions {
    bool required = false;
    std::string doc;
    Span span;
};

// One function component: its declarations and its compiled body
struct ComponentDef {
    ComponentSpec spec;
    TemplatePtr tmpl;
};

// Immutable output of compiling one module
struct CompiledUnit {
    std::string module;
    std::string file;
    std::map<std::string, ComponentDef> components;
    std::vector<ComponentCallRecord> calls;

    const ComponentDef* find(const std::string& function) const;
};

using CompiledUnitPtr = std::shared_ptr<const CompiledUnit>;

// Accumulates attr/slot declarations for the next component of one module.
// Declarations attach to the component() that follows them.
class TemplateCompiler {
public:
    TemplateCompiler(const std::string& module, const std::string& file = "nofile");

    void attr(const std::string& name, AttrType type, AttrOptions opts = {});
    void begin_slot(const std::string& name, SlotOptions opts = {});
    void end_slot();

    // Compiles a component body; throws ParseError on lexical or structural errors.
    // source_file overrides the unit's file name in messages about the body.
    void component(const std::string& name, const std::string& source, const std::string& source_file = "");

    // Compiles a standalone template of this module (not a component)
    TemplatePtr compile(const std::string& source);

    // Verifies local calls and seals the unit. The compiler is unusable afterwards.
    CompiledUnitPtr finish();

    const Diagnostics& diagnostics() const { return diags; }

private:
    std::string module;
    std::string file;
    std::vector<AttrSpec> pending_attrs;
    std::vector<SlotSpec> pending_slots;
    std::optional<SlotSpec> open_slot;
    std::shared_ptr<CompiledUnit> unit;
    Diagnostics diags;

    bool validate_attr(const AttrSpec& attr, const std::vector<AttrSpec>& existing, bool in_slot);
    void drop_pending(const std::string& reason);
};

// Links compiled units so remote component calls can be resolved and verified
class ComponentLibrary {
public:
    void add(CompiledUnitPtr unit);

    const ComponentDef* find(const std::string& module, const std::string& function) const;
    const CompiledUnit* unit(const std::string& module) const;

    // Verifies every call into another unit; unresolved targets are warnings
    void verify(Diagnostics& diagnostics) const;

private:
    std::map<std::string, CompiledUnitPtr> units;
};
