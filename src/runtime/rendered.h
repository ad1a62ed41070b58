#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "value.h"

struct Rendered;
struct Comprehension;

using RenderedPtr = std::shared_ptr<const Rendered>;
using Statics = std::shared_ptr<const std::vector<std::string>>;

// One dynamic slot of a render tree
struct Dynamic {
    enum class Kind { Value, Nested, List, Comprehension, Component };

    Kind kind = Kind::Value;
    // False when the producing expression was skipped and the previous output was carried over
    bool fresh = true;

    std::string value;                                     // Kind::Value, already escaped
    RenderedPtr nested;                                    // Kind::Nested
    std::vector<RenderedPtr> list;                         // Kind::List
    std::shared_ptr<const Comprehension> comprehension;    // Kind::Comprehension
    int cid = -1;                                          // Kind::Component

    static Dynamic text(std::string html);
    static Dynamic of_nested(RenderedPtr tree);
    static Dynamic of_list(std::vector<RenderedPtr> items);
    static Dynamic of_comprehension(std::shared_ptr<const Comprehension> comp);
    static Dynamic of_component(int cid);

    Dynamic carried() const {
        Dynamic d = *this;
        d.fresh = false;
        return d;
    }
};

// Render tree: statics interleaved with dynamics
struct Rendered {
    Statics statics;
    std::vector<Dynamic> dynamics;
    uint64_t fingerprint = 0;
    bool root = false;
};

// Loop output: every item shares one static skeleton
struct Comprehension {
    Statics statics;
    uint64_t fingerprint = 0;
    std::vector<RenderedPtr> items;
};

// A stateful component mounted at a stable id
struct ComponentNode {
    uint64_t fingerprint = 0;
    int component_id = 0;
    RenderedPtr rendered;
    // Ids mounted while rendering this component, by the slot that rendered them ("" for its own template)
    std::map<std::string, std::vector<int>> children;
    std::string target;
    ValueMap assigns;
};

// Arena of components for one render, indexed by component id
using ComponentTable = std::map<int, ComponentNode>;

struct RenderSnapshot {
    RenderedPtr root;
    ComponentTable components;
};

// Concatenates statics and dynamics; component references are expanded from the table
std::string to_html(const Rendered& tree, const ComponentTable* components = nullptr);
std::string to_html(const RenderSnapshot& snapshot);

// Component ids referenced anywhere inside the dynamic (not descending into other components)
void collect_component_refs(const Dynamic& dynamic, std::vector<int>& out);
void collect_component_refs(const Rendered& tree, std::vector<int>& out);
