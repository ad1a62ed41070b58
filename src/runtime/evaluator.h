#pragma once

#include "codegen/template.h"
#include "changed.h"
#include "rendered.h"
#include "value.h"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

class ComponentLibrary;
class Frame;

using LocalMap = std::map<std::string, Value>;

// Slot content captured at the call site, rendered later by the callee through render_slot
struct SlotBlock {
    std::string slot_name;
    TemplatePtr body;
    std::optional<Pattern> let;
    std::shared_ptr<const ValueMap> assigns;
    std::shared_ptr<const LocalMap> locals;
    std::shared_ptr<const ChangedSet> changed;  // Caller-side changed set
};

// Stable component ids for one template instantiation, keyed by target and id attribute
class ComponentRegistry {
public:
    int acquire(const std::string& key);
    std::optional<int> find(const std::string& key) const;
    void release(int cid);
    size_t size() const { return ids.size(); }

private:
    std::map<std::string, int> ids;
    std::map<int, std::string> keys;
    int next_cid = 1;
};

// Evaluates compiled templates into render trees, skipping every part whose
// dependencies are not in the changed set and carrying its previous output over
class Evaluator {
public:
    explicit Evaluator(const ComponentLibrary* library = nullptr, ComponentRegistry* registry = nullptr);

    RenderSnapshot render(const Template& tmpl, const ValueMap& assigns, const ChangedSet& changed,
                          const RenderSnapshot* previous = nullptr);
    RenderSnapshot render(const Template& tmpl, const BindingSet& bindings, const RenderSnapshot* previous = nullptr);

private:
    friend class Frame;

    struct MountContext {
        std::map<std::string, std::vector<int>>* children;
        std::string slot;
    };

    const ComponentLibrary* library;
    ComponentRegistry own_registry;
    ComponentRegistry* registry;

    // Per render
    const RenderSnapshot* previous = nullptr;
    ComponentTable table;
    std::set<std::string> mounted_keys;
    std::vector<MountContext> mounts;
    const Dynamic* slot_hint = nullptr;

    RenderedPtr render_template(const Template& tmpl, Frame& frame, const Rendered* prev);
    Dynamic render_part(const DynamicPart& part, Frame& frame, const Dynamic* prev);
    Dynamic render_expression(const DynamicPart& part, Frame& frame, const Dynamic* prev);
    Dynamic render_if(const DynamicPart& part, Frame& frame, const Dynamic* prev);
    Dynamic render_for(const DynamicPart& part, Frame& frame, const Dynamic* prev);
    Dynamic render_component(const DynamicPart& part, Frame& frame, const Dynamic* prev);

    Value call(const std::string& function, std::vector<Value>& args, const Span& span, Frame& frame);
    Value render_slot(std::vector<Value>& args, const Span& span, Frame& frame);

    void carry(const Dynamic& dynamic);
    void carry_component(int cid);
    void record_mount(int cid);
};
