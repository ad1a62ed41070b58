#pragma once

#include "codegen/template.h"
#include "diff/diff.h"
#include "runtime/evaluator.h"
#include <memory>
#include <optional>

class ComponentLibrary;

// One instantiation of a compiled template: the last snapshot the client holds and
// the ids of the components mounted in it
class LiveTemplate {
public:
    LiveTemplate(TemplatePtr tmpl, const ComponentLibrary* library = nullptr);

    // Evaluates against the bindings and returns what the client needs to catch up.
    // The snapshot is replaced only when both evaluation and diff succeed; the
    // bindings' changed set is cleared afterwards.
    Patch render(BindingSet& bindings);

    // Current HTML as the client would materialize it
    std::string html() const;

    bool mounted() const { return snapshot.has_value(); }
    const RenderSnapshot* current() const { return snapshot ? &*snapshot : nullptr; }
    const ComponentRegistry& registry() const { return components; }

private:
    TemplatePtr tmpl;
    const ComponentLibrary* library;
    ComponentRegistry components;
    std::optional<RenderSnapshot> snapshot;
};
