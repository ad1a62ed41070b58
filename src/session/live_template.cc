#include "live_template.h"
#include "cli/error.h"

LiveTemplate::LiveTemplate(TemplatePtr tmpl, const ComponentLibrary* library)
    : tmpl(std::move(tmpl)), library(library){
    if(!this->tmpl) ErrorHandler::invariant_violation("live template without a compiled template");
}

Patch LiveTemplate::render(BindingSet& bindings){
    const RenderSnapshot* previous = current();

    // Ids are committed together with the snapshot
    ComponentRegistry ids = components;
    Evaluator evaluator(library, &ids);
    RenderSnapshot next = evaluator.render(*tmpl, bindings, previous);

    DiffEngine engine;
    ChangedSet changed = previous ? bindings.changed() : ChangedSet::everything();
    Patch patch = engine.diff(previous, next, changed);

    // Removed ids are free again: a later mount under the same key is a new component
    for(int cid : DiffEngine::removed_components(previous, next)) ids.release(cid);

    components = std::move(ids);
    snapshot = std::move(next);
    bindings.clear_changed();
    return patch;
}

std::string LiveTemplate::html() const {
    if(!snapshot) return "";
    return to_html(*snapshot);
}
