#include "rendered.h"
#include "cli/error.h"

Dynamic Dynamic::text(std::string html){
    Dynamic d;
    d.kind = Kind::Value;
    d.value = std::move(html);
    return d;
}

Dynamic Dynamic::of_nested(RenderedPtr tree){
    Dynamic d;
    d.kind = Kind::Nested;
    d.nested = std::move(tree);
    return d;
}

Dynamic Dynamic::of_list(std::vector<RenderedPtr> items){
    Dynamic d;
    d.kind = Kind::List;
    d.list = std::move(items);
    return d;
}

Dynamic Dynamic::of_comprehension(std::shared_ptr<const Comprehension> comp){
    Dynamic d;
    d.kind = Kind::Comprehension;
    d.comprehension = std::move(comp);
    return d;
}

Dynamic Dynamic::of_component(int cid){
    Dynamic d;
    d.kind = Kind::Component;
    d.cid = cid;
    return d;
}

static void append_dynamic(std::string& out, const Dynamic& d, const ComponentTable* components);

static void append_tree(std::string& out, const Rendered& tree, const ComponentTable* components){
    const auto& statics = *tree.statics;
    if(statics.size() != tree.dynamics.size() + 1){
        ErrorHandler::invariant_violation("expected " + std::to_string(statics.size() - 1) +
                                          " dynamics, got " + std::to_string(tree.dynamics.size()));
    }
    for(size_t i = 0; i < tree.dynamics.size(); i++){
        out += statics[i];
        append_dynamic(out, tree.dynamics[i], components);
    }
    out += statics.back();
}

static void append_dynamic(std::string& out, const Dynamic& d, const ComponentTable* components){
    switch(d.kind){
        case Dynamic::Kind::Value:
            out += d.value;
            break;
        case Dynamic::Kind::Nested:
            append_tree(out, *d.nested, components);
            break;
        case Dynamic::Kind::List:
            for(const auto& item : d.list) append_tree(out, *item, components);
            break;
        case Dynamic::Kind::Comprehension:
            for(const auto& item : d.comprehension->items) append_tree(out, *item, components);
            break;
        case Dynamic::Kind::Component: {
            if(!components) ErrorHandler::invariant_violation("component reference without a component table");
            auto it = components->find(d.cid);
            if(it == components->end()){
                ErrorHandler::invariant_violation("unknown component id " + std::to_string(d.cid));
            }
            append_tree(out, *it->second.rendered, components);
            break;
        }
    }
}

std::string to_html(const Rendered& tree, const ComponentTable* components){
    std::string out;
    append_tree(out, tree, components);
    return out;
}

std::string to_html(const RenderSnapshot& snapshot){
    return to_html(*snapshot.root, &snapshot.components);
}

void collect_component_refs(const Dynamic& d, std::vector<int>& out){
    switch(d.kind){
        case Dynamic::Kind::Value:
            break;
        case Dynamic::Kind::Nested:
            collect_component_refs(*d.nested, out);
            break;
        case Dynamic::Kind::List:
            for(const auto& item : d.list) collect_component_refs(*item, out);
            break;
        case Dynamic::Kind::Comprehension:
            for(const auto& item : d.comprehension->items) collect_component_refs(*item, out);
            break;
        case Dynamic::Kind::Component:
            out.push_back(d.cid);
            break;
    }
}

void collect_component_refs(const Rendered& tree, std::vector<int>& out){
    for(const auto& d : tree.dynamics) collect_component_refs(d, out);
}
