#include "diff.h"
#include "cli/error.h"
#include <map>
#include <set>

using nlohmann::json;

int item_component(const Rendered& item){
    if(item.dynamics.empty()) return -1;
    const Dynamic& lead = item.dynamics.front();
    return lead.kind == Dynamic::Kind::Component ? lead.cid : -1;
}

std::vector<size_t> longest_increasing_run(const std::vector<int>& sequence){
    // Patience sorting: tails[k] is the index ending the best run of length k + 1
    std::vector<size_t> tails;
    std::vector<long> parent(sequence.size(), -1);
    for(size_t i = 0; i < sequence.size(); i++){
        size_t lo = 0, hi = tails.size();
        while(lo < hi){
            size_t mid = (lo + hi) / 2;
            if(sequence[tails[mid]] < sequence[i]) lo = mid + 1;
            else hi = mid;
        }
        if(lo > 0) parent[i] = static_cast<long>(tails[lo - 1]);
        if(lo == tails.size()) tails.push_back(i);
        else tails[lo] = i;
    }

    std::vector<size_t> run(tails.size());
    long at = tails.empty() ? -1 : static_cast<long>(tails.back());
    for(size_t k = run.size(); k > 0; k--){
        run[k - 1] = static_cast<size_t>(at);
        at = parent[at];
    }
    return run;
}

// Every item leads with a stateful component, ids are unique on both sides, and the id order differs
static bool keyed_order_changed(const std::vector<RenderedPtr>& previous, const std::vector<RenderedPtr>& current){
    std::vector<int> before, after;
    std::set<int> seen_before, seen_after;
    for(const auto& item : previous){
        int cid = item_component(*item);
        if(cid < 0 || !seen_before.insert(cid).second) return false;
        before.push_back(cid);
    }
    for(const auto& item : current){
        int cid = item_component(*item);
        if(cid < 0 || !seen_after.insert(cid).second) return false;
        after.push_back(cid);
    }
    if(before.empty() || after.empty()) return false;
    return before != after;
}

void DiffEngine::check_component(int cid) const {
    if(!components) ErrorHandler::invariant_violation("component " + std::to_string(cid) + " referenced without a component table");
    if(!components->count(cid)) ErrorHandler::invariant_violation("unknown component id " + std::to_string(cid));
}

json DiffEngine::full(const Rendered& tree){
    if(tree.statics->size() != tree.dynamics.size() + 1){
        ErrorHandler::invariant_violation("expected " + std::to_string(tree.statics->size() - 1) + " dynamics, got " +
                                          std::to_string(tree.dynamics.size()));
    }
    json out = json::object();
    out["s"] = *tree.statics;
    for(size_t i = 0; i < tree.dynamics.size(); i++){
        out[std::to_string(i)] = full_dynamic(tree.dynamics[i]);
    }
    if(tree.root) out["r"] = 1;
    return out;
}

json DiffEngine::full_item(const Rendered& item){
    json out = json::array();
    for(const auto& d : item.dynamics) out.push_back(full_dynamic(d));
    return out;
}

json DiffEngine::full_comprehension(const Comprehension& comp){
    json items = json::array();
    for(const auto& item : comp.items){
        if(item->fingerprint != comp.fingerprint){
            ErrorHandler::invariant_violation("comprehension item does not share the comprehension statics");
        }
        items.push_back(full_item(*item));
    }
    return json{{"s", *comp.statics}, {"d", items}};
}

json DiffEngine::full_dynamic(const Dynamic& d){
    switch(d.kind){
        case Dynamic::Kind::Value: return d.value;
        case Dynamic::Kind::Nested: return full(*d.nested);
        case Dynamic::Kind::List: {
            json items = json::array();
            for(const auto& item : d.list) items.push_back(full(*item));
            return items;
        }
        case Dynamic::Kind::Comprehension: return full_comprehension(*d.comprehension);
        case Dynamic::Kind::Component:
            check_component(d.cid);
            return d.cid;
    }
    return nullptr;
}

json DiffEngine::diff_tree(const Rendered& previous, const Rendered& current){
    if(&previous == &current) return json::object();
    if(previous.fingerprint != current.fingerprint) return full(current);
    if(previous.dynamics.size() != current.dynamics.size() || current.statics->size() != current.dynamics.size() + 1){
        ErrorHandler::invariant_violation("trees with fingerprint " + std::to_string(current.fingerprint) +
                                          " have mismatched dynamics");
    }

    json out = json::object();
    for(size_t i = 0; i < current.dynamics.size(); i++){
        json slot = diff_dynamic(previous.dynamics[i], current.dynamics[i]);
        if(!slot.is_null()) out[std::to_string(i)] = std::move(slot);
    }
    return out;
}

json DiffEngine::diff_dynamic(const Dynamic& previous, const Dynamic& current){
    // Carried over from the last render: already on the client
    if(!current.fresh) return nullptr;

    switch(current.kind){
        case Dynamic::Kind::Value:
            if(previous.kind == Dynamic::Kind::Value && previous.value == current.value) return nullptr;
            return current.value;

        case Dynamic::Kind::Nested: {
            if(previous.kind != Dynamic::Kind::Nested || previous.nested->fingerprint != current.nested->fingerprint){
                return full(*current.nested);
            }
            json nested = diff_tree(*previous.nested, *current.nested);
            if(nested.empty()) return nullptr;
            return nested;
        }

        case Dynamic::Kind::Component:
            check_component(current.cid);
            if(previous.kind == Dynamic::Kind::Component && previous.cid == current.cid) return nullptr;
            return current.cid;

        case Dynamic::Kind::List: {
            if(previous.kind != Dynamic::Kind::List) return full_dynamic(current);
            json items = diff_items(previous.list, current.list, false);
            if(items.is_null()) return full_dynamic(current);
            if(items.empty()) return nullptr;
            return items;
        }

        case Dynamic::Kind::Comprehension: {
            if(previous.kind != Dynamic::Kind::Comprehension ||
               previous.comprehension->fingerprint != current.comprehension->fingerprint){
                return full_dynamic(current);
            }
            json items = diff_items(previous.comprehension->items, current.comprehension->items, true);
            if(items.is_null()) return full_dynamic(current);
            if(items.empty()) return nullptr;
            return items;
        }
    }
    return nullptr;
}

// null asks the caller for a full replace of the list
json DiffEngine::diff_items(const std::vector<RenderedPtr>& previous, const std::vector<RenderedPtr>& current,
                            bool shared_statics){
    if(keyed_order_changed(previous, current)) return keyed_items(previous, current, shared_statics);

    if(previous.size() != current.size()) return nullptr;
    for(size_t j = 0; j < current.size(); j++){
        if(previous[j]->fingerprint != current[j]->fingerprint) return nullptr;
    }

    json changed = json::object();
    for(size_t j = 0; j < current.size(); j++){
        json item = diff_tree(*previous[j], *current[j]);
        if(!item.empty()) changed[std::to_string(j)] = std::move(item);
    }
    if(changed.empty()) return json::object();
    return json{{"d", changed}};
}

json DiffEngine::keyed_items(const std::vector<RenderedPtr>& previous, const std::vector<RenderedPtr>& current,
                             bool shared_statics){
    std::map<int, size_t> from_of;
    for(size_t i = 0; i < previous.size(); i++) from_of[item_component(*previous[i])] = i;

    std::vector<int> froms;
    std::vector<size_t> tos;
    std::set<int> kept_ids;
    json inserts = json::object();
    for(size_t to = 0; to < current.size(); to++){
        int cid = item_component(*current[to]);
        auto it = from_of.find(cid);
        if(it == from_of.end()){
            inserts[std::to_string(to)] = shared_statics ? full_item(*current[to]) : full(*current[to]);
            continue;
        }
        froms.push_back(static_cast<int>(it->second));
        tos.push_back(to);
        kept_ids.insert(cid);
    }

    // Items whose previous positions already increase stay where they are
    std::vector<size_t> run = longest_increasing_run(froms);
    std::set<size_t> staying(run.begin(), run.end());

    json moves = json::array();
    json updates = json::object();
    for(size_t k = 0; k < froms.size(); k++){
        if(!staying.count(k)) moves.push_back(json::array({froms[k], tos[k]}));
        json item = diff_tree(*previous[froms[k]], *current[tos[k]]);
        if(!item.empty()) updates[std::to_string(tos[k])] = std::move(item);
    }

    json removals = json::array();
    for(size_t from = 0; from < previous.size(); from++){
        if(!kept_ids.count(item_component(*previous[from]))) removals.push_back(from);
    }

    json keyed = json::object();
    keyed["n"] = current.size();
    if(!moves.empty()) keyed["m"] = std::move(moves);
    if(!removals.empty()) keyed["r"] = std::move(removals);
    if(!inserts.empty()) keyed["i"] = std::move(inserts);

    json out = json::object();
    out["k"] = std::move(keyed);
    if(!updates.empty()) out["d"] = std::move(updates);
    return out;
}

Patch DiffEngine::diff(const RenderSnapshot* previous, const RenderSnapshot& current, const ChangedSet& changed){
    if(!current.root) ErrorHandler::invariant_violation("snapshot without a root tree");
    components = &current.components;

    bool same_shape = previous && previous->root && previous->root->fingerprint == current.root->fingerprint;
    if(same_shape && changed.empty()){
        components = nullptr;
        return Patch();
    }

    json out = same_shape ? diff_tree(*previous->root, *current.root) : full(*current.root);

    json table = json::object();
    for(const auto& [cid, node] : current.components){
        if(!node.rendered) ErrorHandler::invariant_violation("component " + std::to_string(cid) + " has no render");
        const ComponentNode* before = nullptr;
        if(previous){
            auto it = previous->components.find(cid);
            if(it != previous->components.end()) before = &it->second;
        }
        json entry = before && before->fingerprint == node.fingerprint ? diff_tree(*before->rendered, *node.rendered)
                                                                        : full(*node.rendered);
        if(!entry.empty()) table[std::to_string(cid)] = std::move(entry);
    }
    for(int cid : removed_components(previous, current)){
        table[std::to_string(cid)] = nullptr;
    }
    if(!table.empty()) out["c"] = std::move(table);

    components = nullptr;
    return Patch(std::move(out));
}

Patch DiffEngine::diff(const Rendered* previous, const Rendered& current, const ChangedSet& changed){
    components = nullptr;
    if(!previous || previous->fingerprint != current.fingerprint) return Patch(full(current));
    if(changed.empty()) return Patch();
    return Patch(diff_tree(*previous, current));
}

std::vector<int> DiffEngine::removed_components(const RenderSnapshot* previous, const RenderSnapshot& current){
    std::vector<int> removed;
    if(!previous) return removed;
    for(const auto& [cid, node] : previous->components){
        if(!current.components.count(cid)) removed.push_back(cid);
    }
    return removed;
}
