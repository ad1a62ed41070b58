#pragma once

#include "runtime/changed.h"
#include "runtime/rendered.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Wire-level difference between two renders. An empty patch means nothing is sent.
class Patch {
public:
    Patch() : body(nlohmann::json::object()) {}
    explicit Patch(nlohmann::json body) : body(std::move(body)) {}

    bool empty() const { return body.empty(); }
    // True when the root statics are included, i.e. the client replaces everything
    bool is_full() const { return body.contains("s"); }

    const nlohmann::json& json() const { return body; }
    std::string dump(int indent = -1) const { return body.dump(indent); }

private:
    nlohmann::json body;
};

class DiffEngine {
public:
    // Patch from the previous snapshot (or none) to the current one, including the component table
    Patch diff(const RenderSnapshot* previous, const RenderSnapshot& current, const ChangedSet& changed);

    // Patch between two trees that reference no stateful components
    Patch diff(const Rendered* previous, const Rendered& current, const ChangedSet& changed);

    // Wire form of a whole tree: {"s": [...], "0": ..., "r": 1}
    nlohmann::json full(const Rendered& tree);

    // Ids mounted in the previous snapshot and gone from the current one
    static std::vector<int> removed_components(const RenderSnapshot* previous, const RenderSnapshot& current);

private:
    const ComponentTable* components = nullptr;

    nlohmann::json full_dynamic(const Dynamic& dynamic);
    nlohmann::json full_comprehension(const Comprehension& comp);
    nlohmann::json full_item(const Rendered& item);

    // Empty object when the trees render the same
    nlohmann::json diff_tree(const Rendered& previous, const Rendered& current);
    // null when the slot is unchanged
    nlohmann::json diff_dynamic(const Dynamic& previous, const Dynamic& current);
    nlohmann::json diff_items(const std::vector<RenderedPtr>& previous, const std::vector<RenderedPtr>& current,
                              bool shared_statics);
    nlohmann::json keyed_items(const std::vector<RenderedPtr>& previous, const std::vector<RenderedPtr>& current,
                               bool shared_statics);

    void check_component(int cid) const;
};

// Leading component id of a list item, or -1
int item_component(const Rendered& item);

// Positions (indexes into `sequence`) of one longest strictly increasing subsequence
std::vector<size_t> longest_increasing_run(const std::vector<int>& sequence);
