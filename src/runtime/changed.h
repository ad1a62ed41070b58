#pragma once

#include "ast/node.h"
#include "value.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Which assigns (and which of their sub-fields) changed since the last evaluation.
// An entry is either fully changed or holds a nested set for map-valued assigns.
class ChangedSet {
public:
    ChangedSet() = default;

    // Marks everything changed (first render)
    static ChangedSet everything();

    bool all() const { return all_; }
    bool empty() const { return !all_ && entries_.empty(); }

    void mark(const std::string& key);
    void mark_nested(const std::string& key, ChangedSet sub);
    void merge(const ChangedSet& other);
    void clear();

    bool contains(const std::string& key) const;
    // Nested set for a key; nullptr when the key is absent or fully changed
    const ChangedSet* nested(const std::string& key) const;
    std::vector<std::string> keys() const;

    bool affects(const AssignDependency& dep) const;
    // Locals are always changed
    bool affects(const DependencySet& deps) const;

    // Changed set between two values of one assign; empty when equal
    static ChangedSet between(const Value& before, const Value& after);

    std::string to_string() const;

private:
    bool all_ = false;
    // nullptr marks the whole key changed
    std::map<std::string, std::shared_ptr<const ChangedSet>> entries_;
};

// Assigns for one evaluation plus the keys that changed since the previous one
class BindingSet {
public:
    BindingSet() = default;
    explicit BindingSet(ValueMap initial);

    // Stores the value; marks the key changed only when the value differs
    void assign(const std::string& key, Value value);
    // Stores the value and marks the key changed unconditionally
    void force(const std::string& key, Value value);
    void remove(const std::string& key);

    // Computes and stores the value only when the key is absent; `compute` sees the current values
    void assign_new(const std::string& key, const std::function<Value(const ValueMap&)>& compute);
    // Replaces an existing key with fn(current) under assign's equality rule; a missing key is a RenderError
    void update(const std::string& key, const std::function<Value(const Value&)>& fn);
    bool changed(const std::string& key) const { return changed_.all() || changed_.contains(key); }

    const Value* get(const std::string& key) const;
    const ValueMap& values() const { return values_; }
    const ChangedSet& changed() const { return changed_; }
    void clear_changed() { changed_.clear(); }

    static BindingSet from_json(const nlohmann::json& j);

private:
    ValueMap values_;
    ChangedSet changed_;
};

// Assigns keys never written out as attributes
extern const std::vector<std::string> reserved_assigns;

// The assigns suitable for a spread, minus the reserved keys and `exclude`
ValueMap assigns_to_attributes(const ValueMap& assigns, const std::vector<std::string>& exclude = {});
