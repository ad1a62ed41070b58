#include "changed.h"
#include "cli/error.h"
#include <algorithm>

ChangedSet ChangedSet::everything(){
    ChangedSet set;
    set.all_ = true;
    return set;
}

void ChangedSet::mark(const std::string& key){
    entries_[key] = nullptr;
}

void ChangedSet::mark_nested(const std::string& key, ChangedSet sub){
    auto it = entries_.find(key);
    // A fully changed key stays fully changed
    if (it != entries_.end() && it->second == nullptr) return;
    if (sub.all_) {
        entries_[key] = nullptr;
        return;
    }
    if (sub.empty()) return;
    if (it != entries_.end()) {
        ChangedSet merged = *it->second;
        merged.merge(sub);
        it->second = std::make_shared<const ChangedSet>(std::move(merged));
        return;
    }
    entries_[key] = std::make_shared<const ChangedSet>(std::move(sub));
}

void ChangedSet::merge(const ChangedSet& other){
    if (other.all_) all_ = true;
    for (const auto& [k, sub] : other.entries_) {
        if (sub) {
            mark_nested(k, *sub);
        } else {
            mark(k);
        }
    }
}

void ChangedSet::clear(){
    all_ = false;
    entries_.clear();
}

bool ChangedSet::contains(const std::string& key) const {
    return all_ || entries_.count(key) > 0;
}

const ChangedSet* ChangedSet::nested(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    return it->second.get();
}

std::vector<std::string> ChangedSet::keys() const {
    std::vector<std::string> out;
    for (const auto& [k, _] : entries_) out.push_back(k);
    return out;
}

bool ChangedSet::affects(const AssignDependency& dep) const {
    if (all_) return true;
    const ChangedSet* level = this;
    auto it = level->entries_.find(dep.key);
    if (it == level->entries_.end()) return false;
    for (const auto& field : dep.fields) {
        // Whole key changed
        if (it->second == nullptr) return true;
        level = it->second.get();
        it = level->entries_.find(field);
        if (it == level->entries_.end()) return false;
    }
    return true;
}

bool ChangedSet::affects(const DependencySet& deps) const {
    if (all_ || !deps.locals.empty()) return true;
    for (const auto& dep : deps.assigns) {
        if (affects(dep)) return true;
    }
    return false;
}

ChangedSet ChangedSet::between(const Value& before, const Value& after){
    ChangedSet out;
    if (before == after) return out;
    if (!before.is_map() || !after.is_map()) {
        out.all_ = true;
        return out;
    }
    const auto& old_map = before.as_map();
    const auto& new_map = after.as_map();
    for (const auto& [k, v] : new_map) {
        auto it = old_map.find(k);
        if (it == old_map.end()) {
            out.mark(k);
        } else if (it->second != v) {
            out.mark_nested(k, between(it->second, v));
        }
    }
    for (const auto& [k, _] : old_map) {
        if (!new_map.count(k)) out.mark(k);
    }
    return out;
}

std::string ChangedSet::to_string() const {
    if (all_) return "*";
    std::string out = "{";
    bool first = true;
    for (const auto& [k, sub] : entries_) {
        if (!first) out += ", ";
        out += k;
        if (sub) out += ": " + sub->to_string();
        first = false;
    }
    return out + "}";
}

BindingSet::BindingSet(ValueMap initial) : values_(std::move(initial)) {
    for (const auto& [k, _] : values_) changed_.mark(k);
}

void BindingSet::assign(const std::string& key, Value value){
    auto it = values_.find(key);
    if (it == values_.end()) {
        changed_.mark(key);
        values_.emplace(key, std::move(value));
        return;
    }
    if (it->second == value) return;
    changed_.mark_nested(key, ChangedSet::between(it->second, value));
    it->second = std::move(value);
}

void BindingSet::force(const std::string& key, Value value){
    values_[key] = std::move(value);
    changed_.mark(key);
}

void BindingSet::remove(const std::string& key){
    if (values_.erase(key)) changed_.mark(key);
}

void BindingSet::assign_new(const std::string& key, const std::function<Value(const ValueMap&)>& compute){
    if (values_.count(key)) return;
    Value value = compute(values_);
    changed_.mark(key);
    values_.emplace(key, std::move(value));
}

void BindingSet::update(const std::string& key, const std::function<Value(const Value&)>& fn){
    auto it = values_.find(key);
    if (it == values_.end()) ErrorHandler::render_error("key :" + key + " not found in assigns");
    assign(key, fn(it->second));
}

const Value* BindingSet::get(const std::string& key) const {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
}

BindingSet BindingSet::from_json(const nlohmann::json& j){
    if (!j.is_object()) ErrorHandler::render_error("assigns must be a JSON object, got: " + j.dump());
    ValueMap values;
    for (auto it = j.begin(); it != j.end(); ++it) values[it.key()] = Value::from_json(it.value());
    return BindingSet(std::move(values));
}

const std::vector<std::string> reserved_assigns = {"__changed__", "__slot__", "inner_block", "myself", "flash", "socket"};

ValueMap assigns_to_attributes(const ValueMap& assigns, const std::vector<std::string>& exclude){
    ValueMap out;
    for (const auto& [key, value] : assigns) {
        if (std::find(reserved_assigns.begin(), reserved_assigns.end(), key) != reserved_assigns.end()) continue;
        if (std::find(exclude.begin(), exclude.end(), key) != exclude.end()) continue;
        out.emplace(key, value);
    }
    return out;
}
