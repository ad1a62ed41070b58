#pragma once

#include "frontend/span.h"
#include <string>
#include <vector>
#include <memory>
#include <set>

class Value;

// A read of one assign, narrowed to a chain of map fields when statically known (e.g. @user.address.city)
struct AssignDependency {
    std::string key;
    std::vector<std::string> fields;

    bool operator<(const AssignDependency& other) const {
        if (key != other.key) return key < other.key;
        return fields < other.fields;
    }
    bool operator==(const AssignDependency& other) const {
        return key == other.key && fields == other.fields;
    }
};

// Everything one dynamic region reads
struct DependencySet {
    std::set<AssignDependency> assigns;
    std::set<std::string> locals;  // Block-scoped bindings: loop variables, :let patterns

    void add_assign(const std::string& key, const std::vector<std::string>& fields = {}){
        assigns.insert(AssignDependency{key, fields});
    }
    void merge(const DependencySet& other){
        assigns.insert(other.assigns.begin(), other.assigns.end());
        locals.insert(other.locals.begin(), other.locals.end());
    }
    void drop_locals(const std::set<std::string>& names){
        for (const auto& n : names) locals.erase(n);
    }
    bool empty() const { return assigns.empty() && locals.empty(); }
};

// Names bound by enclosing blocks while dependencies are collected
using LocalNames = std::set<std::string>;

// What an expression sees while it is evaluated
class EvalScope {
public:
    virtual ~EvalScope() = default;
    virtual const Value* local(const std::string& name) const = 0;
    virtual const Value* assign(const std::string& key) const = 0;
    virtual Value call(const std::string& function, std::vector<Value>& args, const Span& span) = 0;
};

// Base AST node
struct ASTNode {
    virtual ~ASTNode() = default;
    Span span;
};

// Base for expressions (things that return values)
struct Expression : ASTNode {
    virtual Value evaluate(EvalScope& scope) const = 0;
    virtual void collect_dependencies(DependencySet& deps, const LocalNames& locals) const = 0;
    virtual std::string to_source() const = 0;
    virtual bool is_static() const { return false; }

    // Resolves @a.b.c style chains to an assign path; false for anything else
    virtual bool dependency_path(AssignDependency& out, const LocalNames& locals) const { return false; }
};
