#pragma once

#include "node.h"
#include "runtime/value.h"
#include <map>
#include <cstdint>

struct NilLiteral : Expression {
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override {}
    std::string to_source() const override { return "nil"; }
    bool is_static() const override { return true; }
};

struct IntLiteral : Expression {
    int64_t value;
    IntLiteral(int64_t v) : value(v){}
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override {}
    std::string to_source() const override { return std::to_string(value); }
    bool is_static() const override { return true; }
};

struct FloatLiteral : Expression {
    double value;
    FloatLiteral(double v) : value(v){}
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override {}
    std::string to_source() const override;
    bool is_static() const override { return true; }
};

struct BoolLiteral : Expression {
    bool value;
    BoolLiteral(bool v) : value(v){}
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override {}
    std::string to_source() const override { return value ? "true" : "false"; }
    bool is_static() const override { return true; }
};

struct StringLiteral : Expression {
    std::string value;
    StringLiteral(const std::string& v) : value(v){}
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override {}
    std::string to_source() const override;
    bool is_static() const override { return true; }
};

struct AtomLiteral : Expression {
    std::string name;
    AtomLiteral(const std::string& n) : name(n){}
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override {}
    std::string to_source() const override { return ":" + name; }
    bool is_static() const override { return true; }
};

// Bare name: a local binding when one is in scope, otherwise an assign
struct Identifier : Expression {
    std::string name;
    Identifier(const std::string& n) : name(n) {}
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override;
    std::string to_source() const override { return name; }
    bool dependency_path(AssignDependency& out, const LocalNames& locals) const override;
};

// @name: always an assign
struct AssignRef : Expression {
    std::string name;
    AssignRef(const std::string& n) : name(n) {}
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override;
    std::string to_source() const override { return "@" + name; }
    bool dependency_path(AssignDependency& out, const LocalNames& locals) const override;
};

struct MemberAccess : Expression {
    std::unique_ptr<Expression> object;
    std::string member;

    MemberAccess(std::unique_ptr<Expression> obj, const std::string& mem);
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override;
    std::string to_source() const override { return object->to_source() + "." + member; }
    bool dependency_path(AssignDependency& out, const LocalNames& locals) const override;
};

struct IndexAccess : Expression {
    std::unique_ptr<Expression> object;
    std::unique_ptr<Expression> index;

    IndexAccess(std::unique_ptr<Expression> obj, std::unique_ptr<Expression> idx);
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override;
    std::string to_source() const override { return object->to_source() + "[" + index->to_source() + "]"; }
};

struct UnaryOp : Expression {
    std::string op;
    std::unique_ptr<Expression> operand;

    UnaryOp(const std::string& o, std::unique_ptr<Expression> expr);
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override {
        operand->collect_dependencies(deps, locals);
    }
    std::string to_source() const override;
    bool is_static() const override { return operand->is_static(); }
};

struct BinaryOp : Expression {
    std::unique_ptr<Expression> left;
    std::string op;
    std::unique_ptr<Expression> right;

    BinaryOp(std::unique_ptr<Expression> l, const std::string& o, std::unique_ptr<Expression> r);
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override;
    std::string to_source() const override;
    bool is_static() const override { return left->is_static() && right->is_static(); }
};

// + - * / rem on numbers; integer overflow is a render error
Value arithmetic(const Value& a, const Value& b, const std::string& op);

struct TernaryOp : Expression {
    std::unique_ptr<Expression> condition;
    std::unique_ptr<Expression> true_expr;
    std::unique_ptr<Expression> false_expr;

    TernaryOp(std::unique_ptr<Expression> cond, std::unique_ptr<Expression> t, std::unique_ptr<Expression> f);
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override;
    std::string to_source() const override;
};

// first..last, inclusive
struct RangeExpr : Expression {
    std::unique_ptr<Expression> first;
    std::unique_ptr<Expression> last;

    RangeExpr(std::unique_ptr<Expression> f, std::unique_ptr<Expression> l);
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override;
    std::string to_source() const override { return first->to_source() + ".." + last->to_source(); }
};

struct ListLiteral : Expression {
    std::vector<std::unique_ptr<Expression>> elements;

    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override;
    std::string to_source() const override;
    bool is_static() const override;
};

struct MapLiteral : Expression {
    std::vector<std::pair<std::string, std::unique_ptr<Expression>>> entries;

    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override;
    std::string to_source() const override;
    bool is_static() const override;
};

struct FunctionCall : Expression {
    std::string name;  // Qualified for module calls: String.upcase
    std::vector<std::unique_ptr<Expression>> args;

    FunctionCall(const std::string& n) : name(n){}
    Value evaluate(EvalScope& scope) const override;
    void collect_dependencies(DependencySet& deps, const LocalNames& locals) const override;
    std::string to_source() const override;
};

// Binding pattern of :let and of generators: a name, `_`, or %{key: name, ...}
struct Pattern {
    std::string variable;
    std::vector<std::pair<std::string, std::string>> fields;
    Span span;

    bool is_map() const { return !fields.empty(); }
    std::set<std::string> bound_names() const;
    std::string to_source() const;

    // Adds the bindings to `out`; false when the value does not match
    bool bind(const Value& value, std::map<std::string, Value>& out) const;
};

// pattern <- source[, filter]
struct Generator {
    Pattern pattern;
    std::unique_ptr<Expression> source;
    std::unique_ptr<Expression> filter;
    Span span;
};
