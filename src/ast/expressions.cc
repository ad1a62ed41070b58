#include "expressions.h"
#include "cli/error.h"
#include <cmath>
#include <limits>
#include <sstream>

Value NilLiteral::evaluate(EvalScope& scope) const { return Value(); }
Value IntLiteral::evaluate(EvalScope& scope) const { return Value(value); }
Value FloatLiteral::evaluate(EvalScope& scope) const { return Value(value); }
Value BoolLiteral::evaluate(EvalScope& scope) const { return Value(value); }
Value StringLiteral::evaluate(EvalScope& scope) const { return Value(value); }
Value AtomLiteral::evaluate(EvalScope& scope) const { return Value::atom(name); }

std::string FloatLiteral::to_source() const {
    return Value(value).to_text();
}

std::string StringLiteral::to_source() const {
    return Value(value).inspect();
}

Value Identifier::evaluate(EvalScope& scope) const {
    if (const Value* v = scope.local(name)) return *v;
    if (const Value* v = scope.assign(name)) return *v;
    ErrorHandler::render_error("undefined variable or assign \"" + name + "\" at line " + std::to_string(span.line));
}

void Identifier::collect_dependencies(DependencySet& deps, const LocalNames& locals) const {
    if (locals.count(name)) {
        deps.locals.insert(name);
    } else {
        deps.add_assign(name);
    }
}

bool Identifier::dependency_path(AssignDependency& out, const LocalNames& locals) const {
    if (locals.count(name)) return false;
    out.key = name;
    out.fields.clear();
    return true;
}

Value AssignRef::evaluate(EvalScope& scope) const {
    if (const Value* v = scope.assign(name)) return *v;
    ErrorHandler::render_error("assign @" + name + " not available in template at line " + std::to_string(span.line));
}

void AssignRef::collect_dependencies(DependencySet& deps, const LocalNames& locals) const {
    deps.add_assign(name);
}

bool AssignRef::dependency_path(AssignDependency& out, const LocalNames& locals) const {
    out.key = name;
    out.fields.clear();
    return true;
}

MemberAccess::MemberAccess(std::unique_ptr<Expression> obj, const std::string& mem)
    : object(std::move(obj)), member(mem) {}

Value MemberAccess::evaluate(EvalScope& scope) const {
    Value target = object->evaluate(scope);
    if (target.is_nil()) return Value();
    if (!target.is_map()) {
        ErrorHandler::render_error("cannot access field \"" + member + "\" on " + target.inspect() +
                                   " at line " + std::to_string(span.line));
    }
    const Value* v = target.get(member);
    return v ? *v : Value();
}

void MemberAccess::collect_dependencies(DependencySet& deps, const LocalNames& locals) const {
    AssignDependency path;
    if (dependency_path(path, locals)) {
        deps.assigns.insert(path);
        return;
    }
    object->collect_dependencies(deps, locals);
}

bool MemberAccess::dependency_path(AssignDependency& out, const LocalNames& locals) const {
    if (!object->dependency_path(out, locals)) return false;
    out.fields.push_back(member);
    return true;
}

IndexAccess::IndexAccess(std::unique_ptr<Expression> obj, std::unique_ptr<Expression> idx)
    : object(std::move(obj)), index(std::move(idx)) {}

Value IndexAccess::evaluate(EvalScope& scope) const {
    Value target = object->evaluate(scope);
    Value key = index->evaluate(scope);
    if (target.is_nil()) return Value();
    if (target.is_list()) {
        const auto& items = target.as_list();
        int64_t i = key.as_int();
        if (i < 0) i += static_cast<int64_t>(items.size());
        if (i < 0 || i >= static_cast<int64_t>(items.size())) return Value();
        return items[static_cast<size_t>(i)];
    }
    if (target.is_map()) {
        const Value* v = target.get(key.to_text());
        return v ? *v : Value();
    }
    ErrorHandler::render_error("cannot index into " + target.inspect() + " at line " + std::to_string(span.line));
}

void IndexAccess::collect_dependencies(DependencySet& deps, const LocalNames& locals) const {
    object->collect_dependencies(deps, locals);
    index->collect_dependencies(deps, locals);
}

UnaryOp::UnaryOp(const std::string& o, std::unique_ptr<Expression> expr)
    : op(o), operand(std::move(expr)) {}

Value UnaryOp::evaluate(EvalScope& scope) const {
    Value v = operand->evaluate(scope);
    if (op == "!" || op == "not") return Value(!v.truthy());
    if (op == "-") {
        if (v.kind() == Value::Kind::Int) {
            if (v.as_int() == std::numeric_limits<int64_t>::min()) {
                ErrorHandler::render_error("integer overflow in arithmetic expression: -" + v.inspect());
            }
            return Value(-v.as_int());
        }
        if (v.kind() == Value::Kind::Float) return Value(-v.as_float());
        ErrorHandler::render_error("bad argument in arithmetic expression: -" + v.inspect());
    }
    ErrorHandler::render_error("unknown unary operator " + op);
}

std::string UnaryOp::to_source() const {
    if (op == "not") return "not " + operand->to_source();
    return op + operand->to_source();
}

BinaryOp::BinaryOp(std::unique_ptr<Expression> l, const std::string& o, std::unique_ptr<Expression> r)
    : left(std::move(l)), op(o), right(std::move(r)) {}

static int compare_values(const Value& a, const Value& b, const std::string& op){
    if (a.is_number() && b.is_number()) {
        double x = a.as_float();
        double y = b.as_float();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if ((a.is_string() && b.is_string()) ||
        (a.kind() == Value::Kind::Atom && b.kind() == Value::Kind::Atom)) {
        int c = a.as_string().compare(b.as_string());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    ErrorHandler::render_error("cannot compare " + a.inspect() + " " + op + " " + b.inspect());
}

Value arithmetic(const Value& a, const Value& b, const std::string& op){
    if (!a.is_number() || !b.is_number()) {
        ErrorHandler::render_error("bad argument in arithmetic expression: " + a.inspect() + " " + op + " " + b.inspect());
    }
    bool ints = a.kind() == Value::Kind::Int && b.kind() == Value::Kind::Int;
    if (op == "/") {
        if (b.as_float() == 0.0) ErrorHandler::render_error("bad argument in arithmetic expression: division by zero");
        return Value(a.as_float() / b.as_float());
    }
    if (op == "rem") {
        if (!ints) ErrorHandler::render_error("rem expects integers, got: " + a.inspect() + ", " + b.inspect());
        if (b.as_int() == 0) ErrorHandler::render_error("bad argument in arithmetic expression: division by zero");
        // INT64_MIN % -1 traps; the remainder by -1 is always 0
        if (b.as_int() == -1) return Value(static_cast<int64_t>(0));
        return Value(a.as_int() % b.as_int());
    }
    if (ints) {
        int64_t result = 0;
        bool overflowed = false;
        if (op == "+") overflowed = __builtin_add_overflow(a.as_int(), b.as_int(), &result);
        else if (op == "-") overflowed = __builtin_sub_overflow(a.as_int(), b.as_int(), &result);
        else overflowed = __builtin_mul_overflow(a.as_int(), b.as_int(), &result);
        if (overflowed) {
            ErrorHandler::render_error("integer overflow in arithmetic expression: " + a.inspect() + " " + op + " " + b.inspect());
        }
        return Value(result);
    }
    if (op == "+") return Value(a.as_float() + b.as_float());
    if (op == "-") return Value(a.as_float() - b.as_float());
    return Value(a.as_float() * b.as_float());
}

Value BinaryOp::evaluate(EvalScope& scope) const {
    // Short-circuit forms return the deciding operand
    if (op == "&&" || op == "and") {
        Value l = left->evaluate(scope);
        if (!l.truthy()) return l;
        return right->evaluate(scope);
    }
    if (op == "||" || op == "or") {
        Value l = left->evaluate(scope);
        if (l.truthy()) return l;
        return right->evaluate(scope);
    }

    Value l = left->evaluate(scope);
    Value r = right->evaluate(scope);

    if (op == "==") return Value(l == r);
    if (op == "!=") return Value(l != r);
    if (op == "===") return Value(l.kind() == r.kind() && l == r);
    if (op == "!==") return Value(!(l.kind() == r.kind() && l == r));
    if (op == "<>") return Value(l.to_text() + r.to_text());
    if (op == "<") return Value(compare_values(l, r, op) < 0);
    if (op == ">") return Value(compare_values(l, r, op) > 0);
    if (op == "<=") return Value(compare_values(l, r, op) <= 0);
    if (op == ">=") return Value(compare_values(l, r, op) >= 0);
    if (op == "+" || op == "-" || op == "*" || op == "/" || op == "rem") return arithmetic(l, r, op);
    ErrorHandler::render_error("unknown operator " + op);
}

void BinaryOp::collect_dependencies(DependencySet& deps, const LocalNames& locals) const {
    left->collect_dependencies(deps, locals);
    right->collect_dependencies(deps, locals);
}

std::string BinaryOp::to_source() const {
    return left->to_source() + " " + op + " " + right->to_source();
}

TernaryOp::TernaryOp(std::unique_ptr<Expression> cond, std::unique_ptr<Expression> t, std::unique_ptr<Expression> f)
    : condition(std::move(cond)), true_expr(std::move(t)), false_expr(std::move(f)) {}

Value TernaryOp::evaluate(EvalScope& scope) const {
    return condition->evaluate(scope).truthy() ? true_expr->evaluate(scope) : false_expr->evaluate(scope);
}

void TernaryOp::collect_dependencies(DependencySet& deps, const LocalNames& locals) const {
    condition->collect_dependencies(deps, locals);
    true_expr->collect_dependencies(deps, locals);
    false_expr->collect_dependencies(deps, locals);
}

std::string TernaryOp::to_source() const {
    return condition->to_source() + " ? " + true_expr->to_source() + " : " + false_expr->to_source();
}

RangeExpr::RangeExpr(std::unique_ptr<Expression> f, std::unique_ptr<Expression> l)
    : first(std::move(f)), last(std::move(l)) {}

Value RangeExpr::evaluate(EvalScope& scope) const {
    int64_t from = first->evaluate(scope).as_int();
    int64_t to = last->evaluate(scope).as_int();
    ValueList items;
    int64_t step = from <= to ? 1 : -1;
    for (int64_t i = from;; i += step) {
        items.push_back(Value(i));
        if (i == to) break;
    }
    return Value::list(std::move(items));
}

void RangeExpr::collect_dependencies(DependencySet& deps, const LocalNames& locals) const {
    first->collect_dependencies(deps, locals);
    last->collect_dependencies(deps, locals);
}

Value ListLiteral::evaluate(EvalScope& scope) const {
    ValueList items;
    items.reserve(elements.size());
    for (const auto& e : elements) items.push_back(e->evaluate(scope));
    return Value::list(std::move(items));
}

void ListLiteral::collect_dependencies(DependencySet& deps, const LocalNames& locals) const {
    for (const auto& e : elements) e->collect_dependencies(deps, locals);
}

std::string ListLiteral::to_source() const {
    std::string out = "[";
    for (size_t i = 0; i < elements.size(); i++) {
        if (i > 0) out += ", ";
        out += elements[i]->to_source();
    }
    return out + "]";
}

bool ListLiteral::is_static() const {
    for (const auto& e : elements) if (!e->is_static()) return false;
    return true;
}

Value MapLiteral::evaluate(EvalScope& scope) const {
    ValueMap out;
    for (const auto& [key, expr] : entries) out[key] = expr->evaluate(scope);
    return Value::map(std::move(out));
}

void MapLiteral::collect_dependencies(DependencySet& deps, const LocalNames& locals) const {
    for (const auto& entry : entries) entry.second->collect_dependencies(deps, locals);
}

std::string MapLiteral::to_source() const {
    std::string out = "%{";
    for (size_t i = 0; i < entries.size(); i++) {
        if (i > 0) out += ", ";
        out += entries[i].first + ": " + entries[i].second->to_source();
    }
    return out + "}";
}

bool MapLiteral::is_static() const {
    for (const auto& entry : entries) if (!entry.second->is_static()) return false;
    return true;
}

Value FunctionCall::evaluate(EvalScope& scope) const {
    std::vector<Value> values;
    values.reserve(args.size());
    for (const auto& a : args) values.push_back(a->evaluate(scope));
    return scope.call(name, values, span);
}

void FunctionCall::collect_dependencies(DependencySet& deps, const LocalNames& locals) const {
    for (const auto& a : args) a->collect_dependencies(deps, locals);
}

std::string FunctionCall::to_source() const {
    std::string out = name + "(";
    for (size_t i = 0; i < args.size(); i++) {
        if (i > 0) out += ", ";
        out += args[i]->to_source();
    }
    return out + ")";
}

std::set<std::string> Pattern::bound_names() const {
    std::set<std::string> names;
    if (is_map()) {
        for (const auto& field : fields) {
            if (field.second != "_") names.insert(field.second);
        }
    } else if (!variable.empty() && variable != "_") {
        names.insert(variable);
    }
    return names;
}

std::string Pattern::to_source() const {
    if (!is_map()) return variable;
    std::string out = "%{";
    for (size_t i = 0; i < fields.size(); i++) {
        if (i > 0) out += ", ";
        out += fields[i].first + ": " + fields[i].second;
    }
    return out + "}";
}

bool Pattern::bind(const Value& value, std::map<std::string, Value>& out) const {
    if (!is_map()) {
        if (!variable.empty() && variable != "_") out[variable] = value;
        return true;
    }
    if (!value.is_map()) return false;
    for (const auto& [key, var] : fields) {
        const Value* v = value.get(key);
        if (!v) return false;
        if (var != "_") out[var] = *v;
    }
    return true;
}
