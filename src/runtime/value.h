#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

struct Rendered;
struct SlotBlock;
class Value;

using ValueList = std::vector<Value>;
using ValueMap = std::map<std::string, Value>;

// Runtime value bound to an assign or produced by an expression
class Value {
public:
    enum class Kind { Nil, Bool, Int, Float, String, Atom, List, Map, Rendered, Block };

    Value() = default;
    Value(bool b) : kind_(Kind::Bool), data_(b) {}
    Value(int i) : kind_(Kind::Int), data_(static_cast<int64_t>(i)) {}
    Value(int64_t i) : kind_(Kind::Int), data_(i) {}
    Value(double d) : kind_(Kind::Float), data_(d) {}
    Value(const char* s) : kind_(Kind::String), data_(std::string(s)) {}
    Value(std::string s) : kind_(Kind::String), data_(std::move(s)) {}

    static Value atom(std::string name);
    static Value list(ValueList items);
    static Value map(ValueMap entries);
    static Value rendered(std::shared_ptr<const Rendered> tree);
    static Value block(std::shared_ptr<const SlotBlock> block);

    Kind kind() const { return kind_; }
    bool is_nil() const { return kind_ == Kind::Nil; }
    bool is_bool() const { return kind_ == Kind::Bool; }
    bool is_number() const { return kind_ == Kind::Int || kind_ == Kind::Float; }
    bool is_string() const { return kind_ == Kind::String; }
    bool is_list() const { return kind_ == Kind::List; }
    bool is_map() const { return kind_ == Kind::Map; }

    // nil and false are falsy
    bool truthy() const;

    bool as_bool() const;
    int64_t as_int() const;
    double as_float() const;
    const std::string& as_string() const;  // String and Atom
    const ValueList& as_list() const;
    const ValueMap& as_map() const;
    const std::shared_ptr<const Rendered>& as_rendered() const;
    const std::shared_ptr<const SlotBlock>& as_block() const;

    // Map field lookup; nullptr when absent or not a map
    const Value* get(const std::string& key) const;

    // Unescaped text form used by <%= %> and attribute values
    std::string to_text() const;
    // Debug representation for messages
    std::string inspect() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    static Value from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    static const char* kind_name(Kind kind);

private:
    Kind kind_ = Kind::Nil;
    std::variant<std::monostate, bool, int64_t, double, std::string,
                 std::shared_ptr<const ValueList>, std::shared_ptr<const ValueMap>,
                 std::shared_ptr<const Rendered>, std::shared_ptr<const SlotBlock>> data_;
};

std::string html_escape(const std::string& text);
