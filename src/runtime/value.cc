#include "value.h"
#include "cli/error.h"
#include <cmath>
#include <iomanip>
#include <sstream>

Value Value::atom(std::string name){
    Value v;
    v.kind_ = Kind::Atom;
    v.data_ = std::move(name);
    return v;
}

Value Value::list(ValueList items){
    Value v;
    v.kind_ = Kind::List;
    v.data_ = std::make_shared<const ValueList>(std::move(items));
    return v;
}

Value Value::map(ValueMap entries){
    Value v;
    v.kind_ = Kind::Map;
    v.data_ = std::make_shared<const ValueMap>(std::move(entries));
    return v;
}

Value Value::rendered(std::shared_ptr<const Rendered> tree){
    Value v;
    v.kind_ = Kind::Rendered;
    v.data_ = std::move(tree);
    return v;
}

Value Value::block(std::shared_ptr<const SlotBlock> block){
    Value v;
    v.kind_ = Kind::Block;
    v.data_ = std::move(block);
    return v;
}

const char* Value::kind_name(Kind kind){
    switch(kind){
        case Kind::Nil: return "nil";
        case Kind::Bool: return "boolean";
        case Kind::Int: return "integer";
        case Kind::Float: return "float";
        case Kind::String: return "string";
        case Kind::Atom: return "atom";
        case Kind::List: return "list";
        case Kind::Map: return "map";
        case Kind::Rendered: return "rendered";
        case Kind::Block: return "block";
    }
    return "unknown";
}

bool Value::truthy() const {
    if(kind_ == Kind::Nil) return false;
    if(kind_ == Kind::Bool) return std::get<bool>(data_);
    return true;
}

bool Value::as_bool() const {
    if(kind_ != Kind::Bool) ErrorHandler::render_error("expected a boolean, got: " + inspect());
    return std::get<bool>(data_);
}

int64_t Value::as_int() const {
    if(kind_ == Kind::Int) return std::get<int64_t>(data_);
    ErrorHandler::render_error("expected an integer, got: " + inspect());
}

double Value::as_float() const {
    if(kind_ == Kind::Float) return std::get<double>(data_);
    if(kind_ == Kind::Int) return static_cast<double>(std::get<int64_t>(data_));
    ErrorHandler::render_error("expected a number, got: " + inspect());
}

const std::string& Value::as_string() const {
    if(kind_ != Kind::String && kind_ != Kind::Atom){
        ErrorHandler::render_error("expected a string, got: " + inspect());
    }
    return std::get<std::string>(data_);
}

const ValueList& Value::as_list() const {
    if(kind_ != Kind::List) ErrorHandler::render_error("expected a list, got: " + inspect());
    return *std::get<std::shared_ptr<const ValueList>>(data_);
}

const ValueMap& Value::as_map() const {
    if(kind_ != Kind::Map) ErrorHandler::render_error("expected a map, got: " + inspect());
    return *std::get<std::shared_ptr<const ValueMap>>(data_);
}

const std::shared_ptr<const Rendered>& Value::as_rendered() const {
    if(kind_ != Kind::Rendered) ErrorHandler::render_error("expected rendered content, got: " + inspect());
    return std::get<std::shared_ptr<const Rendered>>(data_);
}

const std::shared_ptr<const SlotBlock>& Value::as_block() const {
    if(kind_ != Kind::Block) ErrorHandler::render_error("expected a slot block, got: " + inspect());
    return std::get<std::shared_ptr<const SlotBlock>>(data_);
}

const Value* Value::get(const std::string& key) const {
    if(kind_ != Kind::Map) return nullptr;
    const auto& m = *std::get<std::shared_ptr<const ValueMap>>(data_);
    auto it = m.find(key);
    return it == m.end() ? nullptr : &it->second;
}

static std::string format_float(double d){
    std::ostringstream out;
    out << std::setprecision(15) << d;
    std::string s = out.str();
    if(s.find_first_of(".en") == std::string::npos) s += ".0";
    return s;
}

std::string Value::to_text() const {
    switch(kind_){
        case Kind::Nil: return "";
        case Kind::Bool: return std::get<bool>(data_) ? "true" : "false";
        case Kind::Int: return std::to_string(std::get<int64_t>(data_));
        case Kind::Float: return format_float(std::get<double>(data_));
        case Kind::String:
        case Kind::Atom: return std::get<std::string>(data_);
        case Kind::List: {
            // iodata semantics: elements are concatenated
            std::string out;
            for(const auto& item : as_list()) out += item.to_text();
            return out;
        }
        case Kind::Map: return inspect();
        case Kind::Rendered:
        case Kind::Block: return "";
    }
    return "";
}

std::string Value::inspect() const {
    switch(kind_){
        case Kind::Nil: return "nil";
        case Kind::String: {
            std::string out = "\"";
            for(char c : std::get<std::string>(data_)){
                if(c == '"' || c == '\\') out += '\\';
                out += c;
            }
            return out + "\"";
        }
        case Kind::Atom: return ":" + std::get<std::string>(data_);
        case Kind::List: {
            std::string out = "[";
            bool first = true;
            for(const auto& item : as_list()){
                if(!first) out += ", ";
                out += item.inspect();
                first = false;
            }
            return out + "]";
        }
        case Kind::Map: {
            std::string out = "%{";
            bool first = true;
            for(const auto& [k, v] : as_map()){
                if(!first) out += ", ";
                out += k + ": " + v.inspect();
                first = false;
            }
            return out + "}";
        }
        case Kind::Rendered: return "#Rendered<>";
        case Kind::Block: return "#SlotBlock<>";
        default: return to_text();
    }
}

bool Value::operator==(const Value& other) const {
    if(is_number() && other.is_number()){
        if(kind_ == Kind::Int && other.kind_ == Kind::Int) return as_int() == other.as_int();
        return as_float() == other.as_float();
    }
    if(kind_ != other.kind_) return false;
    switch(kind_){
        case Kind::Nil: return true;
        case Kind::Bool: return std::get<bool>(data_) == std::get<bool>(other.data_);
        case Kind::String:
        case Kind::Atom: return std::get<std::string>(data_) == std::get<std::string>(other.data_);
        case Kind::List: return as_list() == other.as_list();
        case Kind::Map: return as_map() == other.as_map();
        case Kind::Rendered: return as_rendered() == other.as_rendered();
        case Kind::Block: return as_block() == other.as_block();
        default: return false;
    }
}

Value Value::from_json(const nlohmann::json& j){
    switch(j.type()){
        case nlohmann::json::value_t::null: return Value();
        case nlohmann::json::value_t::boolean: return Value(j.get<bool>());
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return Value(j.get<int64_t>());
        case nlohmann::json::value_t::number_float: return Value(j.get<double>());
        case nlohmann::json::value_t::string: return Value(j.get<std::string>());
        case nlohmann::json::value_t::array: {
            ValueList items;
            for(const auto& item : j) items.push_back(from_json(item));
            return Value::list(std::move(items));
        }
        case nlohmann::json::value_t::object: {
            if(j.size() == 1 && j.contains("__atom__") && j["__atom__"].is_string()){
                return Value::atom(j["__atom__"].get<std::string>());
            }
            ValueMap entries;
            for(auto it = j.begin(); it != j.end(); ++it) entries[it.key()] = from_json(it.value());
            return Value::map(std::move(entries));
        }
        default:
            ErrorHandler::render_error("unsupported JSON value: " + j.dump());
    }
}

nlohmann::json Value::to_json() const {
    switch(kind_){
        case Kind::Nil: return nullptr;
        case Kind::Bool: return std::get<bool>(data_);
        case Kind::Int: return std::get<int64_t>(data_);
        case Kind::Float: return std::get<double>(data_);
        case Kind::String: return std::get<std::string>(data_);
        case Kind::Atom: return nlohmann::json{{"__atom__", std::get<std::string>(data_)}};
        case Kind::List: {
            nlohmann::json arr = nlohmann::json::array();
            for(const auto& item : as_list()) arr.push_back(item.to_json());
            return arr;
        }
        case Kind::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for(const auto& [k, v] : as_map()) obj[k] = v.to_json();
            return obj;
        }
        default: return inspect();
    }
}

std::string html_escape(const std::string& text){
    std::string out;
    out.reserve(text.size());
    for(char c : text){
        switch(c){
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}
