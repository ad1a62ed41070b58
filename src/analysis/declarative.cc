#include "declarative.h"
#include <set>

const char* attr_type_name(AttrType type){
    switch(type){
        case AttrType::Any: return "any";
        case AttrType::String: return "string";
        case AttrType::Atom: return "atom";
        case AttrType::Boolean: return "boolean";
        case AttrType::Integer: return "integer";
        case AttrType::Float: return "float";
        case AttrType::List: return "list";
        case AttrType::Map: return "map";
        case AttrType::Global: return "global";
        case AttrType::Struct: return "struct";
    }
    return "any";
}

std::string AttrSpec::describe_type() const {
    if(type == AttrType::Struct) return "a %" + struct_name + "{}";
    std::string name = attr_type_name(type);
    bool vowel = name[0] == 'a' || name[0] == 'i';
    return std::string(vowel ? "an :" : "a :") + name;
}

const AttrSpec* SlotSpec::find_attr(const std::string& attr_name) const {
    for(const auto& a : attrs){
        if(a.name == attr_name) return &a;
    }
    return nullptr;
}

const AttrSpec* ComponentSpec::find_attr(const std::string& attr_name) const {
    for(const auto& a : attrs){
        if(a.name == attr_name) return &a;
    }
    return nullptr;
}

const SlotSpec* ComponentSpec::find_slot(const std::string& slot_name) const {
    for(const auto& s : slots){
        if(s.name == slot_name) return &s;
    }
    return nullptr;
}

const AttrSpec* ComponentSpec::global_attr() const {
    for(const auto& a : attrs){
        if(a.type == AttrType::Global) return &a;
    }
    return nullptr;
}

bool is_global_attribute(const std::string& name){
    static const std::set<std::string> globals = {
        "xml:lang", "xml:base", "onabort", "onautocomplete", "onautocompleteerror", "onblur", "oncancel",
        "oncanplay", "oncanplaythrough", "onchange", "onclick", "onclose", "oncontextmenu", "oncuechange",
        "ondblclick", "ondrag", "ondragend", "ondragenter", "ondragleave", "ondragover", "ondragstart",
        "ondrop", "ondurationchange", "onemptied", "onended", "onerror", "onfocus", "oninput", "oninvalid",
        "onkeydown", "onkeypress", "onkeyup", "onload", "onloadeddata", "onloadedmetadata", "onloadstart",
        "onmousedown", "onmouseenter", "onmouseleave", "onmousemove", "onmouseout", "onmouseover",
        "onmouseup", "onmousewheel", "onpause", "onplay", "onplaying", "onprogress", "onratechange",
        "onreset", "onresize", "onscroll", "onseeked", "onseeking", "onselect", "onshow", "onsort",
        "onstalled", "onsubmit", "onsuspend", "ontimeupdate", "ontoggle", "onvolumechange", "onwaiting",
        "accesskey", "autocapitalize", "autofocus", "class", "contenteditable", "contextmenu", "dir",
        "draggable", "enterkeyhint", "exportparts", "hidden", "id", "inert", "inputmode", "is", "itemid",
        "itemprop", "itemref", "itemscope", "itemtype", "lang", "nonce", "part", "role", "slot",
        "spellcheck", "style", "tabindex", "title", "translate"
    };
    auto has_prefix = [&](const char* prefix){
        return name.rfind(prefix, 0) == 0;
    };
    return has_prefix("phx-") || has_prefix("aria-") || has_prefix("data-") || globals.count(name) > 0;
}

bool shape_mismatch(const AttrSpec& decl, AttrShape shape){
    if(decl.type == AttrType::Any || shape == AttrShape::Expression) return false;
    switch(decl.type){
        case AttrType::String: return shape != AttrShape::String;
        case AttrType::Atom: return shape != AttrShape::Atom && shape != AttrShape::Boolean;
        case AttrType::Boolean: return shape != AttrShape::Boolean;
        case AttrType::Integer: return shape != AttrShape::Integer;
        case AttrType::Float: return shape != AttrShape::Float;
        case AttrType::List: return shape != AttrShape::List;
        case AttrType::Map: return shape != AttrShape::Map;
        default: return true;
    }
}

bool value_matches_type(const AttrSpec& decl, const Value& value){
    // nil is accepted for every type
    if(value.is_nil()) return true;
    switch(decl.type){
        case AttrType::Any: return true;
        case AttrType::String: return value.is_string();
        case AttrType::Atom: return value.kind() == Value::Kind::Atom || value.is_bool();
        case AttrType::Boolean: return value.is_bool();
        case AttrType::Integer: return value.kind() == Value::Kind::Int;
        case AttrType::Float: return value.kind() == Value::Kind::Float;
        case AttrType::List: return value.is_list();
        case AttrType::Map:
        case AttrType::Global:
        case AttrType::Struct: return value.is_map();
    }
    return false;
}

void verify_component_call(const ComponentCallRecord& call, const ComponentSpec& spec, Diagnostics& diagnostics){
    const std::string component = spec.display_name();
    const AttrSpec* global = spec.global_attr();

    for(const auto& decl : spec.attrs){
        if(decl.required && !call.has_root && !call.attrs.count(decl.name)){
            diagnostics.warn(call.file, call.span,
                             "missing required attribute \"" + decl.name + "\" for component " + component);
        }
    }

    for(const auto& [name, use] : call.attrs){
        const AttrSpec* decl = spec.find_attr(name);
        if(decl && decl->type == AttrType::Global){
            diagnostics.warn(call.file, use.span,
                             "global attribute \"" + name + "\" in component " + component + " may not be provided directly");
        }else if(decl){
            if(shape_mismatch(*decl, use.shape)){
                diagnostics.warn(call.file, use.span,
                                 "attribute \"" + name + "\" in component " + component + " must be " +
                                 decl->describe_type() + ", got: " + use.source);
            }
        }else if(!(global && is_global_attribute(name)) && name != "inner_block"){
            diagnostics.warn(call.file, use.span,
                             "undefined attribute \"" + name + "\" for component " + component);
        }
    }

    for(const auto& slot : spec.slots){
        if(slot.required && !call.slots.count(slot.name)){
            diagnostics.warn(call.file, call.span,
                             "missing required slot \"" + slot.name + "\" for component " + component);
        }
    }

    for(const auto& [slot_name, entries] : call.slots){
        const SlotSpec* slot = spec.find_slot(slot_name);
        if(!slot){
            // Content without declared slots goes to the implicit inner_block
            if(slot_name == "inner_block" && spec.slots.empty()) continue;
            diagnostics.warn(call.file, entries.front().span,
                             "undefined slot \"" + slot_name + "\" for component " + component);
            continue;
        }
        for(const auto& entry : entries){
            for(const auto& decl : slot->attrs){
                if(decl.required && !entry.has_root && !entry.attrs.count(decl.name)){
                    diagnostics.warn(call.file, entry.span,
                                     "missing required attribute \"" + decl.name + "\" in slot \"" + slot_name +
                                     "\" for component " + component);
                }
            }
            // Slots without declared attributes accept anything
            if(slot->attrs.empty()) continue;
            for(const auto& [name, use] : entry.attrs){
                const AttrSpec* decl = slot->find_attr(name);
                if(!decl){
                    diagnostics.warn(call.file, use.span,
                                     "undefined attribute \"" + name + "\" in slot \"" + slot_name +
                                     "\" for component " + component);
                }else if(shape_mismatch(*decl, use.shape)){
                    diagnostics.warn(call.file, use.span,
                                     "attribute \"" + name + "\" in slot \"" + slot_name + "\" for component " +
                                     component + " must be " + decl->describe_type() + ", got: " + use.source);
                }
            }
        }
    }
}
