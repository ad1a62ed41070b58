#include "template_compiler.h"
#include "codegen/codegen.h"

static std::string attr_label(const std::string& name, const std::optional<SlotSpec>& slot){
    if(slot) return ":" + name + " in slot :" + slot->name;
    return ":" + name;
}

const ComponentDef* CompiledUnit::find(const std::string& function) const {
    auto it = components.find(function);
    return it == components.end() ? nullptr : &it->second;
}

TemplateCompiler::TemplateCompiler(const std::string& module, const std::string& file)
    : module(module), file(file), unit(std::make_shared<CompiledUnit>()){
    unit->module = module;
    unit->file = file;
}

bool TemplateCompiler::validate_attr(const AttrSpec& attr, const std::vector<AttrSpec>& existing, bool in_slot){
    const std::string label = attr_label(attr.name, open_slot);

    if(attr.name == "inner_block"){
        diags.warn(file, attr.span, "cannot define attribute called :inner_block. Maybe you wanted to use a slot instead?");
        return false;
    }
    if(attr.type == AttrType::Global && attr.required){
        diags.warn(file, attr.span, "global attributes do not support the :required option");
        return false;
    }
    if(attr.required && attr.default_value){
        diags.warn(file, attr.span, "only one of :required or :default must be given");
        return false;
    }
    for(const auto& other : existing){
        if(other.name == attr.name){
            diags.warn(file, attr.span, "a duplicate attribute with name " + label + " already exists");
            return false;
        }
        if(attr.type == AttrType::Global && other.type == AttrType::Global){
            diags.warn(file, attr.span, "cannot define :global attribute :" + attr.name + " because one is already defined as " +
                                        attr_label(other.name, open_slot) + ". Only a single :global attribute may be defined");
            return false;
        }
    }
    if(attr.default_value){
        if(in_slot){
            diags.warn(file, attr.span, "invalid option :default for attr " + label +
                                        ". :default is not supported inside slot attributes");
            return false;
        }
        if(!value_matches_type(attr, *attr.default_value)){
            diags.warn(file, attr.span, "expected the default value for attr " + label + " to be " +
                                        attr.describe_type() + ", got: " + attr.default_value->inspect());
            return false;
        }
    }
    return true;
}

void TemplateCompiler::attr(const std::string& name, AttrType type, AttrOptions opts){
    AttrSpec spec;
    spec.name = name;
    spec.type = type;
    spec.struct_name = opts.struct_name;
    spec.required = opts.required;
    spec.default_value = std::move(opts.default_value);
    spec.doc = opts.doc;
    spec.span = opts.span;

    if(open_slot){
        if(!validate_attr(spec, open_slot->attrs, true)) return;
        open_slot->attrs.push_back(std::move(spec));
    }else{
        if(!validate_attr(spec, pending_attrs, false)) return;
        pending_attrs.push_back(std::move(spec));
    }
}

void TemplateCompiler::begin_slot(const std::string& name, SlotOptions opts){
    if(open_slot){
        diags.warn(file, opts.span, "cannot declare slot :" + name + " inside slot :" + open_slot->name);
        end_slot();
    }
    SlotSpec slot;
    slot.name = name;
    slot.required = opts.required;
    slot.doc = opts.doc;
    slot.span = opts.span;
    open_slot = std::move(slot);
}

void TemplateCompiler::end_slot(){
    if(!open_slot) return;
    SlotSpec slot = std::move(*open_slot);
    open_slot.reset();

    for(const auto& other : pending_slots){
        if(other.name == slot.name){
            diags.warn(file, slot.span, "a duplicate slot with name :" + slot.name + " already exists");
            return;
        }
    }
    if(slot.name == "inner_block" && !slot.attrs.empty()){
        diags.warn(file, slot.span, "cannot define attributes in a slot with name :inner_block");
        return;
    }
    pending_slots.push_back(std::move(slot));
}

void TemplateCompiler::drop_pending(const std::string& reason){
    if(open_slot){
        diags.warn(file, open_slot->span, "slot :" + open_slot->name + " was not closed " + reason);
        end_slot();
    }
    if(!pending_attrs.empty()){
        diags.warn(file, pending_attrs.front().span, "cannot define attributes without a related function component");
        pending_attrs.clear();
    }
    if(!pending_slots.empty()){
        diags.warn(file, pending_slots.front().span, "cannot define slots without a related function component");
        pending_slots.clear();
    }
}

void TemplateCompiler::component(const std::string& name, const std::string& source, const std::string& source_file){
    if(!unit) ErrorHandler::invariant_violation("component " + name + " declared after " + module + " was finished");
    if(open_slot){
        diags.warn(file, open_slot->span, "slot :" + open_slot->name + " was not closed before component " + name);
        end_slot();
    }

    ComponentDef def;
    def.spec.module = module;
    def.spec.function = name;
    def.spec.file = source_file.empty() ? file : source_file;
    def.spec.attrs = std::move(pending_attrs);
    def.spec.slots = std::move(pending_slots);
    pending_attrs.clear();
    pending_slots.clear();

    def.tmpl = compile_template(source, module, def.spec.file, &unit->calls);

    if(unit->components.count(name)){
        diags.warn(file, def.spec.span, "component " + def.spec.display_name() + " is already defined");
        return;
    }
    unit->components.emplace(name, std::move(def));
}

TemplatePtr TemplateCompiler::compile(const std::string& source){
    if(!unit) ErrorHandler::invariant_violation("template compiled after " + module + " was finished");
    drop_pending("before a template");
    return compile_template(source, module, file, &unit->calls);
}

CompiledUnitPtr TemplateCompiler::finish(){
    if(!unit) ErrorHandler::invariant_violation(module + " was already finished");
    drop_pending("at the end of " + module);

    for(const auto& call : unit->calls){
        if(call.module != module) continue;
        const ComponentDef* def = unit->find(call.function);
        if(!def){
            diags.warn(call.file, call.span, "undefined function component ." + call.function + " in " + module);
            continue;
        }
        if(!def->spec.declared()) continue;
        verify_component_call(call, def->spec, diags);
    }

    CompiledUnitPtr sealed = std::move(unit);
    unit.reset();
    return sealed;
}

void ComponentLibrary::add(CompiledUnitPtr unit){
    units[unit->module] = std::move(unit);
}

const CompiledUnit* ComponentLibrary::unit(const std::string& module) const {
    auto it = units.find(module);
    return it == units.end() ? nullptr : it->second.get();
}

const ComponentDef* ComponentLibrary::find(const std::string& module, const std::string& function) const {
    const CompiledUnit* u = unit(module);
    return u ? u->find(function) : nullptr;
}

void ComponentLibrary::verify(Diagnostics& diagnostics) const {
    for(const auto& [name, u] : units){
        for(const auto& call : u->calls){
            if(call.module == u->module) continue;
            const ComponentDef* def = find(call.module, call.function);
            if(!def){
                diagnostics.warn(call.file, call.span,
                                 "undefined function component " + call.module + "." + call.function);
                continue;
            }
            if(!def->spec.declared()) continue;
            verify_component_call(call, def->spec, diagnostics);
        }
    }
}
