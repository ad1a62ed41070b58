#include "evaluator.h"
#include "compiler/template_compiler.h"
#include "cli/error.h"
#include <cctype>

// Scope of one template evaluation: assigns, locals and what changed since the last render
class Frame : public EvalScope {
public:
    Frame(Evaluator& evaluator, std::shared_ptr<const ValueMap> assigns, std::shared_ptr<const ChangedSet> changed,
          std::shared_ptr<const LocalMap> locals)
        : evaluator(evaluator), assigns(std::move(assigns)), changed(std::move(changed)), locals(std::move(locals)){}

    const Value* local(const std::string& name) const override {
        auto it = locals->find(name);
        return it == locals->end() ? nullptr : &it->second;
    }

    const Value* assign(const std::string& key) const override {
        auto it = assigns->find(key);
        return it == assigns->end() ? nullptr : &it->second;
    }

    Value call(const std::string& function, std::vector<Value>& args, const Span& span) override {
        return evaluator.call(function, args, span, *this);
    }

    Frame with_locals(std::shared_ptr<const LocalMap> inner) const {
        return Frame(evaluator, assigns, changed, std::move(inner));
    }

    Evaluator& evaluator;
    std::shared_ptr<const ValueMap> assigns;
    std::shared_ptr<const ChangedSet> changed;
    std::shared_ptr<const LocalMap> locals;
};

int ComponentRegistry::acquire(const std::string& key){
    auto it = ids.find(key);
    if(it != ids.end()) return it->second;
    int cid = next_cid++;
    ids[key] = cid;
    keys[cid] = key;
    return cid;
}

std::optional<int> ComponentRegistry::find(const std::string& key) const {
    auto it = ids.find(key);
    if(it == ids.end()) return std::nullopt;
    return it->second;
}

void ComponentRegistry::release(int cid){
    auto it = keys.find(cid);
    if(it == keys.end()) return;
    ids.erase(it->second);
    keys.erase(it);
}

static std::string component_key(const std::string& target, const Value& id){
    return target + "#" + id.to_text();
}

static const Value* stateful_id(const ValueMap& assigns){
    auto it = assigns.find("id");
    if(it == assigns.end() || it->second.is_nil()) return nullptr;
    return &it->second;
}

Evaluator::Evaluator(const ComponentLibrary* library, ComponentRegistry* registry)
    : library(library), registry(registry ? registry : &own_registry){}

RenderSnapshot Evaluator::render(const Template& tmpl, const BindingSet& bindings, const RenderSnapshot* prev){
    return render(tmpl, bindings.values(), bindings.changed(), prev);
}

RenderSnapshot Evaluator::render(const Template& tmpl, const ValueMap& assigns, const ChangedSet& changed,
                                 const RenderSnapshot* prev){
    previous = prev;
    table.clear();
    mounted_keys.clear();
    mounts.clear();
    slot_hint = nullptr;

    std::map<std::string, std::vector<int>> top_level;
    mounts.push_back(MountContext{&top_level, ""});

    auto changed_ptr = std::make_shared<const ChangedSet>(prev ? changed : ChangedSet::everything());
    Frame frame(*this, std::make_shared<const ValueMap>(assigns), changed_ptr, std::make_shared<const LocalMap>());

    RenderSnapshot snapshot;
    snapshot.root = render_template(tmpl, frame, prev ? prev->root.get() : nullptr);
    snapshot.components = std::move(table);

    table = ComponentTable{};
    mounts.clear();
    previous = nullptr;
    return snapshot;
}

RenderedPtr Evaluator::render_template(const Template& tmpl, Frame& frame, const Rendered* prev){
    auto out = std::make_shared<Rendered>();
    out->statics = tmpl.statics;
    out->fingerprint = tmpl.fingerprint;
    out->root = tmpl.root;

    bool reusable = prev && prev->fingerprint == tmpl.fingerprint && !frame.changed->all();
    if(reusable && prev->dynamics.size() != tmpl.parts.size()){
        ErrorHandler::invariant_violation("previous render of template with fingerprint " +
                                          std::to_string(tmpl.fingerprint) + " has " +
                                          std::to_string(prev->dynamics.size()) + " dynamics, expected " +
                                          std::to_string(tmpl.parts.size()));
    }

    out->dynamics.reserve(tmpl.parts.size());
    for(size_t i = 0; i < tmpl.parts.size(); i++){
        const DynamicPart& part = tmpl.parts[i];
        const Dynamic* prev_dynamic = reusable ? &prev->dynamics[i] : nullptr;

        // Nothing this part reads changed: keep the previous output untouched
        if(prev_dynamic && !frame.changed->affects(part.deps)){
            carry(*prev_dynamic);
            out->dynamics.push_back(prev_dynamic->carried());
            continue;
        }
        out->dynamics.push_back(render_part(part, frame, prev_dynamic));
    }
    return out;
}

Dynamic Evaluator::render_part(const DynamicPart& part, Frame& frame, const Dynamic* prev){
    // Only a text part's own render_slot call may reuse its previous output
    slot_hint = nullptr;
    switch(part.kind){
        case PartKind::Expr:
        case PartKind::Attr: return render_expression(part, frame, prev);
        case PartKind::If: return render_if(part, frame, prev);
        case PartKind::For: return render_for(part, frame, prev);
        case PartKind::Component: return render_component(part, frame, prev);
    }
    ErrorHandler::invariant_violation("unknown part kind");
}

static std::string attr_pair(const std::string& name, const Value& value){
    if(value.is_nil() || (value.is_bool() && !value.as_bool())) return "";
    if(value.is_bool()) return " " + name;
    return " " + name + "=\"" + html_escape(value.to_text()) + "\"";
}

static std::string class_value(const Value& value){
    if(value.is_nil() || (value.is_bool() && !value.as_bool())) return "";
    if(!value.is_list()) return html_escape(value.to_text());
    std::string out;
    for(const auto& item : value.as_list()){
        if(!item.truthy()) continue;
        std::string text = item.to_text();
        if(text.empty()) continue;
        if(!out.empty()) out += " ";
        out += text;
    }
    return html_escape(out);
}

Dynamic Evaluator::render_expression(const DynamicPart& part, Frame& frame, const Dynamic* prev){
    slot_hint = prev;
    Value value = part.expr->evaluate(frame);
    slot_hint = nullptr;

    switch(part.encoding){
        case Encoding::Text:
            if(value.kind() == Value::Kind::Rendered) return Dynamic::of_nested(value.as_rendered());
            if(value.is_list() && !value.as_list().empty()){
                bool all_rendered = true;
                for(const auto& item : value.as_list()){
                    if(item.kind() != Value::Kind::Rendered) all_rendered = false;
                }
                if(all_rendered){
                    std::vector<RenderedPtr> items;
                    for(const auto& item : value.as_list()) items.push_back(item.as_rendered());
                    return Dynamic::of_list(std::move(items));
                }
            }
            if(value.kind() == Value::Kind::Block){
                ErrorHandler::render_error("slot content must be rendered with render_slot/2, at line " +
                                           std::to_string(part.span.line));
            }
            return Dynamic::text(html_escape(value.to_text()));
        case Encoding::AttrPair:
            return Dynamic::text(attr_pair(part.attr_name, value));
        case Encoding::ClassAttr:
            return Dynamic::text(class_value(value));
        case Encoding::AttrValue:
            if(value.is_nil() || (value.is_bool() && !value.as_bool())) return Dynamic::text("");
            return Dynamic::text(html_escape(value.to_text()));
        case Encoding::Spread: {
            if(value.is_nil()) return Dynamic::text("");
            if(!value.is_map()){
                ErrorHandler::render_error("expected a map of attributes in spread at line " +
                                           std::to_string(part.span.line) + ", got: " + value.inspect());
            }
            std::string out;
            for(const auto& [name, v] : value.as_map()) out += attr_pair(name, v);
            return Dynamic::text(out);
        }
    }
    return Dynamic::text("");
}

Dynamic Evaluator::render_if(const DynamicPart& part, Frame& frame, const Dynamic* prev){
    bool taken = part.expr->evaluate(frame).truthy() != part.negate;
    const Template& branch = taken ? *part.then_branch : *part.else_branch;

    const Rendered* hint = nullptr;
    if(prev && prev->kind == Dynamic::Kind::Nested && prev->nested->fingerprint == branch.fingerprint){
        hint = prev->nested.get();
    }
    return Dynamic::of_nested(render_template(branch, frame, hint));
}

Dynamic Evaluator::render_for(const DynamicPart& part, Frame& frame, const Dynamic* prev){
    Value source = part.generator.source->evaluate(frame);
    if(!source.is_nil() && !source.is_list()){
        ErrorHandler::render_error("for loop at line " + std::to_string(part.span.line) +
                                   " expects a list, got: " + source.inspect());
    }

    const Comprehension* prev_comp = nullptr;
    if(prev && prev->kind == Dynamic::Kind::Comprehension && prev->comprehension->fingerprint == part.body->fingerprint){
        prev_comp = prev->comprehension.get();
    }

    auto comp = std::make_shared<Comprehension>();
    comp->statics = part.body->statics;
    comp->fingerprint = part.body->fingerprint;

    if(source.is_list()){
        for(const auto& item : source.as_list()){
            LocalMap bound = *frame.locals;
            // Items that do not match the pattern are skipped
            if(!part.generator.pattern.bind(item, bound)) continue;
            Frame item_frame = frame.with_locals(std::make_shared<const LocalMap>(std::move(bound)));
            if(part.generator.filter && !part.generator.filter->evaluate(item_frame).truthy()) continue;

            size_t index = comp->items.size();
            const Rendered* hint = prev_comp && index < prev_comp->items.size() ? prev_comp->items[index].get() : nullptr;
            comp->items.push_back(render_template(*part.body, item_frame, hint));
        }
    }
    return Dynamic::of_comprehension(std::move(comp));
}

// Changed set the callee sees for one attribute, narrowed to sub-fields for plain @a.b reads
static void derive_attr(const AttrBinding& binding, const ChangedSet& caller, ChangedSet& callee, const std::string& key){
    if(!binding.expr) return;
    if(caller.all()){
        callee.mark(key);
        return;
    }
    if(!caller.affects(binding.deps)) return;

    AssignDependency path;
    if(binding.deps.locals.empty() && binding.expr->dependency_path(path, LocalNames{})){
        const ChangedSet* level = caller.nested(path.key);
        for(const auto& field : path.fields){
            if(!level) break;
            level = level->nested(field);
        }
        if(level){
            callee.mark_nested(key, *level);
            return;
        }
    }
    callee.mark(key);
}

static Value evaluate_binding(const AttrBinding& binding, Frame& frame){
    return binding.expr ? binding.expr->evaluate(frame) : binding.literal;
}

static void spread_into(const AttrBinding& root, Frame& frame, ValueMap& assigns, ChangedSet& derived, bool changed){
    Value value = evaluate_binding(root, frame);
    if(value.is_nil()) return;
    if(!value.is_map()){
        ErrorHandler::render_error("expected a map in spread attribute at line " + std::to_string(root.span.line) +
                                   ", got: " + value.inspect());
    }
    for(const auto& [k, v] : value.as_map()){
        assigns[k] = v;
        if(changed) derived.mark(k);
    }
}

Dynamic Evaluator::render_component(const DynamicPart& part, Frame& frame, const Dynamic* prev){
    const ComponentInvocation& call = *part.call;
    const ComponentDef* def = library ? library->find(call.module, call.function) : nullptr;
    if(!def) ErrorHandler::render_error("undefined function component " + call.target() + "/1");

    const ChangedSet& caller = *frame.changed;
    ValueMap assigns;
    ChangedSet derived;
    std::set<std::string> slot_keys;

    for(const auto& root : call.roots){
        spread_into(root, frame, assigns, derived, caller.affects(root.deps));
    }
    for(const auto& attr : call.attrs){
        assigns[attr.name] = evaluate_binding(attr, frame);
        derive_attr(attr, caller, derived, attr.name);
    }

    for(const auto& [name, entries] : call.slots){
        ValueList values;
        bool changed = false;
        for(const auto& entry : entries){
            ValueMap slot;
            ChangedSet ignored;
            for(const auto& root : entry.roots) spread_into(root, frame, slot, ignored, false);
            for(const auto& attr : entry.attrs) slot[attr.name] = evaluate_binding(attr, frame);
            slot["__slot__"] = Value::atom(name);
            if(entry.body){
                auto block = std::make_shared<SlotBlock>();
                block->slot_name = name;
                block->body = entry.body;
                block->let = entry.let;
                block->assigns = frame.assigns;
                block->locals = frame.locals;
                block->changed = frame.changed;
                slot["inner_block"] = Value::block(std::move(block));
            }
            if(caller.affects(entry.deps)) changed = true;
            values.push_back(Value::map(std::move(slot)));
        }
        assigns[name] = Value::list(std::move(values));
        slot_keys.insert(name);
        if(changed) derived.mark(name);
    }

    // Declared defaults, empty declared slots, and the global attribute
    const ComponentSpec& spec = def->spec;
    const AttrSpec* global = spec.global_attr();
    for(const auto& decl : spec.attrs){
        if(decl.type == AttrType::Global || assigns.count(decl.name)) continue;
        assigns[decl.name] = decl.default_value.value_or(Value());
    }
    for(const auto& slot : spec.slots){
        if(!assigns.count(slot.name)) assigns[slot.name] = Value::list({});
    }
    if(global){
        ValueMap globals;
        if(global->default_value && global->default_value->is_map()) globals = global->default_value->as_map();
        bool globals_changed = caller.all();
        for(const auto& [k, v] : assigns){
            if(spec.find_attr(k) || slot_keys.count(k) || !is_global_attribute(k)) continue;
            globals[k] = v;
            if(derived.contains(k)) globals_changed = true;
        }
        assigns[global->name] = Value::map(std::move(globals));
        if(globals_changed) derived.mark(global->name);
    }

    const Value* id = stateful_id(assigns);
    if(!id){
        const Rendered* hint = nullptr;
        if(prev && prev->kind == Dynamic::Kind::Nested && prev->nested->fingerprint == def->tmpl->fingerprint){
            hint = prev->nested.get();
        }
        Frame callee(*this, std::make_shared<const ValueMap>(std::move(assigns)),
                     std::make_shared<const ChangedSet>(hint ? derived : ChangedSet::everything()),
                     std::make_shared<const LocalMap>());
        return Dynamic::of_nested(render_template(*def->tmpl, callee, hint));
    }

    const std::string key = component_key(call.target(), *id);
    if(!mounted_keys.insert(key).second){
        ErrorHandler::render_error("found duplicate ID \"" + id->to_text() + "\" for component " + call.target() +
                                   " when rendering template");
    }
    int cid = registry->acquire(key);
    record_mount(cid);

    const ComponentNode* prev_node = nullptr;
    if(previous){
        auto it = previous->components.find(cid);
        if(it != previous->components.end()) prev_node = &it->second;
    }

    ComponentNode node;
    node.component_id = cid;
    node.fingerprint = def->tmpl->fingerprint;
    node.target = call.target();

    ChangedSet callee_changed = ChangedSet::everything();
    if(prev_node){
        // Attributes only count as changed when their value differs from the mounted one
        callee_changed = ChangedSet{};
        for(const auto& k : derived.keys()){
            auto now = assigns.find(k);
            if(slot_keys.count(k)){
                callee_changed.mark(k);
                continue;
            }
            auto before = prev_node->assigns.find(k);
            if(before == prev_node->assigns.end() || now == assigns.end()){
                callee_changed.mark(k);
            }else if(before->second != now->second){
                callee_changed.mark_nested(k, ChangedSet::between(before->second, now->second));
            }
        }
        for(const auto& [k, v] : assigns){
            if(!prev_node->assigns.count(k)) callee_changed.mark(k);
        }
    }
    node.assigns = assigns;

    if(prev_node && callee_changed.empty()){
        node.rendered = prev_node->rendered;
        node.children = prev_node->children;
        for(const auto& [slot, ids] : node.children){
            for(int child : ids) carry_component(child);
        }
    }else{
        const Rendered* hint = prev_node && prev_node->fingerprint == node.fingerprint ? prev_node->rendered.get() : nullptr;
        Frame callee(*this, std::make_shared<const ValueMap>(std::move(assigns)),
                     std::make_shared<const ChangedSet>(std::move(callee_changed)), std::make_shared<const LocalMap>());
        mounts.push_back(MountContext{&node.children, ""});
        node.rendered = render_template(*def->tmpl, callee, hint);
        mounts.pop_back();
    }

    table[cid] = std::move(node);
    return Dynamic::of_component(cid);
}

void Evaluator::record_mount(int cid){
    if(mounts.empty()) return;
    MountContext& ctx = mounts.back();
    (*ctx.children)[ctx.slot].push_back(cid);
}

void Evaluator::carry(const Dynamic& dynamic){
    std::vector<int> refs;
    collect_component_refs(dynamic, refs);
    for(int cid : refs){
        record_mount(cid);
        carry_component(cid);
    }
}

void Evaluator::carry_component(int cid){
    if(table.count(cid)) return;
    if(!previous){
        ErrorHandler::invariant_violation("component " + std::to_string(cid) + " carried without a previous render");
    }
    auto it = previous->components.find(cid);
    if(it == previous->components.end()){
        ErrorHandler::invariant_violation("carried output references unknown component id " + std::to_string(cid));
    }
    const ComponentNode& node = it->second;
    auto id = node.assigns.find("id");
    if(id != node.assigns.end()){
        std::string key = component_key(node.target, id->second);
        if(!mounted_keys.insert(key).second){
            ErrorHandler::render_error("found duplicate ID \"" + id->second.to_text() + "\" for component " +
                                       node.target + " when rendering template");
        }
    }
    table[cid] = node;
    for(const auto& [slot, ids] : node.children){
        for(int child : ids) carry_component(child);
    }
}

Value Evaluator::render_slot(std::vector<Value>& args, const Span& span, Frame& frame){
    if(args.empty() || args.size() > 2){
        ErrorHandler::render_error("render_slot/" + std::to_string(args.size()) + " is undefined, at line " +
                                   std::to_string(span.line));
    }
    const Value& slot = args[0];
    Value argument = args.size() > 1 ? args[1] : Value();

    std::vector<const Value*> entries;
    if(slot.is_nil()) return Value("");
    if(slot.is_list()){
        for(const auto& entry : slot.as_list()) entries.push_back(&entry);
    }else if(slot.is_map()){
        entries.push_back(&slot);
    }else{
        ErrorHandler::render_error("render_slot expects a slot, got: " + slot.inspect());
    }

    // Previous output of this part, when it still has the same shape
    const Dynamic* hint = slot_hint;
    std::vector<const Rendered*> hints(entries.size(), nullptr);
    if(hint && hint->kind == Dynamic::Kind::Nested && entries.size() == 1){
        hints[0] = hint->nested.get();
    }else if(hint && hint->kind == Dynamic::Kind::List && hint->list.size() == entries.size()){
        for(size_t i = 0; i < entries.size(); i++) hints[i] = hint->list[i].get();
    }

    ValueList rendered;
    for(size_t i = 0; i < entries.size(); i++){
        const Value* block_value = entries[i]->get("inner_block");
        if(!block_value || block_value->is_nil()) continue;
        const SlotBlock& block = *block_value->as_block();

        LocalMap locals = *block.locals;
        if(block.let && !block.let->bind(argument, locals)){
            ErrorHandler::render_error("cannot match :let pattern " + block.let->to_source() + " against " +
                                       argument.inspect() + " in slot :" + block.slot_name);
        }

        // The caller's changes only reach the block when the callee saw the slot change
        std::shared_ptr<const ChangedSet> changed = block.changed;
        if(!frame.changed->all() && !frame.changed->contains(block.slot_name)){
            changed = std::make_shared<const ChangedSet>();
        }

        const Rendered* prev = hints[i] && hints[i]->fingerprint == block.body->fingerprint ? hints[i] : nullptr;
        Frame block_frame(*this, block.assigns, changed, std::make_shared<const LocalMap>(std::move(locals)));

        if(!mounts.empty()) mounts.push_back(MountContext{mounts.back().children, block.slot_name});
        rendered.push_back(Value::rendered(render_template(*block.body, block_frame, prev)));
        if(!mounts.empty()) mounts.pop_back();
    }

    if(rendered.empty()) return Value("");
    if(rendered.size() == 1) return rendered.front();
    return Value::list(std::move(rendered));
}

static std::string map_case(std::string s, bool upper){
    for(auto& c : s){
        c = upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
                  : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

static void expect_arity(const std::string& function, const std::vector<Value>& args, size_t min, size_t max,
                         const Span& span){
    if(args.size() < min || args.size() > max){
        ErrorHandler::render_error("undefined function " + function + "/" + std::to_string(args.size()) +
                                   " at line " + std::to_string(span.line));
    }
}

Value Evaluator::call(const std::string& function, std::vector<Value>& args, const Span& span, Frame& frame){
    if(function == "render_slot") return render_slot(args, span, frame);

    if(function == "length" || function == "Enum.count"){
        expect_arity(function, args, 1, 1, span);
        const Value& v = args[0];
        if(v.is_list()) return Value(static_cast<int64_t>(v.as_list().size()));
        if(v.is_map()) return Value(static_cast<int64_t>(v.as_map().size()));
        if(v.is_string() && function == "length") return Value(static_cast<int64_t>(v.as_string().size()));
        ErrorHandler::render_error(function + " expects a list, got: " + v.inspect());
    }
    if(function == "upcase" || function == "String.upcase"){
        expect_arity(function, args, 1, 1, span);
        return Value(map_case(args[0].to_text(), true));
    }
    if(function == "downcase" || function == "String.downcase"){
        expect_arity(function, args, 1, 1, span);
        return Value(map_case(args[0].to_text(), false));
    }
    if(function == "to_string"){
        expect_arity(function, args, 1, 1, span);
        return Value(args[0].to_text());
    }
    if(function == "join" || function == "Enum.join"){
        expect_arity(function, args, 1, 2, span);
        std::string sep = args.size() > 1 ? args[1].to_text() : "";
        std::string out;
        const ValueList& items = args[0].as_list();
        for(size_t i = 0; i < items.size(); i++){
            if(i > 0) out += sep;
            out += items[i].to_text();
        }
        return Value(out);
    }
    if(function == "assigns_to_attributes"){
        expect_arity(function, args, 1, 2, span);
        if(!args[0].is_map()) ErrorHandler::render_error("assigns_to_attributes expects a map, got: " + args[0].inspect());
        std::vector<std::string> exclude;
        if(args.size() > 1){
            for(const auto& key : args[1].as_list()) exclude.push_back(key.to_text());
        }
        return Value::map(assigns_to_attributes(args[0].as_map(), exclude));
    }
    if(function == "rem"){
        expect_arity(function, args, 2, 2, span);
        return arithmetic(args[0], args[1], "rem");
    }

    ErrorHandler::render_error("undefined function " + function + "/" + std::to_string(args.size()) +
                               " at line " + std::to_string(span.line));
}
