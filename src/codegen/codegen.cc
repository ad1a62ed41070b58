#include "codegen.h"
#include "fingerprint.h"
#include "frontend/parser.h"
#include "cli/error.h"
#include <cctype>

static bool is_blank(const std::string& s){
    for(char c : s){
        if(!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

static LocalNames with_locals(const LocalNames& locals, const std::set<std::string>& names){
    LocalNames out = locals;
    out.insert(names.begin(), names.end());
    return out;
}

static std::string use_source(const ParsedAttribute& attr){
    switch(attr.attr.kind){
        case AttrValueKind::Literal: return Value(attr.attr.value).inspect();
        case AttrValueKind::Boolean: return "true";
        case AttrValueKind::Expression: return attr.expr ? attr.expr->to_source() : attr.attr.value;
    }
    return attr.attr.value;
}

static std::string binding_signature(const AttrBinding& b){
    return b.name + "=" + (b.expr ? "{" + b.expr->to_source() + "}" : b.literal.inspect());
}

// What a part reads and renders, as it is written in the template
static std::string part_signature(const DynamicPart& part){
    std::string sig = std::to_string(static_cast<int>(part.kind));
    switch(part.kind){
        case PartKind::Expr:
        case PartKind::Attr:
            sig += ":" + std::to_string(static_cast<int>(part.encoding)) + ":" + part.attr_name + ":" + part.expr->to_source();
            break;
        case PartKind::If:
            sig += std::string(part.negate ? ":unless " : ":if ") + part.expr->to_source() + ":" +
                   std::to_string(part.then_branch->fingerprint) + ":" + std::to_string(part.else_branch->fingerprint);
            break;
        case PartKind::For:
            sig += ":" + part.generator.pattern.to_source() + " <- " + part.generator.source->to_source();
            if(part.generator.filter) sig += ", " + part.generator.filter->to_source();
            sig += ":" + std::to_string(part.body->fingerprint);
            break;
        case PartKind::Component: {
            const ComponentInvocation& call = *part.call;
            sig += ":" + call.target();
            for(const auto& root : call.roots) sig += " {" + binding_signature(root) + "}";
            for(const auto& attr : call.attrs) sig += " " + binding_signature(attr);
            for(const auto& [name, entries] : call.slots){
                for(const auto& entry : entries){
                    sig += " <:" + name;
                    for(const auto& root : entry.roots) sig += " {" + binding_signature(root) + "}";
                    for(const auto& attr : entry.attrs) sig += " " + binding_signature(attr);
                    if(entry.let) sig += " :let=" + entry.let->to_source();
                    if(entry.body) sig += ":" + std::to_string(entry.body->fingerprint);
                    sig += ">";
                }
            }
            break;
        }
    }
    return sig;
}

TemplateCodegen::TemplateCodegen(const std::string& module, const std::string& file) : module(module), file(file){}

TemplatePtr TemplateCodegen::generate(TemplateTree& tree){
    return build(tree.children, LocalNames{}, true);
}

TemplatePtr TemplateCodegen::build(NodeList& nodes, const LocalNames& locals, bool top_level){
    Emitter e;
    emit_nodes(nodes, e, locals);

    auto tmpl = std::make_shared<Template>();
    std::vector<std::string> signatures;
    for(auto& p : e.parts){
        signatures.push_back(part_signature(p));
        tmpl->deps.merge(p.deps);
    }
    tmpl->fingerprint = template_fingerprint(e.statics, signatures);
    tmpl->statics = std::make_shared<const std::vector<std::string>>(std::move(e.statics));
    tmpl->parts = std::move(e.parts);
    tmpl->module = module;
    tmpl->file = file;

    if(top_level){
        // Root: exactly one tag at the top, nothing else but whitespace
        int elements = 0;
        bool other = false;
        for(const auto& node : nodes){
            if(dynamic_cast<ElementNode*>(node.get())){
                elements++;
            }else if(auto text = dynamic_cast<TextNode*>(node.get())){
                if(!is_blank(text->content)) other = true;
            }else{
                other = true;
            }
        }
        tmpl->root = elements == 1 && !other;
    }
    return tmpl;
}

TemplatePtr TemplateCodegen::build_single(std::unique_ptr<TemplateNode> node, const LocalNames& locals){
    NodeList nodes;
    nodes.push_back(std::move(node));
    return build(nodes, locals, false);
}

void TemplateCodegen::emit_nodes(NodeList& nodes, Emitter& e, const LocalNames& locals){
    for(auto& node : nodes) emit_node(*node, e, locals);
}

void TemplateCodegen::emit_node(TemplateNode& node, Emitter& e, const LocalNames& locals){
    if(auto text = dynamic_cast<TextNode*>(&node)){
        e.text(text->content);
        return;
    }

    if(auto hole = dynamic_cast<ExpressionHole*>(&node)){
        DynamicPart part;
        part.kind = PartKind::Expr;
        part.encoding = Encoding::Text;
        part.span = hole->span;
        hole->expr->collect_dependencies(part.deps, locals);
        part.expr = std::move(hole->expr);
        e.part(std::move(part));
        return;
    }

    if(auto el = dynamic_cast<ElementNode*>(&node)){
        emit_element(*el, e, locals);
        return;
    }

    if(auto loop = dynamic_cast<LoopNode*>(&node)){
        NodeList body;
        body.push_back(std::move(loop->body));
        e.part(loop_part(std::move(loop->generator), body, locals, loop->span));
        return;
    }

    if(auto block = dynamic_cast<ForBlockNode*>(&node)){
        e.part(loop_part(std::move(block->generator), block->children, locals, block->span));
        return;
    }

    if(auto cond = dynamic_cast<IfBlockNode*>(&node)){
        DynamicPart part;
        part.kind = PartKind::If;
        part.span = cond->span;
        part.negate = cond->negate;
        cond->condition->collect_dependencies(part.deps, locals);
        part.expr = std::move(cond->condition);
        part.then_branch = build(cond->then_children, locals, false);
        part.else_branch = build(cond->else_children, locals, false);
        part.deps.merge(part.then_branch->deps);
        part.deps.merge(part.else_branch->deps);
        e.part(std::move(part));
        return;
    }

    if(auto call = dynamic_cast<ComponentCallNode*>(&node)){
        e.part(component_part(*call, locals));
        return;
    }
}

void TemplateCodegen::emit_element(ElementNode& el, Emitter& e, const LocalNames& locals){
    e.text("<" + el.name);
    for(auto& attr : el.attrs) emit_attribute(attr, e, locals);

    if(el.kind == TagKind::Void){
        e.text(">");
        return;
    }
    if(el.self_close){
        e.text("></" + el.name + ">");
        return;
    }
    e.text(">");
    emit_nodes(el.children, e, locals);
    e.text("</" + el.name + ">");
}

void TemplateCodegen::emit_attribute(ParsedAttribute& attr, Emitter& e, const LocalNames& locals){
    const Attribute& a = attr.attr;
    if(a.kind == AttrValueKind::Literal){
        e.text(" " + a.name + "=" + a.delimiter + a.value + a.delimiter);
        return;
    }
    if(a.kind == AttrValueKind::Boolean){
        e.text(" " + a.name);
        return;
    }

    DynamicPart part;
    part.kind = PartKind::Attr;
    part.span = a.span;
    part.attr_name = a.name;
    attr.expr->collect_dependencies(part.deps, locals);
    part.expr = std::move(attr.expr);

    if(a.is_spread()){
        part.encoding = Encoding::Spread;
        e.part(std::move(part));
    }else if(a.name == "class"){
        part.encoding = Encoding::ClassAttr;
        e.text(" class=\"");
        e.part(std::move(part));
        e.text("\"");
    }else if(a.name == "style"){
        part.encoding = Encoding::AttrValue;
        e.text(" style=\"");
        e.part(std::move(part));
        e.text("\"");
    }else{
        part.encoding = Encoding::AttrPair;
        e.part(std::move(part));
    }
}

DynamicPart TemplateCodegen::loop_part(Generator generator, NodeList& body_nodes, const LocalNames& locals, const Span& span){
    std::set<std::string> bound = generator.pattern.bound_names();
    LocalNames inner = with_locals(locals, bound);

    DynamicPart part;
    part.kind = PartKind::For;
    part.span = span;
    generator.source->collect_dependencies(part.deps, locals);
    if(generator.filter){
        DependencySet filter_deps;
        generator.filter->collect_dependencies(filter_deps, inner);
        filter_deps.drop_locals(bound);
        part.deps.merge(filter_deps);
    }

    part.body = build(body_nodes, inner, false);
    DependencySet body_deps = part.body->deps;
    body_deps.drop_locals(bound);
    part.deps.merge(body_deps);

    part.generator = std::move(generator);
    return part;
}

AttrBinding TemplateCodegen::bind_attribute(ParsedAttribute& attr, const LocalNames& locals){
    AttrBinding binding;
    binding.name = attr.attr.name;
    binding.shape = attr.shape;
    binding.span = attr.attr.span;
    switch(attr.attr.kind){
        case AttrValueKind::Literal:
            binding.literal = Value(attr.attr.value);
            break;
        case AttrValueKind::Boolean:
            binding.literal = Value(true);
            break;
        case AttrValueKind::Expression:
            attr.expr->collect_dependencies(binding.deps, locals);
            binding.expr = std::move(attr.expr);
            break;
    }
    return binding;
}

DynamicPart TemplateCodegen::component_part(ComponentCallNode& call, const LocalNames& locals){
    auto inv = std::make_unique<ComponentInvocation>();
    inv->kind = call.kind;
    inv->module = call.kind == TagKind::LocalComponent ? module : call.module;
    inv->function = call.function;
    inv->span = call.span;

    ComponentCallRecord record;
    record.module = inv->module;
    record.function = inv->function;
    record.file = file;
    record.span = call.span;
    record.has_root = !call.roots.empty();

    DynamicPart part;
    part.kind = PartKind::Component;
    part.span = call.span;

    for(auto& attr : call.attrs){
        record.attrs[attr.attr.name] = AttrUse{attr.attr.span, attr.shape, use_source(attr)};
        AttrBinding binding = bind_attribute(attr, locals);
        part.deps.merge(binding.deps);
        inv->attrs.push_back(std::move(binding));
    }
    for(auto& root : call.roots){
        AttrBinding binding = bind_attribute(root, locals);
        part.deps.merge(binding.deps);
        inv->roots.push_back(std::move(binding));
    }

    auto add_slot = [&](const std::string& name, std::vector<ParsedAttribute>& attrs, std::vector<ParsedAttribute>& roots,
                        std::optional<Pattern>& let, NodeList* children, const Span& span, bool record_use){
        SlotContent slot;
        slot.name = name;
        slot.span = span;
        SlotUse use;
        use.span = span;
        use.has_root = !roots.empty();

        for(auto& attr : attrs){
            use.attrs[attr.attr.name] = AttrUse{attr.attr.span, attr.shape, use_source(attr)};
            AttrBinding binding = bind_attribute(attr, locals);
            slot.deps.merge(binding.deps);
            slot.attrs.push_back(std::move(binding));
        }
        for(auto& root : roots){
            AttrBinding binding = bind_attribute(root, locals);
            slot.deps.merge(binding.deps);
            slot.roots.push_back(std::move(binding));
        }

        if(children){
            std::set<std::string> bound;
            if(let) bound = let->bound_names();
            slot.body = build(*children, with_locals(locals, bound), false);
            DependencySet body_deps = slot.body->deps;
            for(const auto& n : bound){
                if(body_deps.locals.count(n)) slot.reads_let = true;
            }
            body_deps.drop_locals(bound);
            slot.deps.merge(body_deps);
        }
        slot.let = let;

        part.deps.merge(slot.deps);
        if(record_use) record.slots[name].push_back(std::move(use));
        inv->slots[name].push_back(std::move(slot));
    };

    for(auto& entry : call.slots){
        add_slot(entry->name, entry->attrs, entry->roots, entry->let,
                 entry->self_close ? nullptr : &entry->children, entry->span, true);
    }

    if(!call.self_close){
        bool has_content = false;
        for(const auto& child : call.children){
            auto text = dynamic_cast<TextNode*>(child.get());
            if(!text || !is_blank(text->content)) has_content = true;
        }
        std::vector<ParsedAttribute> no_attrs;
        std::vector<ParsedAttribute> no_roots;
        add_slot("inner_block", no_attrs, no_roots, call.let, &call.children, call.span, has_content || call.let.has_value());
    }

    call_records.push_back(std::move(record));
    part.call = std::move(inv);
    return part;
}

TemplatePtr compile_template(const std::string& source, const std::string& module, const std::string& file,
                             std::vector<ComponentCallRecord>* calls){
    TemplateTree tree = parse_template(source, file);
    TemplateCodegen codegen(module, file);
    TemplatePtr tmpl = codegen.generate(tree);
    if(calls){
        calls->insert(calls->end(), codegen.calls().begin(), codegen.calls().end());
    }
    return tmpl;
}
