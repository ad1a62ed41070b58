#include "frontend/parser.h"
#include "cli/error.h"
#include <cctype>
#include <set>

ParsedAttribute TreeBuilder::parse_attribute(const Attribute &attr)
{
    ParsedAttribute parsed;
    parsed.attr = attr;
    if (attr.kind == AttrValueKind::Expression)
    {
        parsed.expr = parse_expression_code(attr.value, attr.value_span, file);
    }
    parsed.shape = literal_shape(attr, parsed.expr.get());
    return parsed;
}

// <A.B.fun>: module A.B, function fun
void TreeBuilder::resolve_remote(ComponentCallNode &call, const MarkupToken &tok)
{
    size_t dot = tok.name.rfind('.');
    std::string fun = dot == std::string::npos ? "" : tok.name.substr(dot + 1);
    if (dot == std::string::npos || dot == 0 || fun.empty() ||
        !(std::islower(static_cast<unsigned char>(fun[0])) || fun[0] == '_'))
    {
        ErrorHandler::compiler_error(ErrorKind::InvalidTag, "invalid tag <" + tok.name + ">", tok.span, file);
    }
    call.module = tok.name.substr(0, dot);
    call.function = fun;
}

// Splits component/slot attributes into :let, root spreads and named attributes
void TreeBuilder::split_component_attrs(const MarkupToken &tok, const std::string &context,
                                        std::vector<ParsedAttribute> &attrs, std::vector<ParsedAttribute> &roots,
                                        std::optional<Pattern> &let)
{
    Span let_span;
    for (const auto &attr : tok.attrs)
    {
        if (attr.is_spread())
        {
            roots.push_back(parse_attribute(attr));
            continue;
        }
        if (attr.name == ":let")
        {
            if (let)
            {
                ErrorHandler::compiler_error(ErrorKind::DuplicateLet,
                                             "cannot define multiple :let attributes. Another :let has already been defined at line " +
                                             std::to_string(let_span.line), attr.span, file);
            }
            if (attr.kind != AttrValueKind::Expression)
            {
                ErrorHandler::compiler_error(ErrorKind::InvalidDirective,
                                             ":let must be a pattern between {...}", attr.span, file);
            }
            let = parse_pattern_code(attr.value, attr.value_span, file);
            let_span = attr.span;
            continue;
        }
        if (attr.is_special())
        {
            ErrorHandler::compiler_error(ErrorKind::UnsupportedAttribute,
                                         "unsupported attribute \"" + attr.name + "\" in " + context, attr.span, file);
        }
        attrs.push_back(parse_attribute(attr));
    }
}

void TreeBuilder::open_component(MarkupToken &tok)
{
    auto call = std::make_unique<ComponentCallNode>();
    call->kind = tok.tag_kind;
    call->tag = tok.name;
    call->span = tok.span;
    call->self_close = tok.self_close;

    if (tok.tag_kind == TagKind::RemoteComponent)
    {
        resolve_remote(*call, tok);
    }
    else
    {
        call->function = tok.name.substr(1);
        if (call->function.empty() || !(std::islower(static_cast<unsigned char>(call->function[0])) || call->function[0] == '_'))
        {
            ErrorHandler::compiler_error(ErrorKind::InvalidTag, "invalid tag <" + tok.name + ">", tok.span, file);
        }
    }

    split_component_attrs(tok, "component", call->attrs, call->roots, call->let);

    if (tok.self_close)
    {
        if (call->let)
        {
            ErrorHandler::compiler_error(ErrorKind::LetWithoutInnerContent,
                                         "cannot use :let on a component without inner content", tok.span, file);
        }
        append(std::move(call));
        return;
    }

    OpenFrame frame;
    frame.kind = OpenFrame::Kind::Component;
    frame.name = tok.name;
    frame.open_span = tok.span;
    frame.children = &call->children;
    frame.node = std::move(call);
    stack.push_back(std::move(frame));
}

void TreeBuilder::open_slot(MarkupToken &tok)
{
    std::string name = tok.name.substr(1);

    if (name == "inner_block")
    {
        ErrorHandler::compiler_error(ErrorKind::ReservedSlotName,
                                     "the slot name :inner_block is reserved", tok.span, file);
    }
    if (top().kind != OpenFrame::Kind::Component)
    {
        ErrorHandler::compiler_error(ErrorKind::SlotOutsideComponent,
                                     "invalid slot entry <" + tok.name + ">. A slot entry must be a direct child of a component",
                                     tok.span, file);
    }

    auto slot = std::make_unique<SlotEntryNode>();
    slot->name = name;
    slot->span = tok.span;
    slot->self_close = tok.self_close;
    split_component_attrs(tok, "slot", slot->attrs, slot->roots, slot->let);

    if (tok.self_close)
    {
        if (slot->let)
        {
            ErrorHandler::compiler_error(ErrorKind::LetWithoutInnerContent,
                                         "cannot use :let on a slot without inner content", tok.span, file);
        }
        auto component = static_cast<ComponentCallNode *>(top().node.get());
        component->slots.push_back(std::move(slot));
        return;
    }

    OpenFrame frame;
    frame.kind = OpenFrame::Kind::Slot;
    frame.name = tok.name;
    frame.open_span = tok.span;
    frame.children = &slot->children;
    frame.node = std::move(slot);
    stack.push_back(std::move(frame));
}

// :for is the only special attribute on plain tags; phx-update and phx-hook need an id
void TreeBuilder::validate_element_attrs(const MarkupToken &tok)
{
    static const std::set<std::string> update_values = {"ignore", "stream", "append", "prepend", "replace"};

    bool has_for = false;
    bool has_id = false;
    const Attribute *update = nullptr;
    const Attribute *hook = nullptr;

    for (const auto &attr : tok.attrs)
    {
        if (attr.name == ":for")
        {
            if (has_for)
            {
                ErrorHandler::compiler_error(ErrorKind::DuplicateDirective,
                                             "cannot define multiple \":for\" attributes", attr.span, file);
            }
            if (attr.kind != AttrValueKind::Expression)
            {
                ErrorHandler::compiler_error(ErrorKind::InvalidDirective,
                                             ":for must be a generator expression between {...}", attr.span, file);
            }
            has_for = true;
            continue;
        }
        if (attr.is_special())
        {
            ErrorHandler::compiler_error(ErrorKind::UnsupportedAttribute,
                                         "unsupported attribute \"" + attr.name + "\" in tags", attr.span, file);
        }
        if (attr.name == "id")
            has_id = true;
        else if (attr.name == "phx-update")
            update = &attr;
        else if (attr.name == "phx-hook")
            hook = &attr;
    }

    if (update && update->kind == AttrValueKind::Literal && !update_values.count(update->value))
    {
        ErrorHandler::compiler_error(ErrorKind::InvalidDirective,
                                     "the value of the attribute \"phx-update\" must be: ignore, stream, append, prepend, or replace",
                                     update->span, file);
    }
    const Attribute *needs_id = update ? update : hook;
    if (needs_id && !has_id)
    {
        ErrorHandler::compiler_error(ErrorKind::InvalidDirective,
                                     "attribute \"" + needs_id->name + "\" requires the \"id\" attribute to be set",
                                     needs_id->span, file);
    }
}
