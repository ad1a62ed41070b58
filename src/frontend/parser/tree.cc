#include "frontend/parser.h"
#include "frontend/eex.h"
#include "frontend/lexer.h"
#include "cli/error.h"

TreeBuilder::TreeBuilder(std::vector<MarkupToken> toks, const std::string &file_name)
    : tokens(std::move(toks)), file(file_name) {}

TemplateTree TreeBuilder::parse()
{
    stack.clear();
    root.clear();

    OpenFrame base;
    base.kind = OpenFrame::Kind::Root;
    base.children = &root;
    stack.push_back(std::move(base));

    for (auto &tok : tokens)
    {
        switch (tok.type)
        {
        case MarkupType::Text:
            handle_text(tok);
            break;
        case MarkupType::Expression:
            if (tok.role == BlockRole::Start)
                handle_block_start(tok);
            else if (tok.role == BlockRole::Middle)
                handle_block_middle(tok);
            else if (tok.role == BlockRole::End)
                handle_block_end(tok);
            else
                handle_expression(tok);
            break;
        case MarkupType::TagOpen:
            handle_tag_open(tok);
            break;
        case MarkupType::TagClose:
            handle_tag_close(tok);
            break;
        }
    }

    if (stack.size() > 1)
    {
        OpenFrame &open = top();
        if (open.kind == OpenFrame::Kind::Block)
        {
            ErrorHandler::compiler_error(ErrorKind::UnclosedBlock,
                                         "end of template reached without <% end %> for do-block", open.open_span, file);
        }
        ParseError err(ErrorKind::UnclosedTag,
                       "end of template reached without closing tag for <" + open.name + ">", open.open_span, file);
        err.expected = open.name;
        err.open_span = open.open_span;
        throw err;
    }

    TemplateTree tree;
    tree.children = std::move(root);
    tree.file = file;
    return tree;
}

void TreeBuilder::append(std::unique_ptr<TemplateNode> node)
{
    top().children->push_back(std::move(node));
}

void TreeBuilder::handle_text(MarkupToken &tok)
{
    auto text = std::make_unique<TextNode>();
    text->content = tok.content;
    text->span = tok.span;
    append(std::move(text));
}

void TreeBuilder::handle_expression(MarkupToken &tok)
{
    auto expr = parse_expression_code(tok.content, tok.span, file);
    // <% expr %> is checked but produces no output
    if (tok.marker != "=")
        return;
    auto hole = std::make_unique<ExpressionHole>();
    hole->expr = std::move(expr);
    hole->span = tok.span;
    append(std::move(hole));
}

void TreeBuilder::handle_block_start(MarkupToken &tok)
{
    Lexer lexer(tok.content, tok.span.line, tok.span.column);
    Parser parser(lexer.tokenize(), file);

    OpenFrame frame;
    frame.kind = OpenFrame::Kind::Block;
    frame.open_span = tok.span;

    if (parser.accept(TokenType::IF) || parser.at(TokenType::UNLESS))
    {
        bool negate = parser.accept(TokenType::UNLESS);
        auto node = std::make_unique<IfBlockNode>();
        node->negate = negate;
        node->condition = parser.parse_expression();
        node->span = tok.span;
        frame.name = negate ? "unless" : "if";
        frame.children = &node->then_children;
        frame.node = std::move(node);
    }
    else if (parser.accept(TokenType::FOR))
    {
        auto node = std::make_unique<ForBlockNode>();
        node->generator = parser.parse_generator();
        node->span = tok.span;
        frame.name = "for";
        frame.children = &node->children;
        frame.node = std::move(node);
    }
    else
    {
        ErrorHandler::compiler_error(ErrorKind::InvalidExpression,
                                     "unsupported block expression: " + trim(tok.content) +
                                     ". Expected if, unless or for", tok.span, file);
    }

    if (!parser.accept(TokenType::DO))
    {
        ErrorHandler::compiler_error(ErrorKind::InvalidExpression,
                                     "expected `do` at the end of the block expression", tok.span, file);
    }
    parser.expect_end("do");

    stack.push_back(std::move(frame));
}

void TreeBuilder::check_unclosed_for_block(const MarkupToken &tok)
{
    OpenFrame &open = top();
    if (open.kind == OpenFrame::Kind::Block)
        return;
    if (open.kind == OpenFrame::Kind::Root)
    {
        ErrorHandler::compiler_error(ErrorKind::UnexpectedBlock,
                                     "unexpected \"" + trim(tok.content) + "\" without a matching do-block", tok.span, file);
    }
    ParseError err(ErrorKind::UnclosedTag,
                   "end of do-block reached without closing tag for <" + open.name + ">", open.open_span, file);
    err.expected = open.name;
    err.open_span = open.open_span;
    throw err;
}

void TreeBuilder::handle_block_middle(MarkupToken &tok)
{
    check_unclosed_for_block(tok);
    auto node = dynamic_cast<IfBlockNode *>(top().node.get());
    if (!node || node->in_else)
    {
        ErrorHandler::compiler_error(ErrorKind::UnexpectedBlock,
                                     "unexpected \"else\" in " + top().name + " block", tok.span, file);
    }
    node->in_else = true;
    top().children = &node->else_children;
}

void TreeBuilder::handle_block_end(MarkupToken &tok)
{
    check_unclosed_for_block(tok);
    OpenFrame frame = std::move(stack.back());
    stack.pop_back();
    append(std::move(frame.node));
}

void TreeBuilder::handle_tag_open(MarkupToken &tok)
{
    switch (tok.tag_kind)
    {
    case TagKind::Slot:
        open_slot(tok);
        break;
    case TagKind::RemoteComponent:
    case TagKind::LocalComponent:
        open_component(tok);
        break;
    case TagKind::Element:
    case TagKind::Void:
        open_element(tok);
        break;
    }
}

void TreeBuilder::open_element(MarkupToken &tok)
{
    validate_element_attrs(tok);

    auto node = std::make_unique<ElementNode>();
    node->name = tok.name;
    node->kind = tok.tag_kind;
    node->span = tok.span;
    node->self_close = tok.self_close;

    std::unique_ptr<Generator> loop;
    for (const auto &attr : tok.attrs)
    {
        if (attr.name == ":for")
        {
            loop = std::make_unique<Generator>(parse_generator_code(attr.value, attr.value_span, file));
            continue;
        }
        node->attrs.push_back(parse_attribute(attr));
    }

    if (tok.self_close || tok.tag_kind == TagKind::Void)
    {
        if (loop)
        {
            auto wrapped = std::make_unique<LoopNode>();
            wrapped->span = tok.span;
            wrapped->generator = std::move(*loop);
            wrapped->body = std::move(node);
            append(std::move(wrapped));
        }
        else
        {
            append(std::move(node));
        }
        return;
    }

    OpenFrame frame;
    frame.kind = OpenFrame::Kind::Element;
    frame.name = tok.name;
    frame.open_span = tok.span;
    frame.children = &node->children;
    frame.node = std::move(node);
    frame.loop = std::move(loop);
    stack.push_back(std::move(frame));
}

void TreeBuilder::handle_tag_close(MarkupToken &tok)
{
    Span close_span = tok.span;
    OpenFrame &open = top();

    if (open.kind == OpenFrame::Kind::Root || open.kind == OpenFrame::Kind::Block)
    {
        ErrorHandler::compiler_error(ErrorKind::UnexpectedClosingTag,
                                     "missing opening tag for </" + tok.name + ">", close_span, file);
    }
    if (open.name != tok.name)
    {
        if (is_void_tag(tok.name))
        {
            ErrorHandler::compiler_error(ErrorKind::UnexpectedClosingTag,
                                         "void element <" + tok.name + "> cannot have a closing tag", close_span, file);
        }
        ErrorHandler::mismatched_tag(open.name, tok.name, open.open_span, close_span, file);
    }

    OpenFrame frame = std::move(stack.back());
    stack.pop_back();
    close_frame(std::move(frame));
}

void TreeBuilder::close_frame(OpenFrame frame)
{
    switch (frame.kind)
    {
    case OpenFrame::Kind::Element:
    {
        if (frame.loop)
        {
            auto wrapped = std::make_unique<LoopNode>();
            wrapped->span = frame.open_span;
            wrapped->generator = std::move(*frame.loop);
            wrapped->body.reset(static_cast<ElementNode *>(frame.node.release()));
            append(std::move(wrapped));
        }
        else
        {
            append(std::move(frame.node));
        }
        break;
    }
    case OpenFrame::Kind::Slot:
    {
        // Slot entries attach to the enclosing component, not to its default content
        auto component = static_cast<ComponentCallNode *>(top().node.get());
        component->slots.emplace_back(static_cast<SlotEntryNode *>(frame.node.release()));
        break;
    }
    case OpenFrame::Kind::Component:
        append(std::move(frame.node));
        break;
    default:
        break;
    }
}

TemplateTree parse_template(const std::string &source, const std::string &file)
{
    TreeBuilder builder(lex_template(source, file), file);
    return builder.parse();
}
