// File: tests/unit/test_parser.cc
// Purpose: Verify the template tree builder and its structural validation.
// Key invariants: Tags nest properly; slot entries attach to their component;
//                 every structural violation raises a ParseError of a distinct kind.
// Ownership/Lifetime: Each test owns the parsed TemplateTree.

#include <gtest/gtest.h>

#include "frontend/parser.h"
#include "cli/error.h"

#include <string>

namespace
{
ParseError parse_failure(const std::string &source)
{
    try
    {
        parse_template(source, "page.heex");
    }
    catch (const ParseError &e)
    {
        return e;
    }
    ADD_FAILURE() << "expected a ParseError for: " << source;
    return ParseError(ErrorKind::InvalidTag, "none", Span{}, "");
}

template <typename T>
T *node_at(NodeList &nodes, size_t index)
{
    if (index >= nodes.size())
        return nullptr;
    return dynamic_cast<T *>(nodes[index].get());
}
} // namespace

TEST(Parser, BuildsNestedElements)
{
    TemplateTree tree = parse_template("<div id=\"a\"><span>x</span><br></div>");

    ASSERT_EQ(tree.children.size(), 1u);
    auto *div = node_at<ElementNode>(tree.children, 0);
    ASSERT_NE(div, nullptr);
    EXPECT_EQ(div->name, "div");
    ASSERT_EQ(div->attrs.size(), 1u);
    EXPECT_EQ(div->attrs[0].attr.value, "a");
    ASSERT_EQ(div->children.size(), 2u);
    auto *span = node_at<ElementNode>(div->children, 0);
    ASSERT_NE(span, nullptr);
    EXPECT_EQ(span->name, "span");
    auto *br = node_at<ElementNode>(div->children, 1);
    ASSERT_NE(br, nullptr);
    EXPECT_EQ(br->kind, TagKind::Void);
}

TEST(Parser, OutputExpressionsBecomeHoles)
{
    TemplateTree tree = parse_template("<p><%= @name %><% @ignored %></p>");

    auto *p = node_at<ElementNode>(tree.children, 0);
    ASSERT_NE(p, nullptr);
    ASSERT_EQ(p->children.size(), 1u);
    auto *hole = node_at<ExpressionHole>(p->children, 0);
    ASSERT_NE(hole, nullptr);
    EXPECT_EQ(hole->expr->to_source(), "@name");
}

TEST(Parser, IfBlockCollectsBothBranches)
{
    TemplateTree tree = parse_template("<%= if @on do %>A<% else %>B<% end %>");

    auto *block = node_at<IfBlockNode>(tree.children, 0);
    ASSERT_NE(block, nullptr);
    EXPECT_FALSE(block->negate);
    EXPECT_EQ(block->then_children.size(), 1u);
    EXPECT_EQ(block->else_children.size(), 1u);
}

TEST(Parser, ForAttributeWrapsElement)
{
    TemplateTree tree = parse_template("<ul><li :for={item <- @items}><%= item %></li></ul>");

    auto *ul = node_at<ElementNode>(tree.children, 0);
    ASSERT_NE(ul, nullptr);
    auto *loop = node_at<LoopNode>(ul->children, 0);
    ASSERT_NE(loop, nullptr);
    EXPECT_EQ(loop->generator.pattern.variable, "item");
    EXPECT_EQ(loop->body->name, "li");
    EXPECT_TRUE(loop->body->attrs.empty());
}

TEST(Parser, SlotEntriesAttachToComponent)
{
    TemplateTree tree = parse_template(
        "<.card title=\"t\"><:header :let={h}>H<%= h %></:header>body<:footer/></.card>");

    auto *call = node_at<ComponentCallNode>(tree.children, 0);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->function, "card");
    EXPECT_TRUE(call->module.empty());
    ASSERT_EQ(call->attrs.size(), 1u);
    ASSERT_EQ(call->slots.size(), 2u);
    EXPECT_EQ(call->slots[0]->name, "header");
    ASSERT_TRUE(call->slots[0]->let.has_value());
    EXPECT_EQ(call->slots[0]->let->variable, "h");
    EXPECT_EQ(call->slots[1]->name, "footer");
    EXPECT_TRUE(call->slots[1]->self_close);
    ASSERT_EQ(call->children.size(), 1u);
    auto *body = node_at<TextNode>(call->children, 0);
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(body->content, "body");
}

TEST(Parser, RemoteComponentSplitsModuleAndFunction)
{
    TemplateTree tree = parse_template("<Ui.Buttons.primary {@rest} label=\"Go\"/>");

    auto *call = node_at<ComponentCallNode>(tree.children, 0);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->kind, TagKind::RemoteComponent);
    EXPECT_EQ(call->module, "Ui.Buttons");
    EXPECT_EQ(call->function, "primary");
    EXPECT_EQ(call->roots.size(), 1u);
    EXPECT_EQ(call->attrs.size(), 1u);
}

TEST(Parser, MismatchedClosingTagNamesBothTags)
{
    ParseError e = parse_failure("<div><span></div>");

    EXPECT_EQ(e.kind, ErrorKind::MismatchedClosingTag);
    EXPECT_EQ(e.expected, "span");
    EXPECT_EQ(e.found, "div");
    EXPECT_EQ(e.open_span.column, 6);
    EXPECT_EQ(e.file, "page.heex");
}

TEST(Parser, UnclosedTagReportsOpening)
{
    ParseError e = parse_failure("<section>\n  <p>text");

    EXPECT_EQ(e.kind, ErrorKind::UnclosedTag);
    EXPECT_EQ(e.expected, "p");
    EXPECT_EQ(e.open_span.line, 2);
}

TEST(Parser, ClosingTagWithoutOpening)
{
    EXPECT_EQ(parse_failure("</div>").kind, ErrorKind::UnexpectedClosingTag);
    EXPECT_EQ(parse_failure("<br></br>").kind, ErrorKind::UnexpectedClosingTag);
}

TEST(Parser, SlotOutsideComponent)
{
    EXPECT_EQ(parse_failure("<div><:footer>x</:footer></div>").kind, ErrorKind::SlotOutsideComponent);
    EXPECT_EQ(parse_failure("<.card><div><:footer/></div></.card>").kind, ErrorKind::SlotOutsideComponent);
}

TEST(Parser, InnerBlockSlotNameIsReserved)
{
    EXPECT_EQ(parse_failure("<.card><:inner_block>x</:inner_block></.card>").kind, ErrorKind::ReservedSlotName);
}

TEST(Parser, LetRules)
{
    EXPECT_EQ(parse_failure("<.card :let={a} :let={b}>x</.card>").kind, ErrorKind::DuplicateLet);
    EXPECT_EQ(parse_failure("<.card :let={a}/>").kind, ErrorKind::LetWithoutInnerContent);
    EXPECT_EQ(parse_failure("<.card><:col :let={c}/></.card>").kind, ErrorKind::LetWithoutInnerContent);
}

TEST(Parser, InvalidComponentTags)
{
    EXPECT_EQ(parse_failure("<Foo>x</Foo>").kind, ErrorKind::InvalidTag);
    EXPECT_EQ(parse_failure("<.Card/>").kind, ErrorKind::InvalidTag);
}

TEST(Parser, BlockStructure)
{
    EXPECT_EQ(parse_failure("<%= if @a do %>open").kind, ErrorKind::UnclosedBlock);
    EXPECT_EQ(parse_failure("text<% end %>").kind, ErrorKind::UnexpectedBlock);
    EXPECT_EQ(parse_failure("<%= if @a do %><p><% end %>").kind, ErrorKind::UnclosedTag);
    EXPECT_EQ(parse_failure("<%= for x <- @xs do %>a<% else %>b<% end %>").kind, ErrorKind::UnexpectedBlock);
}

TEST(Parser, TagDirectives)
{
    EXPECT_EQ(parse_failure("<div :if={@a}></div>").kind, ErrorKind::UnsupportedAttribute);
    EXPECT_EQ(parse_failure("<li :for={a <- @a} :for={b <- @b}></li>").kind, ErrorKind::DuplicateDirective);
    EXPECT_EQ(parse_failure("<div id=\"x\" phx-update=\"bogus\"></div>").kind, ErrorKind::InvalidDirective);
    EXPECT_EQ(parse_failure("<div phx-hook=\"Chart\"></div>").kind, ErrorKind::InvalidDirective);
}

TEST(Parser, InvalidExpressionCode)
{
    EXPECT_EQ(parse_failure("<p><%= @a + %></p>").kind, ErrorKind::InvalidExpression);
    EXPECT_EQ(parse_failure("<p title={}></p>").kind, ErrorKind::InvalidExpression);
}
