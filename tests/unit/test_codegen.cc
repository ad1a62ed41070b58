// File: tests/unit/test_codegen.cc
// Purpose: Verify lowering of template trees into statics, dynamic parts and fingerprints.
// Key invariants: statics.size() == parts.size() + 1; fingerprints depend on the
//                 statics and the source of each part, never on values; part
//                 dependencies exclude block-local names.
// Ownership/Lifetime: Compiled templates are shared pointers owned by each test.

#include <gtest/gtest.h>

#include "codegen/codegen.h"
#include "codegen/fingerprint.h"

#include <string>
#include <vector>

namespace
{
bool reads(const DependencySet &deps, const std::string &key, std::vector<std::string> fields = {})
{
    return deps.assigns.count(AssignDependency{key, fields}) > 0;
}
} // namespace

TEST(Codegen, StaticOnlyTemplateHasOneStatic)
{
    TemplatePtr tmpl = compile_template("<p>hi</p>");

    ASSERT_EQ(tmpl->statics->size(), 1u);
    EXPECT_EQ((*tmpl->statics)[0], "<p>hi</p>");
    EXPECT_TRUE(tmpl->parts.empty());
    EXPECT_TRUE(tmpl->deps.empty());
}

TEST(Codegen, SplitsStaticsAroundExpressions)
{
    TemplatePtr tmpl = compile_template("<p>Hello <%= @name %>!</p>");

    ASSERT_EQ(tmpl->statics->size(), 2u);
    EXPECT_EQ((*tmpl->statics)[0], "<p>Hello ");
    EXPECT_EQ((*tmpl->statics)[1], "!</p>");
    ASSERT_EQ(tmpl->parts.size(), 1u);
    EXPECT_EQ(tmpl->parts[0].kind, PartKind::Expr);
    EXPECT_EQ(tmpl->parts[0].encoding, Encoding::Text);
    EXPECT_TRUE(reads(tmpl->parts[0].deps, "name"));
}

TEST(Codegen, AttributeEncodings)
{
    TemplatePtr tmpl = compile_template("<div class={@cls} style={@st} title={@t} id=\"x\" {@rest}></div>");

    ASSERT_EQ(tmpl->parts.size(), 4u);
    EXPECT_EQ(tmpl->parts[0].encoding, Encoding::ClassAttr);
    EXPECT_EQ(tmpl->parts[1].encoding, Encoding::AttrValue);
    EXPECT_EQ(tmpl->parts[2].encoding, Encoding::AttrPair);
    EXPECT_EQ(tmpl->parts[2].attr_name, "title");
    EXPECT_EQ(tmpl->parts[3].encoding, Encoding::Spread);

    const auto &statics = *tmpl->statics;
    ASSERT_EQ(statics.size(), 5u);
    EXPECT_EQ(statics[0], "<div class=\"");
    EXPECT_EQ(statics[1], "\" style=\"");
    EXPECT_EQ(statics[2], "\"");
    EXPECT_EQ(statics[3], " id=\"x\"");
    EXPECT_EQ(statics[4], "></div>");
}

TEST(Codegen, FingerprintFollowsStaticsAndPartSource)
{
    TemplatePtr a = compile_template("<p><%= @a %></p>");
    TemplatePtr again = compile_template("<p><%= @a %></p>");
    TemplatePtr b = compile_template("<p><%= @b %></p>");
    TemplatePtr c = compile_template("<p class=\"x\"><%= @a %></p>");
    TemplatePtr d = compile_template("<p><%= if @a do %>x<% end %></p>");

    EXPECT_EQ(a->fingerprint, again->fingerprint);
    EXPECT_NE(a->fingerprint, b->fingerprint);
    EXPECT_NE(a->fingerprint, c->fingerprint);
    EXPECT_NE(a->fingerprint, d->fingerprint);
}

TEST(Codegen, BranchesWithSharedStaticsGetDistinctFingerprints)
{
    TemplatePtr tmpl = compile_template(
        "<%= if @c do %><span><%= @a %></span><% else %><span><%= @b %></span><% end %>"
        "<%= if @c do %><.one x={@x}/><% else %><.two x={@x}/><% end %>");
    ASSERT_EQ(tmpl->parts.size(), 2u);

    const DynamicPart &text = tmpl->parts[0];
    EXPECT_EQ(*text.then_branch->statics, *text.else_branch->statics);
    EXPECT_NE(text.then_branch->fingerprint, text.else_branch->fingerprint);

    const DynamicPart &calls = tmpl->parts[1];
    EXPECT_NE(calls.then_branch->fingerprint, calls.else_branch->fingerprint);
}

TEST(Codegen, FingerprintSeparatesStaticBoundaries)
{
    EXPECT_NE(template_fingerprint({"ab", "c"}, {"@x"}), template_fingerprint({"a", "bc"}, {"@x"}));
    EXPECT_NE(template_fingerprint({"a", "b"}, {"@x"}), template_fingerprint({"a", "b"}, {"@y"}));
    EXPECT_NE(template_fingerprint({"a", "b", ""}, {"x", "y"}), template_fingerprint({"a", "b", ""}, {"xy", ""}));
    EXPECT_EQ(template_fingerprint({"a", "b"}, {"@x"}), template_fingerprint({"a", "b"}, {"@x"}));
}

TEST(Codegen, RootFlagRequiresSingleTopLevelTag)
{
    EXPECT_TRUE(compile_template("<div></div>")->root);
    EXPECT_TRUE(compile_template("\n  <div><%= @a %></div>\n")->root);
    EXPECT_FALSE(compile_template("text<div></div>")->root);
    EXPECT_FALSE(compile_template("<div></div><p></p>")->root);
    EXPECT_FALSE(compile_template("<%= @a %>")->root);
}

TEST(Codegen, NestedFieldReadsNarrowDependencies)
{
    TemplatePtr tmpl = compile_template("<p><%= @user.address.city %></p>");

    ASSERT_EQ(tmpl->parts.size(), 1u);
    EXPECT_TRUE(reads(tmpl->parts[0].deps, "user", {"address", "city"}));
    EXPECT_FALSE(reads(tmpl->parts[0].deps, "user"));
}

TEST(Codegen, LoopDependenciesDropPatternNames)
{
    TemplatePtr tmpl = compile_template(
        "<ul><%= for item <- @items do %><li><%= item.name %><%= @suffix %></li><% end %></ul>");

    ASSERT_EQ(tmpl->parts.size(), 1u);
    const DynamicPart &loop = tmpl->parts[0];
    EXPECT_EQ(loop.kind, PartKind::For);
    EXPECT_TRUE(reads(loop.deps, "items"));
    EXPECT_TRUE(reads(loop.deps, "suffix"));
    EXPECT_TRUE(loop.deps.locals.empty());

    ASSERT_TRUE(loop.body);
    EXPECT_EQ(loop.body->statics->size(), 3u);
    EXPECT_EQ(loop.body->deps.locals.count("item"), 1u);
    EXPECT_FALSE(loop.body->root);
}

TEST(Codegen, ForAttributeCompilesLikeForBlock)
{
    TemplatePtr tmpl = compile_template("<li :for={x <- @xs, x > 1} class=\"row\"><%= x %></li>");

    ASSERT_EQ(tmpl->parts.size(), 1u);
    const DynamicPart &loop = tmpl->parts[0];
    EXPECT_EQ(loop.kind, PartKind::For);
    ASSERT_TRUE(loop.generator.filter);
    EXPECT_EQ((*loop.body->statics)[0], "<li class=\"row\">");
    EXPECT_FALSE(tmpl->root);
}

TEST(Codegen, IfDependenciesCoverBothBranches)
{
    TemplatePtr tmpl = compile_template("<%= if @show do %><%= @a %><% else %><%= @b %><% end %>");

    ASSERT_EQ(tmpl->parts.size(), 1u);
    const DynamicPart &cond = tmpl->parts[0];
    EXPECT_EQ(cond.kind, PartKind::If);
    EXPECT_TRUE(reads(cond.deps, "show"));
    EXPECT_TRUE(reads(cond.deps, "a"));
    EXPECT_TRUE(reads(cond.deps, "b"));
    EXPECT_NE(cond.then_branch->fingerprint, 0u);
}

TEST(Codegen, VoidAndSelfClosingElements)
{
    EXPECT_EQ((*compile_template("<br><hr/>")->statics)[0], "<br><hr>");
    EXPECT_EQ((*compile_template("<div/>")->statics)[0], "<div></div>");
}

TEST(Codegen, ComponentCallsAreRecorded)
{
    std::vector<ComponentCallRecord> calls;
    TemplatePtr tmpl = compile_template(
        "<.card title=\"Hi\" count={3} {@extra}><:footer label={@l}>f</:footer>body</.card><Ui.icon/>",
        "App", "page.heex", &calls);

    ASSERT_EQ(tmpl->parts.size(), 2u);
    EXPECT_EQ(tmpl->parts[0].kind, PartKind::Component);
    EXPECT_EQ(tmpl->parts[0].call->target(), "App.card");
    EXPECT_TRUE(reads(tmpl->parts[0].deps, "extra"));
    EXPECT_TRUE(reads(tmpl->parts[0].deps, "l"));

    ASSERT_EQ(calls.size(), 2u);
    const ComponentCallRecord &card = calls[0];
    EXPECT_EQ(card.module, "App");
    EXPECT_EQ(card.function, "card");
    EXPECT_EQ(card.file, "page.heex");
    EXPECT_TRUE(card.has_root);
    ASSERT_EQ(card.attrs.count("title"), 1u);
    EXPECT_EQ(card.attrs.at("title").shape, AttrShape::String);
    EXPECT_EQ(card.attrs.at("title").source, "\"Hi\"");
    EXPECT_EQ(card.attrs.at("count").shape, AttrShape::Integer);
    EXPECT_EQ(card.slots.count("footer"), 1u);
    EXPECT_EQ(card.slots.count("inner_block"), 1u);

    EXPECT_EQ(calls[1].module, "Ui");
    EXPECT_EQ(calls[1].function, "icon");
    EXPECT_TRUE(calls[1].slots.empty());
}

TEST(Codegen, BlankDefaultContentIsNotASlotUse)
{
    std::vector<ComponentCallRecord> calls;
    TemplatePtr tmpl = compile_template("<.card>\n  </.card>", "App", "nofile", &calls);

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].slots.count("inner_block"), 0u);
    ASSERT_EQ(tmpl->parts[0].call->slots.count("inner_block"), 1u);
}

TEST(Codegen, LetNamesMarkSlotAsReadingArgument)
{
    TemplatePtr tmpl = compile_template("<.list :let={row}><%= row.name %></.list><.list :let={_}>x</.list>");

    ASSERT_EQ(tmpl->parts.size(), 2u);
    const SlotContent &reading = tmpl->parts[0].call->slots.at("inner_block").front();
    EXPECT_TRUE(reading.reads_let);
    EXPECT_TRUE(reading.deps.locals.empty());
    const SlotContent &ignoring = tmpl->parts[1].call->slots.at("inner_block").front();
    EXPECT_FALSE(ignoring.reads_let);
}
