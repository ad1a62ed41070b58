// File: tests/unit/test_live_template.cc
// Purpose: Verify the render/diff cycle of one live template instantiation.
// Key invariants: The snapshot is replaced only after a successful render; the changed
//                 set is consumed by each render; component ids survive renders and
//                 are released with their components.
// Ownership/Lifetime: Each test owns its library and LiveTemplate.

#include <gtest/gtest.h>

#include "codegen/codegen.h"
#include "compiler/template_compiler.h"
#include "session/live_template.h"
#include "cli/error.h"

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace
{
struct Widgets
{
    ComponentLibrary library;
    TemplatePtr page;

    explicit Widgets(const std::string &page_source)
    {
        TemplateCompiler compiler("Widgets", "widgets.heex");
        compiler.component("modal", "<div class=\"modal\"><%= render_slot(@inner_block) %></div>");
        compiler.component("card", "<li><%= @title %></li>");
        compiler.component("group", "<div><.card id=\"inner\" title=\"x\"/></div>");
        page = compiler.compile(page_source);
        library.add(compiler.finish());
    }
};
} // namespace

TEST(LiveTemplate, FirstRenderIsFull)
{
    LiveTemplate live(compile_template("<h1><%= @title %></h1>"));
    EXPECT_FALSE(live.mounted());
    EXPECT_EQ(live.html(), "");

    BindingSet bindings({{"title", Value("Home")}});
    Patch patch = live.render(bindings);

    EXPECT_TRUE(patch.is_full());
    EXPECT_TRUE(live.mounted());
    EXPECT_EQ(live.html(), "<h1>Home</h1>");
    EXPECT_TRUE(bindings.changed().empty());
}

TEST(LiveTemplate, FailedRenderKeepsPreviousSnapshot)
{
    LiveTemplate live(compile_template("<ul><%= for x <- @xs do %><li><%= x %></li><% end %></ul>"));
    BindingSet bindings({{"xs", Value::list({Value(1)})}});
    live.render(bindings);
    const Rendered *before = live.current()->root.get();

    bindings.assign("xs", Value(5));
    EXPECT_THROW(live.render(bindings), RenderError);
    EXPECT_EQ(live.current()->root.get(), before);
    EXPECT_EQ(live.html(), "<ul><li>1</li></ul>");
    EXPECT_TRUE(bindings.changed().contains("xs"));

    bindings.assign("xs", Value::list({Value(1), Value(2)}));
    Patch patch = live.render(bindings);
    EXPECT_EQ(patch.json(), json::parse(R"({"0": {"s": ["<li>", "</li>"], "d": [["1"], ["2"]]}})"));
    EXPECT_EQ(live.html(), "<ul><li>1</li><li>2</li></ul>");
}

TEST(LiveTemplate, SlotContentFollowsTheCallerAssigns)
{
    Widgets widgets("<section><.modal id=\"m\">Hello <%= @msg %></.modal></section>");
    LiveTemplate live(widgets.page, &widgets.library);
    BindingSet bindings({{"msg", Value("there")}, {"other", Value(0)}});

    Patch first = live.render(bindings);
    EXPECT_EQ(first.json()["0"], 1);
    EXPECT_EQ(live.html(), "<section><div class=\"modal\">Hello there</div></section>");

    bindings.assign("msg", Value("World"));
    Patch second = live.render(bindings);
    EXPECT_EQ(second.json(), json::parse(R"({"c": {"1": {"0": {"0": "World"}}}})"));

    bindings.assign("other", Value(1));
    EXPECT_TRUE(live.render(bindings).empty());
    EXPECT_EQ(live.html(), "<section><div class=\"modal\">Hello World</div></section>");
}

TEST(LiveTemplate, RemovingAParentReleasesItsChildren)
{
    Widgets widgets("<%= if @show do %><.group id=\"g\"/><% end %>");
    LiveTemplate live(widgets.page, &widgets.library);
    BindingSet bindings({{"show", Value(true)}});

    Patch first = live.render(bindings);
    ASSERT_EQ(live.current()->components.size(), 2u);
    EXPECT_EQ(live.registry().size(), 2u);
    EXPECT_EQ(live.html(), "<div><li>x</li></div>");
    EXPECT_FALSE(first.json().contains("r"));

    const ComponentNode &group = live.current()->components.at(1);
    ASSERT_EQ(group.children.count(""), 1u);
    EXPECT_EQ(group.children.at("").front(), 2);

    bindings.assign("show", Value(false));
    Patch patch = live.render(bindings);

    EXPECT_EQ(patch.json(), json::parse(R"({"0": {"s": [""]}, "c": {"1": null, "2": null}})"));
    EXPECT_EQ(live.registry().size(), 0u);
    EXPECT_EQ(live.html(), "");
}

TEST(LiveTemplate, ForcedAssignResendsEqualValueOnlyWhenItDiffers)
{
    LiveTemplate live(compile_template("<p><%= @n %></p>"));
    BindingSet bindings({{"n", Value(1)}});
    live.render(bindings);

    bindings.force("n", Value(1));
    Patch same = live.render(bindings);
    EXPECT_TRUE(same.empty());

    bindings.force("n", Value(2));
    EXPECT_EQ(live.render(bindings).json(), json::parse(R"({"0": "2"})"));
}

TEST(LiveTemplate, RequiresATemplate)
{
    EXPECT_THROW(LiveTemplate(nullptr), std::logic_error);
}
