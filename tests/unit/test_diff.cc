// File: tests/unit/test_diff.cc
// Purpose: Verify the wire patches computed between successive render trees.
// Key invariants: Unchanged slots are omitted; a fingerprint change sends the full
//                 tree; reordered components move without resending content; removed
//                 components are tombstoned with null.
// Ownership/Lifetime: Snapshots and live templates are owned by each test.

#include <gtest/gtest.h>

#include "codegen/codegen.h"
#include "compiler/template_compiler.h"
#include "diff/diff.h"
#include "runtime/evaluator.h"
#include "session/live_template.h"

#include <nlohmann/json.hpp>

#include <string>

using nlohmann::json;

namespace
{
RenderSnapshot evaluate(const Template &tmpl, const ValueMap &assigns, const ChangedSet &changed,
                        const RenderSnapshot *previous = nullptr)
{
    Evaluator evaluator;
    return evaluator.render(tmpl, assigns, changed, previous);
}

ChangedSet changed_keys(std::initializer_list<const char *> keys)
{
    ChangedSet changed;
    for (const char *key : keys)
        changed.mark(key);
    return changed;
}

Value card(const std::string &id, const std::string &title)
{
    return Value::map({{"id", Value(id)}, {"title", Value(title)}});
}

Value cards(std::initializer_list<const char *> ids)
{
    ValueList items;
    for (const char *id : ids)
        items.push_back(card(id, std::string("Card ") + id));
    return Value::list(std::move(items));
}

// A list of stateful card components rendered through a for block
struct CardList
{
    ComponentLibrary library;
    TemplatePtr page;

    CardList()
    {
        TemplateCompiler compiler("App", "cards.heex");
        compiler.component("card", "<li><%= @title %></li>");
        page = compiler.compile("<ul><%= for c <- @cards do %><.card id={c.id} title={c.title}/><% end %></ul>");
        library.add(compiler.finish());
    }
};
} // namespace

TEST(Diff, StaticOnlyTemplate)
{
    TemplatePtr tmpl = compile_template("<p>hi</p>");
    RenderSnapshot snapshot = evaluate(*tmpl, {}, ChangedSet::everything());

    DiffEngine engine;
    json full = engine.full(*snapshot.root);
    EXPECT_EQ(full, json::parse(R"({"s": ["<p>hi</p>"], "r": 1})"));

    EXPECT_TRUE(engine.diff(&snapshot, snapshot, ChangedSet{}).empty());
    EXPECT_TRUE(engine.diff(&snapshot, snapshot, changed_keys({"anything"})).empty());
    EXPECT_TRUE(engine.diff(&snapshot, snapshot, ChangedSet::everything()).empty());
}

TEST(Diff, SingleDynamicScenario)
{
    LiveTemplate live(compile_template("<p><%= name %></p>"));
    BindingSet bindings({{"name", Value("Ada")}});

    Patch first = live.render(bindings);
    EXPECT_TRUE(first.is_full());
    EXPECT_EQ(first.json(), json::parse(R"({"s": ["<p>", "</p>"], "0": "Ada", "r": 1})"));

    bindings.assign("name", Value("Ada"));
    Patch second = live.render(bindings);
    EXPECT_TRUE(second.empty());
    EXPECT_EQ(second.dump(), "{}");

    bindings.assign("name", Value("Grace"));
    Patch third = live.render(bindings);
    EXPECT_EQ(third.json(), json::parse(R"({"0": "Grace"})"));
    EXPECT_EQ(live.html(), "<p>Grace</p>");
}

TEST(Diff, NoOpDiffIsEmpty)
{
    TemplatePtr tmpl = compile_template("<div><%= @a %><%= for x <- @xs do %><i><%= x %></i><% end %></div>");
    ValueMap assigns = {{"a", Value(1)}, {"xs", Value::list({Value(1), Value(2)})}};
    RenderSnapshot snapshot = evaluate(*tmpl, assigns, ChangedSet::everything());

    DiffEngine engine;
    EXPECT_TRUE(engine.diff(snapshot.root.get(), *snapshot.root, ChangedSet{}).empty());
    EXPECT_TRUE(engine.diff(&snapshot, snapshot, ChangedSet{}).empty());
}

TEST(Diff, OnlyTheSlotReadingTheChangedKeyIsSent)
{
    TemplatePtr tmpl = compile_template("<div><%= @a %>|<%= @b %>|<%= @c %></div>");
    ValueMap before = {{"a", Value("1")}, {"b", Value("2")}, {"c", Value("3")}};
    ValueMap after = {{"a", Value("1")}, {"b", Value("two")}, {"c", Value("3")}};

    RenderSnapshot first = evaluate(*tmpl, before, ChangedSet::everything());
    ChangedSet changed = changed_keys({"b"});
    RenderSnapshot second = evaluate(*tmpl, after, changed, &first);

    DiffEngine engine;
    EXPECT_EQ(engine.diff(&first, second, changed).json(), json::parse(R"({"1": "two"})"));
}

TEST(Diff, FingerprintChangeSendsFullTree)
{
    TemplatePtr a = compile_template("<p><%= @x %></p>");
    TemplatePtr b = compile_template("<section><%= @x %></section>");
    RenderSnapshot first = evaluate(*a, {{"x", Value("1")}}, ChangedSet::everything());
    RenderSnapshot second = evaluate(*b, {{"x", Value("1")}}, ChangedSet::everything());

    DiffEngine engine;
    Patch patch = engine.diff(&first, second, ChangedSet{});
    EXPECT_TRUE(patch.is_full());
    EXPECT_EQ(patch.json(), json::parse(R"({"s": ["<section>", "</section>"], "0": "1", "r": 1})"));

    EXPECT_TRUE(engine.diff(first.root.get(), *second.root, ChangedSet{}).is_full());
}

TEST(Diff, SwitchedBranchIsSentWhole)
{
    TemplatePtr tmpl = compile_template("<div><%= if @on do %><b><%= @t %></b><% else %>off<% end %></div>");
    RenderSnapshot first = evaluate(*tmpl, {{"on", Value(false)}, {"t", Value("x")}}, ChangedSet::everything());

    ChangedSet changed = changed_keys({"on"});
    RenderSnapshot second = evaluate(*tmpl, {{"on", Value(true)}, {"t", Value("x")}}, changed, &first);

    DiffEngine engine;
    EXPECT_EQ(engine.diff(&first, second, changed).json(), json::parse(R"({"0": {"s": ["<b>", "</b>"], "0": "x"}})"));

    ChangedSet text = changed_keys({"t"});
    RenderSnapshot third = evaluate(*tmpl, {{"on", Value(true)}, {"t", Value("y")}}, text, &second);
    EXPECT_EQ(engine.diff(&second, third, text).json(), json::parse(R"({"0": {"0": "y"}})"));
}

TEST(Diff, BranchesWithSharedStaticsAreReplacedOnSwitch)
{
    LiveTemplate live(compile_template(
        "<div><%= if @c do %><span><%= @a %></span><% else %><span><%= @b %></span><% end %></div>"));
    BindingSet bindings({{"c", Value(true)}, {"a", Value("A")}, {"b", Value("B")}});
    live.render(bindings);
    EXPECT_EQ(live.html(), "<div><span>A</span></div>");

    bindings.assign("c", Value(false));
    Patch patch = live.render(bindings);
    EXPECT_EQ(patch.json(), json::parse(R"({"0": {"s": ["<span>", "</span>"], "0": "B"}})"));
    EXPECT_EQ(live.html(), "<div><span>B</span></div>");
}

TEST(Diff, BranchesCallingDifferentComponentsAreReplacedOnSwitch)
{
    TemplateCompiler compiler("App", "app.heex");
    compiler.component("one", "<b>one <%= @x %></b>");
    compiler.component("two", "<i>two <%= @x %></i>");
    TemplatePtr page = compiler.compile("<div><%= if @c do %><.one x={@x}/><% else %><.two x={@x}/><% end %></div>");
    ComponentLibrary library;
    library.add(compiler.finish());

    LiveTemplate live(page, &library);
    BindingSet bindings({{"c", Value(true)}, {"x", Value("X")}});
    live.render(bindings);
    EXPECT_EQ(live.html(), "<div><b>one X</b></div>");

    bindings.assign("c", Value(false));
    Patch patch = live.render(bindings);
    ASSERT_TRUE(patch.json().contains("0"));
    EXPECT_TRUE(patch.json()["0"].contains("s"));
    EXPECT_EQ(live.html(), "<div><i>two X</i></div>");
}

TEST(Diff, ComprehensionsShareStatics)
{
    TemplatePtr tmpl = compile_template("<ul><%= for x <- @xs do %><li><%= x %></li><% end %></ul>");
    RenderSnapshot first = evaluate(*tmpl, {{"xs", Value::list({Value("a"), Value("b")})}}, ChangedSet::everything());

    DiffEngine engine;
    EXPECT_EQ(engine.full(*first.root),
              json::parse(R"({"s": ["<ul>", "</ul>"], "0": {"s": ["<li>", "</li>"], "d": [["a"], ["b"]]}, "r": 1})"));

    ChangedSet changed = changed_keys({"xs"});
    RenderSnapshot second = evaluate(*tmpl, {{"xs", Value::list({Value("a"), Value("c")})}}, changed, &first);
    EXPECT_EQ(engine.diff(&first, second, changed).json(), json::parse(R"({"0": {"d": {"1": {"0": "c"}}}})"));

    RenderSnapshot third = evaluate(*tmpl, {{"xs", Value::list({Value("a")})}}, changed, &second);
    EXPECT_EQ(engine.diff(&second, third, changed).json(),
              json::parse(R"({"0": {"s": ["<li>", "</li>"], "d": [["a"]]}})"));
}

TEST(Diff, ReorderedComponentsOnlyMove)
{
    CardList list;
    LiveTemplate live(list.page, &list.library);
    BindingSet bindings({{"cards", cards({"a", "b", "c"})}});

    Patch first = live.render(bindings);
    ASSERT_TRUE(first.is_full());
    EXPECT_EQ(first.json()["0"]["d"], json::parse("[[1], [2], [3]]"));
    ASSERT_TRUE(first.json().contains("c"));
    EXPECT_EQ(first.json()["c"].size(), 3u);
    EXPECT_EQ(first.json()["c"]["1"], json::parse(R"({"s": ["<li>", "</li>"], "0": "Card a", "r": 1})"));

    bindings.assign("cards", cards({"b", "a", "c"}));
    Patch moved = live.render(bindings);
    EXPECT_EQ(moved.json(), json::parse(R"({"0": {"k": {"n": 3, "m": [[1, 0]]}}})"));
    EXPECT_FALSE(moved.json().contains("c"));
    EXPECT_EQ(live.html(), "<ul><li>Card b</li><li>Card a</li><li>Card c</li></ul>");
}

TEST(Diff, RemovedComponentsAreTombstoned)
{
    CardList list;
    LiveTemplate live(list.page, &list.library);
    BindingSet bindings({{"cards", cards({"a", "b", "c"})}});
    live.render(bindings);

    bindings.assign("cards", cards({"a", "c"}));
    Patch patch = live.render(bindings);

    EXPECT_EQ(patch.json(), json::parse(R"({"0": {"k": {"n": 2, "r": [1]}}, "c": {"2": null}})"));
    EXPECT_FALSE(live.registry().find("App.card#b").has_value());
    EXPECT_EQ(live.current()->components.size(), 2u);
}

TEST(Diff, InsertedComponentsAreSentWhole)
{
    CardList list;
    LiveTemplate live(list.page, &list.library);
    BindingSet bindings({{"cards", cards({"a", "c"})}});
    live.render(bindings);

    bindings.assign("cards", cards({"a", "b", "c"}));
    Patch patch = live.render(bindings);

    const json &keyed = patch.json()["0"]["k"];
    EXPECT_EQ(keyed["n"], 3);
    EXPECT_FALSE(keyed.contains("m"));
    EXPECT_FALSE(keyed.contains("r"));
    EXPECT_EQ(keyed["i"], json::parse(R"({"1": [3]})"));
    EXPECT_EQ(patch.json()["c"], json::parse(R"({"3": {"s": ["<li>", "</li>"], "0": "Card b", "r": 1}})"));
}

TEST(Diff, ChangedComponentContentGoesToTheTable)
{
    CardList list;
    LiveTemplate live(list.page, &list.library);
    BindingSet bindings({{"cards", cards({"a", "b"})}});
    live.render(bindings);

    bindings.assign("cards", Value::list({card("a", "Card a"), card("b", "Renamed")}));
    Patch patch = live.render(bindings);

    EXPECT_EQ(patch.json(), json::parse(R"({"c": {"2": {"0": "Renamed"}}})"));
}

TEST(Diff, RemountAfterRemovalGetsNewId)
{
    CardList list;
    LiveTemplate live(list.page, &list.library);
    BindingSet bindings({{"cards", cards({"a"})}});
    live.render(bindings);

    bindings.assign("cards", cards({}));
    Patch gone = live.render(bindings);
    EXPECT_EQ(gone.json()["c"], json::parse(R"({"1": null})"));

    bindings.assign("cards", cards({"a"}));
    Patch back = live.render(bindings);
    EXPECT_EQ(back.json()["c"].begin().key(), "2");
    EXPECT_EQ(*live.registry().find("App.card#a"), 2);
}

TEST(Diff, LongestIncreasingRun)
{
    EXPECT_EQ(longest_increasing_run({}), std::vector<size_t>{});
    EXPECT_EQ(longest_increasing_run({1, 0, 2}), (std::vector<size_t>{1, 2}));
    EXPECT_EQ(longest_increasing_run({0, 1, 2, 3}), (std::vector<size_t>{0, 1, 2, 3}));
    EXPECT_EQ(longest_increasing_run({3, 2, 1}).size(), 1u);
    EXPECT_EQ(longest_increasing_run({2, 0, 1, 3}), (std::vector<size_t>{1, 2, 3}));
}

TEST(Diff, MalformedTreesAreInvariantViolations)
{
    auto statics = std::make_shared<const std::vector<std::string>>(std::vector<std::string>{"<p>", "</p>"});
    Rendered broken;
    broken.statics = statics;

    DiffEngine engine;
    EXPECT_THROW(engine.full(broken), std::logic_error);

    Rendered dangling;
    dangling.statics = statics;
    dangling.dynamics.push_back(Dynamic::of_component(42));
    EXPECT_THROW(engine.full(dangling), std::logic_error);
}
