// File: tests/unit/test_changed.cc
// Purpose: Verify change tracking over assigns and nested map fields.
// Key invariants: Equal values never mark a key; nested changes stay narrowed to
//                 the fields that differ; locals are always treated as changed.
// Ownership/Lifetime: Value maps and binding sets are owned by each test.

#include <gtest/gtest.h>

#include "runtime/changed.h"
#include "cli/error.h"

#include <nlohmann/json.hpp>

namespace
{
AssignDependency path(const std::string &key, std::vector<std::string> fields = {})
{
    return AssignDependency{key, std::move(fields)};
}

Value user(const std::string &name, const std::string &city)
{
    return Value::map({{"name", Value(name)}, {"address", Value::map({{"city", Value(city)}})}});
}
} // namespace

TEST(ChangedSet, EmptyAffectsNothing)
{
    ChangedSet changed;
    EXPECT_TRUE(changed.empty());
    EXPECT_FALSE(changed.affects(path("a")));

    DependencySet deps;
    EXPECT_FALSE(changed.affects(deps));
}

TEST(ChangedSet, EverythingAffectsAll)
{
    ChangedSet all = ChangedSet::everything();
    EXPECT_TRUE(all.all());
    EXPECT_FALSE(all.empty());
    EXPECT_TRUE(all.contains("anything"));
    EXPECT_TRUE(all.affects(path("x", {"y"})));
    EXPECT_EQ(all.to_string(), "*");
}

TEST(ChangedSet, LocalsAreAlwaysChanged)
{
    ChangedSet changed;
    DependencySet deps;
    deps.locals.insert("item");
    EXPECT_TRUE(changed.affects(deps));
}

TEST(ChangedSet, NestedEntriesNarrowFieldReads)
{
    ChangedSet address;
    address.mark("city");
    ChangedSet sub;
    sub.mark_nested("address", address);
    ChangedSet changed;
    changed.mark_nested("user", sub);

    EXPECT_TRUE(changed.contains("user"));
    EXPECT_TRUE(changed.affects(path("user")));
    EXPECT_TRUE(changed.affects(path("user", {"address"})));
    EXPECT_TRUE(changed.affects(path("user", {"address", "city"})));
    EXPECT_FALSE(changed.affects(path("user", {"name"})));
    EXPECT_FALSE(changed.affects(path("user", {"address", "zip"})));
    EXPECT_EQ(changed.to_string(), "{user: {address: {city}}}");
}

TEST(ChangedSet, WholeKeyChangeCoversEveryField)
{
    ChangedSet changed;
    changed.mark("user");
    ChangedSet sub;
    sub.mark("name");
    changed.mark_nested("user", sub);

    EXPECT_EQ(changed.nested("user"), nullptr);
    EXPECT_TRUE(changed.affects(path("user", {"email"})));
}

TEST(ChangedSet, MergeUnionsEntries)
{
    ChangedSet a;
    a.mark("x");
    ChangedSet b;
    b.mark("y");
    a.merge(b);

    EXPECT_TRUE(a.contains("x"));
    EXPECT_TRUE(a.contains("y"));
    EXPECT_EQ(a.keys().size(), 2u);

    a.clear();
    EXPECT_TRUE(a.empty());
}

TEST(ChangedSet, BetweenComparesMapsFieldByField)
{
    ChangedSet same = ChangedSet::between(user("Ada", "London"), user("Ada", "London"));
    EXPECT_TRUE(same.empty());

    ChangedSet moved = ChangedSet::between(user("Ada", "London"), user("Ada", "Paris"));
    EXPECT_FALSE(moved.contains("name"));
    EXPECT_TRUE(moved.affects(path("address", {"city"})));

    ChangedSet scalar = ChangedSet::between(Value(1), Value(2));
    EXPECT_TRUE(scalar.all());
}

TEST(BindingSet, InitialValuesAreChanged)
{
    BindingSet bindings({{"a", Value(1)}, {"b", Value("x")}});
    EXPECT_TRUE(bindings.changed().contains("a"));
    EXPECT_TRUE(bindings.changed().contains("b"));

    bindings.clear_changed();
    EXPECT_TRUE(bindings.changed().empty());
}

TEST(BindingSet, AssigningAnEqualValueIsNotAChange)
{
    BindingSet bindings({{"name", Value("Ada")}});
    bindings.clear_changed();

    bindings.assign("name", Value("Ada"));
    EXPECT_TRUE(bindings.changed().empty());

    bindings.assign("name", Value("Grace"));
    EXPECT_TRUE(bindings.changed().contains("name"));
    EXPECT_EQ(bindings.get("name")->as_string(), "Grace");
}

TEST(BindingSet, MapAssignsTrackChangedFields)
{
    BindingSet bindings({{"user", user("Ada", "London")}});
    bindings.clear_changed();

    bindings.assign("user", user("Grace", "London"));
    EXPECT_TRUE(bindings.changed().affects(path("user", {"name"})));
    EXPECT_FALSE(bindings.changed().affects(path("user", {"address", "city"})));
}

TEST(BindingSet, ForceAndRemoveAlwaysMark)
{
    BindingSet bindings({{"a", Value(1)}});
    bindings.clear_changed();

    bindings.force("a", Value(1));
    EXPECT_TRUE(bindings.changed().contains("a"));

    bindings.clear_changed();
    bindings.remove("a");
    EXPECT_TRUE(bindings.changed().contains("a"));
    EXPECT_EQ(bindings.get("a"), nullptr);

    bindings.clear_changed();
    bindings.remove("missing");
    EXPECT_TRUE(bindings.changed().empty());
}

TEST(BindingSet, AssignNewOnlyFillsMissingKeys)
{
    BindingSet bindings({{"user", Value("Ada")}});
    bindings.clear_changed();

    int calls = 0;
    bindings.assign_new("user", [&](const ValueMap &) {
        calls++;
        return Value("Grace");
    });
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(bindings.get("user")->as_string(), "Ada");
    EXPECT_TRUE(bindings.changed().empty());

    bindings.assign_new("greeting", [&](const ValueMap &current) {
        calls++;
        return Value("Hi " + current.at("user").as_string());
    });
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bindings.get("greeting")->as_string(), "Hi Ada");
    EXPECT_TRUE(bindings.changed("greeting"));
    EXPECT_FALSE(bindings.changed("user"));
}

TEST(BindingSet, UpdateGoesThroughAssign)
{
    BindingSet bindings({{"count", Value(1)}});
    bindings.clear_changed();

    bindings.update("count", [](const Value &v) { return Value(v.as_int() * 1); });
    EXPECT_FALSE(bindings.changed("count"));

    bindings.update("count", [](const Value &v) { return Value(v.as_int() + 1); });
    EXPECT_TRUE(bindings.changed("count"));
    EXPECT_EQ(bindings.get("count")->as_int(), 2);

    EXPECT_THROW(bindings.update("missing", [](const Value &v) { return v; }), RenderError);
}

TEST(BindingSet, ChangedReportsMarkedKeys)
{
    BindingSet bindings;
    EXPECT_FALSE(bindings.changed("x"));

    bindings.assign("x", Value(1));
    EXPECT_TRUE(bindings.changed("x"));
    EXPECT_FALSE(bindings.changed("y"));
}

TEST(BindingSet, AssignsToAttributesDropsReservedKeys)
{
    ValueMap assigns = {{"href", Value("/")},
                        {"new_window", Value(true)},
                        {"inner_block", Value::list({})},
                        {"__slot__", Value::atom("col")},
                        {"class", Value("link")}};

    ValueMap attrs = assigns_to_attributes(assigns, {"new_window"});
    ASSERT_EQ(attrs.size(), 2u);
    EXPECT_EQ(attrs.at("href").as_string(), "/");
    EXPECT_EQ(attrs.at("class").as_string(), "link");

    EXPECT_EQ(assigns_to_attributes(assigns).size(), 3u);
}

TEST(BindingSet, LoadsFromJson)
{
    auto json = nlohmann::json::parse(R"({"n": 3, "f": 1.5, "ok": true, "tags": ["a", "b"], "user": {"name": "Ada"}, "none": null})");
    BindingSet bindings = BindingSet::from_json(json);

    EXPECT_EQ(bindings.get("n")->as_int(), 3);
    EXPECT_DOUBLE_EQ(bindings.get("f")->as_float(), 1.5);
    EXPECT_TRUE(bindings.get("ok")->as_bool());
    EXPECT_EQ(bindings.get("tags")->as_list().size(), 2u);
    EXPECT_EQ(bindings.get("user")->get("name")->as_string(), "Ada");
    EXPECT_TRUE(bindings.get("none")->is_nil());
    EXPECT_TRUE(bindings.changed().contains("user"));
}
