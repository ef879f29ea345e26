// test_arrays.cpp - Tests for sequence reconciliation strategies
// Module 6: array_reconciler.h

#include <catch2/catch_all.hpp>
#include <diffit/array_reconciler.h>
#include <diffit/builders.h>
#include <diffit/diff.h>

#include <string>

using namespace diffit;

namespace {

Value doc(Value items)
{
    return MapBuilder().set("items", std::move(items)).finish();
}

Value item(int32_t id, std::string v)
{
    return MapBuilder().set("id", id).set("v", std::move(v)).finish();
}

RecordTypePtr line_type()
{
    static const auto type = RecordTypeBuilder("Line")
        .identity("SKU")
        .field("Qty")
        .field("Note")
        .finish();
    return type;
}

Value line(std::string sku, int32_t qty, std::string note = "")
{
    return RecordBuilder(line_type())
        .set("SKU", std::move(sku))
        .set("Qty", qty)
        .set("Note", std::move(note))
        .finish();
}

DiffOptions with_strategy(ArrayStrategy strategy)
{
    return DiffOptions{}.with_array_strategy(strategy);
}

} // namespace

// ============================================================
// Empty to one element
// ============================================================

TEST_CASE("Adding to an empty sequence", "[arrays][scenario]") {
    const auto old_val = doc(Value::vector({}));
    const auto new_val = doc(Value::vector({"a"}));

    SECTION("replace and smart set the whole sequence") {
        for (auto strategy : {ArrayStrategy::replace, ArrayStrategy::smart}) {
            auto result = diff(old_val, new_val, with_strategy(strategy));
            REQUIRE(result.patch.operation(Operator::set).at("items") == Value::vector({"a"}));
            REQUIRE(result.patch.operation(Operator::push).empty());
        }
    }

    SECTION("append and merge push the new element") {
        for (auto strategy : {ArrayStrategy::append, ArrayStrategy::merge}) {
            auto result = diff(old_val, new_val, with_strategy(strategy));
            REQUIRE(result.patch.operation(Operator::push).at("items") == Value::vector({"a"}));
            REQUIRE(result.patch.operation(Operator::set).empty());
            REQUIRE(result.patch.to_update_document().at("$push").at("items").at("$each") ==
                    Value::vector({"a"}));
        }
    }
}

// ============================================================
// Replace
// ============================================================

TEST_CASE("Replace sets the whole sequence", "[arrays][replace]") {
    auto result = diff(doc(Value::vector({1, 2, 3})), doc(Value::vector({1, 5, 3})),
                       with_strategy(ArrayStrategy::replace));
    REQUIRE(result.patch.operation(Operator::set).at("items") == Value::vector({1, 5, 3}));
    REQUIRE_FALSE(result.patch.has_array_filters());

    SECTION("unchanged sequences emit nothing") {
        auto same = diff(doc(Value::vector({1, 2})), doc(Value::vector({1, 2})),
                         with_strategy(ArrayStrategy::replace));
        REQUIRE(same.patch.is_empty());
    }
}

// ============================================================
// Smart
// ============================================================

TEST_CASE("Smart uses position filters", "[arrays][smart]") {
    auto old_val = doc(Value::vector({line("A", 1), line("B", 2), line("C", 3), line("D", 4)}));
    auto new_val = doc(Value::vector({line("A", 1), line("B", 5), line("C", 3), line("D", 7)}));

    auto result = diff(old_val, new_val);

    const auto& set = result.patch.operation(Operator::set);
    REQUIRE(set.size() == 2);
    REQUIRE(set.at("items.$[elem0].qty") == Value{5});
    REQUIRE(set.at("items.$[elem1].qty") == Value{7});

    const auto& filters = result.patch.array_filters();
    REQUIRE(filters.size() == 2);
    REQUIRE(filters[0].to_display_string() == "elem0._index == 1");
    REQUIRE(filters[1].to_display_string() == "elem1._index == 3");

    SECTION("too many changes fall back to replace") {
        auto strict = diff(old_val, new_val, DiffOptions{}.with_smart_max_changed_ratio(0.25));
        REQUIRE(strict.patch.operation(Operator::set).count("items") == 1);
        REQUIRE(strict.patch.operation(Operator::set).size() == 1);
        REQUIRE_FALSE(strict.patch.has_array_filters());
    }

    SECTION("the ratio bound is inclusive") {
        auto half = diff(old_val, new_val, DiffOptions{}.with_smart_max_changed_ratio(0.5));
        REQUIRE(half.patch.array_filters().size() == 2);
    }

    SECTION("different lengths fall back to replace") {
        auto longer = doc(Value::vector({line("A", 1), line("B", 2), line("C", 3), line("D", 4), line("E", 5)}));
        auto grown = diff(old_val, longer);
        REQUIRE(grown.patch.operation(Operator::set).count("items") == 1);
        REQUIRE_FALSE(grown.patch.has_array_filters());
    }

    SECTION("scalar elements are set through the placeholder") {
        auto scalars = diff(doc(Value::vector({"x", "y"})), doc(Value::vector({"x", "z"})));
        REQUIRE(scalars.patch.operation(Operator::set).at("items.$[elem0]") == Value{"z"});
        REQUIRE(scalars.patch.array_filters().front().to_display_string() == "elem0._index == 1");
    }
}

TEST_CASE("Placeholders of silent elements are released", "[arrays][smart]") {
    auto old_val = doc(Value::vector({line("A", 1, "old"), line("B", 2)}));
    auto new_val = doc(Value::vector({line("A", 1, "new"), line("B", 9)}));

    auto result = diff(old_val, new_val, DiffOptions{}.with_ignored_field("items.note"));

    REQUIRE(result.patch.operation(Operator::set).size() == 1);
    REQUIRE(result.patch.operation(Operator::set).at("items.$[elem0].qty") == Value{9});
    REQUIRE(result.patch.array_filters().size() == 1);
    REQUIRE(result.patch.array_filters().front().to_display_string() == "elem0._index == 1");
}

// ============================================================
// Append
// ============================================================

TEST_CASE("Append pushes a suffix", "[arrays][append]") {
    const auto options = with_strategy(ArrayStrategy::append);

    SECTION("old is a prefix") {
        auto result = diff(doc(Value::vector({1, 2})), doc(Value::vector({1, 2, 3, 4})), options);
        REQUIRE(result.patch.operation(Operator::push).at("items") == Value::vector({3, 4}));
    }

    SECTION("a changed prefix falls back") {
        auto result = diff(doc(Value::vector({1, 2})), doc(Value::vector({1, 9, 3})), options);
        REQUIRE(result.patch.operation(Operator::set).at("items") == Value::vector({1, 9, 3}));
        REQUIRE(result.patch.operation(Operator::push).empty());
    }

    SECTION("a shorter sequence falls back") {
        auto result = diff(doc(Value::vector({1, 2, 3})), doc(Value::vector({1, 2})), options);
        REQUIRE(result.patch.operation(Operator::set).at("items") == Value::vector({1, 2}));
    }
}

// ============================================================
// Merge
// ============================================================

TEST_CASE("Merge matches elements by identity", "[arrays][merge]") {
    const auto old_val = doc(Value::vector({item(1, "a"), item(2, "b")}));
    const auto new_val = doc(Value::vector({item(1, "a*"), item(2, "b")}));

    auto options = with_strategy(ArrayStrategy::merge).with_identity_extractor(identity_field("id"));
    auto result = diff(old_val, new_val, options);

    REQUIRE(result.patch.operation(Operator::set).size() == 1);
    REQUIRE(result.patch.operation(Operator::set).at("items.$[elem0].v") == Value{"a*"});
    REQUIRE(result.patch.array_filters().size() == 1);
    REQUIRE(result.patch.array_filters().front().to_display_string() == "elem0.id == 1");
    REQUIRE(result.patch.array_filters_document().at(std::size_t{0}).at("elem0.id") == Value{1});

    SECTION("without an identity field the change falls back") {
        auto plain = diff(old_val, new_val, with_strategy(ArrayStrategy::merge));
        REQUIRE(plain.patch.operation(Operator::set).count("items") == 1);
        REQUIRE_FALSE(plain.patch.has_array_filters());
    }
}

TEST_CASE("Merge uses the record identity field", "[arrays][merge]") {
    const auto options = with_strategy(ArrayStrategy::merge);
    const auto old_val = doc(Value::vector({line("A", 1), line("B", 2)}));

    SECTION("changed elements get identity filters") {
        auto result = diff(old_val, doc(Value::vector({line("A", 1), line("B", 3)})), options);
        REQUIRE(result.patch.operation(Operator::set).at("items.$[elem0].qty") == Value{3});
        REQUIRE(result.patch.array_filters().front().to_display_string() == R"(elem0.sku == "B")");
    }

    SECTION("trailing additions are pushed") {
        auto result = diff(old_val, doc(Value::vector({line("A", 1), line("B", 2), line("C", 1)})), options);
        REQUIRE(result.patch.operation(Operator::push).at("items") == Value::vector({line("C", 1)}));
    }

    SECTION("removed elements fall back") {
        auto result = diff(old_val, doc(Value::vector({line("A", 1)})), options);
        REQUIRE(result.patch.operation(Operator::set).at("items") == Value::vector({line("A", 1)}));
    }

    SECTION("reordered elements fall back") {
        auto result = diff(old_val, doc(Value::vector({line("B", 2), line("A", 1)})), options);
        REQUIRE(result.patch.operation(Operator::set).count("items") == 1);
    }

    SECTION("additions mixed with changes fall back") {
        auto result = diff(old_val, doc(Value::vector({line("A", 5), line("B", 2), line("C", 1)})), options);
        REQUIRE(result.patch.operation(Operator::set).count("items") == 1);
        REQUIRE(result.patch.operation(Operator::push).empty());
        REQUIRE_FALSE(result.patch.has_array_filters());
    }

    SECTION("changes to an element with a repeated identity fall back") {
        const auto repeated = doc(Value::vector({line("A", 1), line("A", 2)}));
        auto result = diff(repeated, doc(Value::vector({line("A", 1), line("A", 3)})), options);
        REQUIRE(result.patch.operation(Operator::set).size() == 1);
        REQUIRE(result.patch.operation(Operator::set).at("items") ==
                Value::vector({line("A", 1), line("A", 3)}));
        REQUIRE_FALSE(result.patch.has_array_filters());
    }

    SECTION("a repeated identity elsewhere does not block a unique one") {
        const auto mixed = doc(Value::vector({line("A", 1), line("A", 2), line("B", 5)}));
        auto result = diff(mixed, doc(Value::vector({line("A", 1), line("A", 2), line("B", 6)})), options);
        REQUIRE(result.patch.operation(Operator::set).at("items.$[elem0].qty") == Value{6});
        REQUIRE(result.patch.array_filters().front().to_display_string() == R"(elem0.sku == "B")");
    }

    SECTION("interleaved additions fall back") {
        auto result = diff(old_val, doc(Value::vector({line("A", 1), line("Z", 0), line("B", 2)})), options);
        REQUIRE(result.patch.operation(Operator::set).count("items") == 1);
    }
}

TEST_CASE("merge_partition", "[arrays][merge]") {
    auto old_vec = *Value::vector({line("A", 1), line("B", 2), line("C", 3)}).get_if<ValueVector>();
    auto new_vec = *Value::vector({line("A", 1), line("C", 4), line("D", 0)}).get_if<ValueVector>();

    auto partition = merge_partition(old_vec, new_vec);

    REQUIRE(partition.matched_unchanged == std::vector<std::size_t>{0});
    REQUIRE(partition.matched_changed == std::vector<std::size_t>{1});
    REQUIRE(partition.new_only == std::vector<std::size_t>{2});
    REQUIRE(partition.matched_old == std::vector<std::size_t>{0, 2});
    REQUIRE(partition.old_only == std::vector<std::size_t>{1});
    REQUIRE_FALSE(partition.order_preserved());

    SECTION("every index lands in exactly one class") {
        REQUIRE(partition.matched_unchanged.size() + partition.matched_changed.size() +
                partition.new_only.size() == new_vec.size());
        REQUIRE(partition.matched_old.size() + partition.old_only.size() == old_vec.size());
    }

    SECTION("duplicate identities pair in order") {
        auto dup_old = *Value::vector({1, 1}).get_if<ValueVector>();
        auto dup_new = *Value::vector({1, 1, 1}).get_if<ValueVector>();
        auto dup = merge_partition(dup_old, dup_new);
        REQUIRE(dup.new_to_old[0] == std::optional<std::size_t>{0});
        REQUIRE(dup.new_to_old[1] == std::optional<std::size_t>{1});
        REQUIRE(dup.new_only == std::vector<std::size_t>{2});
        REQUIRE(dup.order_preserved());
    }
}

TEST_CASE("resolve_identity", "[arrays][merge]") {
    SECTION("record identity field") {
        auto id = resolve_identity(line("A", 1), {});
        REQUIRE(id.field == "sku");
        REQUIRE(id.value == Value{"A"});
    }

    SECTION("extractor wins") {
        auto id = resolve_identity(item(7, "x"), identity_field("v"));
        REQUIRE(id.field == "v");
        REQUIRE(id.value == Value{"x"});
    }

    SECTION("whole element otherwise") {
        auto id = resolve_identity(Value{42}, {});
        REQUIRE(id.field.empty());
        REQUIRE(id.value == Value{42});
    }
}

TEST_CASE("Sequences nested in changed elements", "[arrays]") {
    auto old_val = doc(Value::vector({MapBuilder().set("tags", Value::vector({"a"})).finish()}));
    auto new_val = doc(Value::vector({MapBuilder().set("tags", Value::vector({"a", "b"})).finish()}));

    auto result = diff(old_val, new_val, with_strategy(ArrayStrategy::append));
    REQUIRE(result.patch.operation(Operator::set).at("items") ==
            Value::vector({MapBuilder().set("tags", Value::vector({"a", "b"})).finish()}));

    auto smart = diff(old_val, new_val);
    REQUIRE(smart.patch.operation(Operator::set).at("items.$[elem0].tags") == Value::vector({"a", "b"}));
}
