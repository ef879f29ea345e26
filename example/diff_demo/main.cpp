// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file main.cpp
/// @brief Demonstrates diffit::diff on record, map and sequence values
///
/// This example shows:
/// - Record schemas with external names and identity fields
/// - Update, insert and delete patches
/// - The four sequence strategies
/// - Zero-value policies and $inc detection
/// - Pointer-sharing diagnostics

#include <diffit/builders.h>
#include <diffit/diff.h>
#include <diffit/serialization.h>

#include <iostream>
#include <memory>
#include <string>

using namespace diffit;

// ============================================================================
// Schemas
// ============================================================================

namespace {

RecordTypePtr order_line_type()
{
    static const auto type = RecordTypeBuilder("OrderLine")
        .identity("SKU")
        .field("Qty")
        .finish();
    return type;
}

RecordTypePtr order_type()
{
    static const auto type = RecordTypeBuilder("Order")
        .identity("ID", "_id")
        .field("Customer")
        .field("Total")
        .field("Lines")
        .field("Notes")
        .field("Tags")
        .field("CachedView", "-")
        .finish();
    return type;
}

Value order_line(std::string sku, int32_t qty)
{
    return RecordBuilder(order_line_type()).set("SKU", std::move(sku)).set("Qty", qty).finish();
}

Value make_order()
{
    return RecordBuilder(order_type())
        .set("ID", "ord-1001")
        .set("Customer", "Ann")
        .set("Total", int64_t{12'000'000'000})
        .set("Lines", Value::vector({order_line("A-1", 2), order_line("B-7", 1)}))
        .set("Notes", "leave at the door")
        .set("Tags", Value::vector({"gift"}))
        .set("CachedView", "")
        .finish();
}

void print_result(const std::string& title, const DiffResult& result)
{
    std::cout << "--- " << title << " ---\n";
    std::cout << result.patch.to_display_string() << "\n";
    for (const auto& diagnostic : result.diagnostics) {
        std::cout << "  ! " << diagnostic.message << "\n";
    }
    std::cout << "\n";
}

} // namespace

// ============================================================================
// Demos
// ============================================================================

void demo_update()
{
    auto before = make_order();
    auto after = RecordBuilder(*before.get_if<ValueRecord>())
        .set("Customer", "Ann B.")
        .set("Total", int64_t{12'000'000'050})
        .set("Lines", Value::vector({order_line("A-1", 3), order_line("B-7", 1)}))
        .set("Notes", "")
        .finish();

    print_result("update (smart, as_set)", diff(before, after));

    auto tuned = DiffOptions{}
        .with_array_strategy(ArrayStrategy::merge)
        .with_zero_value_policy(ZeroValuePolicy::as_unset)
        .with_numeric_optimization();
    auto result = diff(before, after, tuned);
    print_result("update (merge, as_unset, $inc)", result);

    std::cout << "update document: " << to_json(result.patch.to_update_document(), true) << "\n";
    std::cout << "array filters:   " << to_json(result.patch.array_filters_document(), true) << "\n\n";
}

void demo_insert_delete()
{
    auto order = make_order();
    print_result("insert", diff(Operand::absent(), order));
    print_result("delete", diff(order, Operand::absent()));
}

void demo_sequences()
{
    auto before = MapBuilder().set("tags", Value::vector({"gift"})).finish();
    auto after = MapBuilder().set("tags", Value::vector({"gift", "express"})).finish();

    for (auto strategy : {ArrayStrategy::replace, ArrayStrategy::smart,
                          ArrayStrategy::append, ArrayStrategy::merge}) {
        auto result = diff(before, after, DiffOptions{}.with_array_strategy(strategy));
        print_result(std::string{"tags with "} + std::string{to_string(strategy)}, result);
    }
}

void demo_sharing()
{
    auto address = std::make_shared<Value>(MapBuilder().set("city", "Oslo").finish());
    auto before = MapBuilder().set("shipping", Value::ref(address)).finish();
    auto after = MapBuilder().set("shipping", Value::ref(address)).set("billing", Value::ref(address)).finish();

    print_result("pointer sharing", diff(before, after, DiffOptions{}.with_pointer_sharing_detection()));
}

void demo_errors()
{
    try {
        (void)diff(Value{1}, Value{"one"});
    } catch (const DiffError& e) {
        std::cout << "--- error ---\n" << to_string(e.kind()) << ": " << e.what() << "\n\n";
    }
}

int main()
{
    std::cout << "=== diffit demo ===\n\n";

    demo_update();
    demo_insert_delete();
    demo_sequences();
    demo_sharing();
    demo_errors();

    return 0;
}
