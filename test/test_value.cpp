// test_value.cpp - Tests for the Value model, schemas, builders and JSON
// Module 1: value.h, schema.h, builders.h, serialization.h

#include <catch2/catch_all.hpp>
#include <diffit/builders.h>
#include <diffit/errors.h>
#include <diffit/serialization.h>
#include <diffit/value.h>

#include <chrono>
#include <limits>
#include <memory>
#include <string>

using namespace diffit;

namespace {

RecordTypePtr person_type()
{
    static const auto type = RecordTypeBuilder("Person")
        .field("Name")
        .field("Age")
        .field("CreatedAt")
        .field("Secret", "-")
        .finish();
    return type;
}

Value person(std::string name, int32_t age)
{
    return RecordBuilder(person_type())
        .set("Name", std::move(name))
        .set("Age", age)
        .set("CreatedAt", Timestamp{})
        .set("Secret", "")
        .finish();
}

} // namespace

// ============================================================
// Schema
// ============================================================

TEST_CASE("to_snake_case derives external names", "[value][schema]") {
    REQUIRE(to_snake_case("Name") == "name");
    REQUIRE(to_snake_case("CreatedAt") == "created_at");
    REQUIRE(to_snake_case("userID") == "user_id");
    REQUIRE(to_snake_case("HTTPServer") == "http_server");
    REQUIRE(to_snake_case("ID") == "id");
    REQUIRE(to_snake_case("already_snake") == "already_snake");
}

TEST_CASE("RecordTypeBuilder resolves field descriptors", "[value][schema]") {
    auto type = RecordTypeBuilder("User")
        .identity("ID", "_id")
        .field("DisplayName")
        .field("Password", "-")
        .field("Email", "mail")
        .finish();

    REQUIRE(type->name() == "User");
    REQUIRE(type->field_count() == 4);

    SECTION("aliases and defaults") {
        REQUIRE(type->field(0).external_name == "_id");
        REQUIRE(type->field(1).external_name == "display_name");
        REQUIRE(type->field(3).external_name == "mail");
    }

    SECTION("omitted fields") {
        REQUIRE(type->field(2).omitted);
        REQUIRE_FALSE(type->field(1).omitted);
    }

    SECTION("identity field") {
        REQUIRE(type->identity_index() == std::optional<std::size_t>{0});
        REQUIRE(type->identity_field()->external_name == "_id");
    }

    SECTION("lookup by declared or external name") {
        REQUIRE(type->index_of("Email") == std::optional<std::size_t>{3});
        REQUIRE(type->index_of("mail") == std::optional<std::size_t>{3});
        REQUIRE_FALSE(type->index_of("missing").has_value());
    }
}

TEST_CASE("RecordTypeBuilder rejects invalid schemas", "[value][schema]") {
    SECTION("duplicate external names") {
        auto builder = RecordTypeBuilder("Dup").field("Name").field("Other", "name");
        REQUIRE_THROWS_AS(builder.finish(), std::invalid_argument);
    }

    SECTION("omitted identity field") {
        auto builder = RecordTypeBuilder("Bad").identity("ID", "-");
        REQUIRE_THROWS_AS(builder.finish(), std::invalid_argument);
    }
}

TEST_CASE("Record shapes", "[value][schema]") {
    auto a = RecordTypeBuilder("Point").field("X").field("Y").finish();
    auto b = RecordTypeBuilder("Point").field("X").field("Y").finish();
    auto c = RecordTypeBuilder("Point").field("X").field("Z").finish();
    auto d = RecordTypeBuilder("Vec").field("X").field("Y").finish();

    REQUIRE(same_shape(a, a));
    REQUIRE(same_shape(a, b));
    REQUIRE_FALSE(same_shape(a, c));
    REQUIRE_FALSE(same_shape(a, d));
    REQUIRE_FALSE(same_shape(a, RecordTypePtr{}));
}

// ============================================================
// Builders
// ============================================================

TEST_CASE("RecordBuilder", "[value][builders]") {
    SECTION("fields by declared or external name") {
        auto p = RecordBuilder(person_type())
            .set("name", "Ann")
            .set("Age", 3)
            .set("created_at", Timestamp{})
            .set("Secret", "s")
            .finish();
        REQUIRE(p.at("Name") == Value{"Ann"});
        REQUIRE(p.at("age") == Value{3});
    }

    SECTION("unknown field") {
        RecordBuilder builder(person_type());
        REQUIRE_THROWS_AS(builder.set("Nope", 1), std::invalid_argument);
    }

    SECTION("every field must be set") {
        RecordBuilder builder(person_type());
        builder.set("Name", "Ann");
        REQUIRE_THROWS_AS(builder.finish(), std::invalid_argument);
    }

    SECTION("start from an existing record") {
        auto original = person("Ann", 3);
        auto updated = RecordBuilder(*original.get_if<ValueRecord>()).set("Age", 4).finish();
        REQUIRE(updated.at("Name") == Value{"Ann"});
        REQUIRE(updated.at("Age") == Value{4});
        REQUIRE(original.at("Age") == Value{3});
    }
}

TEST_CASE("MapBuilder and VectorBuilder", "[value][builders]") {
    auto map = MapBuilder().set("a", 1).set("b", "two").finish();
    REQUIRE(map.size() == 2);
    REQUIRE(map.at("b") == Value{"two"});

    auto vec = VectorBuilder().push_back(1).push_back(2).set(0, 10).finish();
    REQUIRE(vec.size() == 2);
    REQUIRE(vec.at(std::size_t{0}) == Value{10});
    REQUIRE(vec.at(std::size_t{5}).is_null());
}

// ============================================================
// Equality
// ============================================================

TEST_CASE("values_equal compares structurally", "[value][equality]") {
    SECTION("scalars of different kinds differ") {
        REQUIRE_FALSE(values_equal(Value{1}, Value{int64_t{1}}));
        REQUIRE_FALSE(values_equal(Value{1}, Value{1.0}));
        REQUIRE(values_equal(Value{"x"}, Value{std::string{"x"}}));
    }

    SECTION("records") {
        REQUIRE(values_equal(person("Ann", 3), person("Ann", 3)));
        REQUIRE_FALSE(values_equal(person("Ann", 3), person("Ann", 4)));
    }

    SECTION("maps ignore insertion order") {
        auto a = MapBuilder().set("x", 1).set("y", 2).finish();
        auto b = MapBuilder().set("y", 2).set("x", 1).finish();
        REQUIRE(values_equal(a, b));
    }

    SECTION("NaN equals NaN") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        REQUIRE(values_equal(Value{nan}, Value{nan}));
        REQUIRE(values_equal(Value::vector({nan}), Value::vector({nan})));
        REQUIRE_FALSE(values_equal(Value{nan}, Value{0.0}));
    }

    SECTION("references compare by target") {
        REQUIRE(values_equal(Value::ref(Value{5}), Value::ref(Value{5})));
        REQUIRE_FALSE(values_equal(Value::ref(Value{5}), Value::ref(Value{6})));
        REQUIRE_FALSE(values_equal(Value::ref(Value{5}), Value::null_ref()));
        REQUIRE(values_equal(Value::null_ref(), Value::null_ref()));
    }

    SECTION("callables compare by function identity") {
        auto fn = Value::callable("double", [](const Value& v) { return v; });
        auto other = Value::callable("double", [](const Value& v) { return v; });
        REQUIRE(values_equal(fn, fn));
        REQUIRE_FALSE(values_equal(fn, other));
    }

    SECTION("cyclic references terminate") {
        auto a = std::make_shared<Value>();
        auto b = std::make_shared<Value>();
        *a = MapBuilder().set("v", 1).set("next", Value::ref(a)).finish();
        *b = MapBuilder().set("v", 1).set("next", Value::ref(b)).finish();

        REQUIRE(values_equal(Value::ref(a), Value::ref(b)));

        // Break the cycles so the allocations are released
        *a = Value{};
        *b = Value{};
    }
}

// ============================================================
// Zero values
// ============================================================

TEST_CASE("zero_of and is_zero", "[value][zero]") {
    REQUIRE(zero_of(Value{42}) == Value{0});
    REQUIRE(zero_of(Value{"text"}) == Value{""});
    REQUIRE(zero_of(Value::vector({1, 2})).size() == 0);
    REQUIRE(zero_of(Value::ref(Value{1})).get_if<ValueRef>()->is_null());

    auto zero_person = zero_of(person("Ann", 3));
    REQUIRE(zero_person.at("Name") == Value{""});
    REQUIRE(zero_person.at("Age") == Value{0});
    REQUIRE(is_zero(zero_person));
    REQUIRE_FALSE(is_zero(person("Ann", 0)));

    REQUIRE(is_zero(Value{false}));
    REQUIRE(is_zero(Value{Duration{0}}));
    REQUIRE(is_zero(Value{Timestamp{}}));
    REQUIRE(is_zero(Value::dynamic(Value{})));
    REQUIRE_FALSE(is_zero(Value::dynamic(Value{1})));
}

// ============================================================
// Detached copies
// ============================================================

TEST_CASE("detach clones reference targets", "[value][detach]") {
    SECTION("mutating the source does not affect the copy") {
        auto target = std::make_shared<Value>(Value{"before"});
        auto original = MapBuilder().set("ref", Value::ref(target)).finish();

        auto copy = detach(original);
        *target = Value{"after"};

        auto* ref = copy.at("ref").get_if<ValueRef>();
        REQUIRE(ref != nullptr);
        REQUIRE(ref->identity() != target.get());
        REQUIRE(*ref->target == Value{"before"});
    }

    SECTION("values without references are shared") {
        auto original = Value::vector({1, 2, 3});
        auto copy = detach(original);
        REQUIRE(copy.get_if<ValueVector>()->impl().root == original.get_if<ValueVector>()->impl().root);
    }

    SECTION("cycles are rejected") {
        auto node = std::make_shared<Value>();
        *node = MapBuilder().set("self", Value::ref(node)).finish();

        REQUIRE_THROWS_AS(detach(Value::ref(node), "loop"), CyclicStructureError);

        *node = Value{};
    }
}

// ============================================================
// Printing and JSON
// ============================================================

TEST_CASE("value_to_string", "[value][print]") {
    REQUIRE(value_to_string(Value{5}) == "5");
    REQUIRE(value_to_string(Value{int64_t{5}}) == "5L");
    REQUIRE(value_to_string(Value{"x"}) == "\"x\"");
    REQUIRE(value_to_string(Value{}) == "null");
    REQUIRE(value_to_string(Value::null_ref()) == "&null");
    REQUIRE(value_to_string(person("Ann", 3)) == "Person{4}");
}

TEST_CASE("to_json", "[value][json]") {
    SECTION("map keys are sorted") {
        auto map = MapBuilder().set("b", 1).set("a", 2).finish();
        REQUIRE(to_json(map, true) == R"({"a":2,"b":1})");
    }

    SECTION("records use external names and skip omitted fields") {
        auto json = to_json(person("Ann", 3), true);
        REQUIRE(json == R"({"name":"Ann","age":3,"created_at":"1970-01-01T00:00:00Z"})");
    }

    SECTION("timestamps and durations") {
        using namespace std::chrono;
        Timestamp ts{seconds{1709294400}};
        REQUIRE(format_timestamp(ts) == "2024-03-01T12:00:00Z");
        REQUIRE(format_timestamp(ts + milliseconds{500}) == "2024-03-01T12:00:00.5Z");
        REQUIRE(to_json(Value{Duration{1500}}, true) == "1500");
    }

    SECTION("references write their target") {
        REQUIRE(to_json(Value::ref(Value{"x"}), true) == R"("x")");
        REQUIRE(to_json(Value::null_ref(), true) == "null");
    }

    SECTION("strings are escaped") {
        REQUIRE(json_quote("a\"b\n") == R"("a\"b\n")");
    }
}

TEST_CASE("from_json", "[value][json]") {
    std::string error;
    auto parsed = from_json(R"({"name": "Ann", "tags": ["a", "b"], "n": 5000000000})", &error);
    REQUIRE(error.empty());
    REQUIRE(parsed.at("name") == Value{"Ann"});
    REQUIRE(parsed.at("tags").size() == 2);
    REQUIRE(parsed.at("n") == Value{int64_t{5000000000}});

    auto invalid = from_json("{\"a\": }", &error);
    REQUIRE(invalid.is_null());
    REQUIRE_FALSE(error.empty());
}

TEST_CASE("from_json edge cases", "[value][json]") {
    std::string error;

    SECTION("rendered values read back") {
        auto original = MapBuilder()
            .set("name", "Ann \"A\"\n")
            .set("tags", Value::vector({"x", "y"}))
            .set("count", int64_t{5'000'000'000})
            .set("ratio", 0.25)
            .set("active", true)
            .set("none", Value{})
            .finish();
        auto parsed = from_json(to_json(original, false), &error);
        REQUIRE(error.empty());
        REQUIRE(parsed == original);
    }

    SECTION("unicode escapes") {
        REQUIRE(from_json(R"("\u00e9")") == Value{"\xC3\xA9"});
        REQUIRE(from_json(R"("\ud83d\ude00")") == Value{"\xF0\x9F\x98\x80"});
    }

    SECTION("malformed escapes are reported, not thrown") {
        auto bad_hex = from_json(R"("\uZZZZ")", &error);
        REQUIRE(bad_hex.is_null());
        REQUIRE(error.find("unicode") != std::string::npos);

        error.clear();
        REQUIRE(from_json(R"("\ud83d")", &error).is_null());
        REQUIRE(error.find("surrogate") != std::string::npos);
    }

    SECTION("numbers") {
        REQUIRE(from_json("-7") == Value{-7});
        REQUIRE(from_json("1e3") == Value{1000.0});
        REQUIRE(from_json("99999999999999999999") == Value{1e20});
        REQUIRE(from_json("-", &error).is_null());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("trailing characters") {
        REQUIRE(from_json("[1] x", &error).is_null());
        REQUIRE(error.find("trailing") != std::string::npos);
    }
}
