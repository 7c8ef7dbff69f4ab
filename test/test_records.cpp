#include <catch2/catch_all.hpp>

#include "conform/conform.hpp"

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <type_traits>

using namespace Conform;

using code = ConversionError::code;

namespace {

    std::shared_ptr<const record_type> make_point(json_support json = json_support::both) {
        return record_type::builder{ "Point" }
            .add({ .name = "x", .field_type = type::integral() })
            .add({ .name = "y", .field_type = type::integral(), .default_value = value{ 0 } })
            .add({ .name = "label", .field_type = type::text(), .optional = true })
            .json(json)
            .build();
    }

    tree point_data(std::int64_t x, std::int64_t y) {
        tree t = tree::make_object();
        t["x"] = x;
        t["y"] = y;
        return t;
    }
}


TEST_CASE("Record Builder Rejects Malformed Schemas") {
    REQUIRE_THROWS_AS(record_type::builder{ "" }.build(), std::invalid_argument);
    REQUIRE_THROWS_AS(record_type::builder{ "R" }.add({ .name = "" }).build(), std::invalid_argument);
    REQUIRE_THROWS_AS(record_type::builder{ "R" }.add({ .name = "a" }).add({ .name = "a" }).build(), std::invalid_argument);
}

TEST_CASE("Record Types Come Only From the Builder") {
    STATIC_REQUIRE_FALSE(std::is_constructible_v<record_type, std::string, std::vector<field>, json_support>);

    auto point = make_point();
    REQUIRE(point.use_count() == 1);
    REQUIRE(point->descriptor().record_schema() == point);
}

TEST_CASE("Record Construction Applies Defaults") {
    auto point = make_point();
    auto p = point->construct({ { "x", 1 } });
    REQUIRE(p);
    REQUIRE(p->is_record());

    const record& r = p->as_record();
    REQUIRE(*r.get("x") == value{ 1 });
    REQUIRE(*r.get("y") == value{ 0 });
    REQUIRE(r.get("label")->is_none());
    REQUIRE(r.get("z") == nullptr);
    REQUIRE(r.repr() == "Point(x=1, y=0, label=none)");
}

TEST_CASE("Record Construction Converts Fields") {
    auto point = make_point();
    auto p = point->construct({ { "x", value::fixed(std::uint8_t{ 4 }) }, { "y", value::fixed(std::int64_t{ -1 }) } });
    REQUIRE(p);
    REQUIRE(p->as_record().get("x")->is_integer());
    REQUIRE(p->as_record().get("y")->as_integer() == -1);
}

TEST_CASE("Record Construction Reports Missing and Unknown Fields") {
    auto point = make_point();

    auto missing = point->construct({ { "y", 2 } });
    REQUIRE_FALSE(missing);
    REQUIRE(missing.error().errc == code::missing_field);
    REQUIRE(format_path(missing.error().path) == R"($["x"])");

    auto unknown = point->construct({ { "x", 1 }, { "z", 2 } });
    REQUIRE_FALSE(unknown);
    REQUIRE(unknown.error().errc == code::unknown_field);

    auto wrong = point->construct({ { "x", "one" } });
    REQUIRE_FALSE(wrong);
    REQUIRE(wrong.error().errc == code::type_mismatch);
    REQUIRE(wrong.error().path.size() == 1);
    REQUIRE(wrong.error().path[0] == value{ "x" });
}

TEST_CASE("Fields Without Conversion Are Validated as Given") {
    auto rt = record_type::builder{ "Raw" }
        .add({ .name = "n", .field_type = type::integral(), .convert_type = false })
        .add({ .name = "any", .field_type = type::integral(), .validate_type = false, .convert_type = false })
        .build();

    auto kept = rt->construct({ { "n", 1 }, { "any", "free" } });
    REQUIRE(kept);
    REQUIRE(*kept->as_record().get("any") == value{ "free" });

    auto rejected = rt->construct({ { "n", value::fixed(std::int16_t{ 1 }) }, { "any", 1 } });
    REQUIRE_FALSE(rejected);
    REQUIRE(rejected.error().errc == code::type_mismatch);
}

TEST_CASE("Record Descriptors Match Their Own Schema Only") {
    auto point = make_point();
    auto other = make_point();
    auto p = point->construct({ { "x", 1 } });
    REQUIRE(p);

    REQUIRE(is_instance(*p, point->descriptor()));
    REQUIRE_FALSE(is_instance(*p, other->descriptor()));
    REQUIRE(point->descriptor() == type::record(point));
    REQUIRE(point->descriptor() != other->descriptor());
}

TEST_CASE("Record Serializes to an Object") {
    auto point = make_point();
    auto p = point->construct({ { "x", 1 }, { "y", 2 } });
    REQUIRE(p);

    auto t = to_serialized(*p);
    REQUIRE(t);
    REQUIRE(t->at("x").as_integer() == 1);
    REQUIRE(t->at("y").as_integer() == 2);
    REQUIRE(t->at("label").is_null());
    REQUIRE(dump(*t) == R"({"label":null,"x":1,"y":2})");
}

TEST_CASE("Fields Can Be Left Out of Serialization") {
    auto rt = record_type::builder{ "Session" }
        .add({ .name = "user", .field_type = type::text() })
        .add({ .name = "token", .field_type = type::text(), .serialize = false })
        .json(json_support::to)
        .build();

    auto s = rt->construct({ { "user", "ada" }, { "token", "secret" } });
    REQUIRE(s);
    auto t = to_serialized(*s);
    REQUIRE(t);
    REQUIRE(t->find("token") == nullptr);
    REQUIRE(t->at("user").as_string() == "ada");
}

TEST_CASE("Records Without Serialization Support Refuse") {
    auto point = make_point(json_support::from);
    auto p = point->construct({ { "x", 1 } });
    REQUIRE(p);

    auto t = to_serialized(value::list({ *p }));
    REQUIRE_FALSE(t);
    REQUIRE(t.error().errc == code::not_serializable);
    REQUIRE(format_path(t.error().path) == "$[0]");
}

TEST_CASE("Record Deserializes From an Object") {
    auto point = make_point();

    auto p = from_serialized(point->descriptor(), point_data(3, 4));
    REQUIRE(p);
    REQUIRE(p->as_record().schema() == point);
    REQUIRE(*p->as_record().get("x") == value{ 3 });
    REQUIRE(p->as_record().get("label")->is_none());
}

TEST_CASE("Null Is Accepted for Optional Fields") {
    auto point = make_point();
    tree data = point_data(1, 2);
    data["label"] = nullptr;

    auto p = from_serialized(point->descriptor(), data);
    REQUIRE(p);
    REQUIRE(p->as_record().get("label")->is_none());
}

TEST_CASE("Unknown Keys Depend on Leniency") {
    auto point = make_point();
    tree data = point_data(1, 2);
    data["z"] = 9;

    auto strict = from_serialized(point->descriptor(), data);
    REQUIRE_FALSE(strict);
    REQUIRE(strict.error().errc == code::unknown_field);
    REQUIRE(strict.error().msg == R"(unknown key "z" in data for Point)");

    auto lenient = from_serialized(point->descriptor(), data, { .lenient = true });
    REQUIRE(lenient);
    REQUIRE(*lenient->as_record().get("y") == value{ 2 });
}

TEST_CASE("Deserialization Reports Missing Fields") {
    auto point = make_point();
    tree data = tree::make_object();
    data["y"] = 1;

    auto r = from_serialized(point->descriptor(), data);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == code::missing_field);
}

TEST_CASE("Deserialization Requires an Object") {
    auto point = make_point();
    tree data = tree::make_array();

    auto r = from_serialized(point->descriptor(), data);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == code::type_mismatch);
}

TEST_CASE("Records Without Deserialization Support Are Matched Structurally") {
    auto point = make_point(json_support::to);
    auto r = from_serialized(point->descriptor(), point_data(1, 2));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == code::type_mismatch);
}

TEST_CASE("Nested Records Round-Trip") {
    auto point = make_point();
    auto line = record_type::builder{ "Line" }
        .add({ .name = "start", .field_type = point->descriptor() })
        .add({ .name = "end", .field_type = point->descriptor() })
        .add({ .name = "tags", .field_type = type::dict(type::integral(), type::text()), .default_value = value::dict() })
        .json(json_support::both)
        .build();

    auto a = point->construct({ { "x", 0 } });
    auto b = point->construct({ { "x", 5 }, { "y", 5 }, { "label", "end" } });
    REQUIRE(a);
    REQUIRE(b);

    auto l = line->construct({ { "start", *a }, { "end", *b }, { "tags", value::dict({ { 1, "diag" } }) } });
    REQUIRE(l);

    auto t = to_serialized(*l);
    REQUIRE(t);
    REQUIRE(t->at("tags").at("1").as_string() == "diag");

    auto back = from_serialized(line->descriptor(), *t);
    REQUIRE(back);
    REQUIRE(*back == *l);
}

TEST_CASE("Nested Record Errors Carry the Full Path") {
    auto point = make_point();
    auto line = record_type::builder{ "Line" }
        .add({ .name = "start", .field_type = point->descriptor() })
        .add({ .name = "end", .field_type = point->descriptor() })
        .json(json_support::from)
        .build();

    tree data = tree::make_object();
    data["start"] = point_data(0, 0);
    data["end"] = tree::make_object();
    data["end"]["x"] = "far";

    auto r = from_serialized(line->descriptor(), data);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == code::type_mismatch);
    REQUIRE(format_path(r.error().path) == R"($["end"]["x"])");

    std::ostringstream os;
    print_error(os, r.error());
    REQUIRE(os.str() ==
        "error[type_mismatch]: expected int, got \"far\"\n"
        "  --> $[\"end\"][\"x\"]\n"
        "   = expected: int\n"
        "   = found: \"far\"\n");
}

TEST_CASE("Missing Field Diagnostics Omit the Found Line") {
    auto point = make_point();
    auto r = point->construct({});
    REQUIRE_FALSE(r);

    std::ostringstream os;
    print_error(os, r.error());
    REQUIRE(os.str().find("found") == std::string::npos);
    REQUIRE(os.str().find("error[missing_field]") == 0);
}
