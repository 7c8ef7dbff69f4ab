#include <catch2/catch_all.hpp>

#include "conform/conform.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

using namespace Conform;

namespace {

    struct widget final : opaque {
        std::string_view type_name() const noexcept override { return "Widget"; }
    };

}


TEST_CASE("Numbers Compare Across Kinds") {
    REQUIRE(value{ 3 } == value::fixed(std::int8_t{ 3 }));
    REQUIRE(value{ 2.5 } == value::fixed(2.5f));
    REQUIRE(value{ 2 } == value{ 2.0 });
    REQUIRE_FALSE(value{ true } == value{ 1 });
    REQUIRE(value::fixed(std::numeric_limits<std::uint64_t>::max()) != value{ -1 });
}

TEST_CASE("Lists and Tuples Are Distinct") {
    auto l = value::list({ 1, 2 });
    auto t = value::tuple({ 1, 2 });

    REQUIRE(l.is_sequence());
    REQUIRE(t.is_sequence());
    REQUIRE(l != t);
    REQUIRE(l == value::list({ 1, 2 }));
}

TEST_CASE("Mappings and Sets Compare by Content") {
    auto a = value::dict({ { "x", 1 }, { "y", 2 } });
    auto b = value::dict({ { "y", 2 }, { "x", 1 } });
    REQUIRE(a == b);

    REQUIRE(value::set({ 1, 2, 3 }) == value::set({ 3, 2, 1 }));
    REQUIRE(value::set({ 1, 1, 2 }).size() == 2);
}

TEST_CASE("Dict Keeps First Position of Repeated Keys") {
    auto d = value::dict({ { "a", 1 }, { "b", 2 }, { "a", 3 } });
    REQUIRE(d.size() == 2);
    REQUIRE(d.members().front().first == value{ "a" });
}

TEST_CASE("Hash Agrees With Equality") {
    value_hash h;

    REQUIRE(h(value{ 3 }) == h(value::fixed(std::uint8_t{ 3 })));
    REQUIRE(h(value{ 3 }) == h(value{ 3.0 }));
    REQUIRE(h(value{ 0.0 }) == h(value{ -0.0 }));
    REQUIRE(h(value::dict({ { "a", 1 }, { "b", 2 } })) == h(value::frozen_dict({ { "b", 2.0 }, { "a", 1 } })));
    REQUIRE(h(value::set({ 1, 2, 3 })) == h(value::frozen_set({ 3, 2, 1 })));
    REQUIRE(h(value::list({ 1, "x" })) == h(value::list({ 1, "x" })));
}

TEST_CASE("Mapping Lookup Matches Numeric Keys Across Kinds") {
    auto d = value::dict({ { 1, "one" }, { 2.5, "two and a half" } });

    REQUIRE(*d.find(value::fixed(std::int16_t{ 1 })) == value{ "one" });
    REQUIRE(*d.find(value{ 1.0 }) == value{ "one" });
    REQUIRE(*d.find(value::fixed(2.5f)) == value{ "two and a half" });
    REQUIRE(d.find(value{ true }) == nullptr);
    REQUIRE(d.find(value{ "1" }) == nullptr);

    d.insert(value{ 1.0 }, "uno");
    REQUIRE(d.size() == 2);
    REQUIRE(d.members().front().first.is_integer());
    REQUIRE(*d.find(value{ 1 }) == value{ "uno" });
}

TEST_CASE("Large Sets and Dicts Deduplicate") {
    items elements;
    entries members;
    for (std::int64_t i = 0; i < 40'000; i++) {
        elements.emplace_back(i % 20'000);
        members.emplace_back(value{ std::to_string(i % 20'000) }, value{ i });
    }

    auto s = value::set(std::move(elements));
    REQUIRE(s.size() == 20'000);

    auto d = value::dict(std::move(members));
    REQUIRE(d.size() == 20'000);
    REQUIRE(*d.find(value{ "0" }) == value{ 20'000 });
    REQUIRE(d.members().front().first == value{ "0" });
}

TEST_CASE("Shared Containers Have Identity") {
    auto l = value::list({ 1 });
    auto copy = l;
    REQUIRE(copy.same(l));
    REQUIRE_FALSE(value::list({ 1 }).same(l));

    copy.append(2);
    REQUIRE(l.size() == 2);
}

TEST_CASE("Append and Insert Require Mutable Containers") {
    auto t = value::tuple({ 1 });
    REQUIRE_THROWS_AS(t.append(2), std::logic_error);

    auto fd = value::frozen_dict({ { "a", 1 } });
    REQUIRE_THROWS_AS(fd.insert("b", 2), std::logic_error);

    auto d = value::dict();
    d.insert("a", 1);
    d.insert("a", 2);
    REQUIRE(d.size() == 1);
    REQUIRE(*d.find("a") == value{ 2 });
}

TEST_CASE("Fixed Integers Narrow When They Fit") {
    REQUIRE(value::fixed(std::int16_t{ -7 }).to_int64() == -7);
    REQUIRE(value::fixed(std::numeric_limits<std::int64_t>::min()).to_int64() == std::numeric_limits<std::int64_t>::min());
    REQUIRE_FALSE(value::fixed(std::numeric_limits<std::uint64_t>::max()).to_int64().has_value());
    REQUIRE_FALSE(value{ true }.to_double().has_value());
}

TEST_CASE("Value Repr") {
    REQUIRE(value{}.repr() == "none");
    REQUIRE(value{ 2.0 }.repr() == "2.0");
    REQUIRE(value{ "a\"b" }.repr() == R"("a\"b")");
    REQUIRE(value::fixed(std::int8_t{ 3 }).repr() == "int8(3)");
    REQUIRE(value::fixed(2.5f).repr() == "float32(2.5)");
    REQUIRE(value::list({ 1, "x" }).repr() == R"([1, "x"])");
    REQUIRE(value::tuple({ 1 }).repr() == "(1)");
    REQUIRE(value{ std::make_shared<widget>() }.repr() == "<Widget object>");
}

TEST_CASE("Descriptors Compare Structurally") {
    REQUIRE(type::list(type::integral()) == type::list(type::integral()));
    REQUIRE(type::list(type::integral()) != type::list());
    REQUIRE(type::list(type::integral()).hash() == type::list(type::integral()).hash());
    REQUIRE(type::dict(type::text(), type::integral()).repr() == "dict<str, int>");
    REQUIRE(type::tuple_of(type::real()).repr() == "tuple<float, ...>");
    REQUIRE(type::tuple({}).is_parameterized());
    REQUIRE_FALSE(type::tuple().is_parameterized());
}

TEST_CASE("Unions Flatten and Collapse") {
    auto nested = type::union_of({ type::integral(), type::union_of({ type::text(), type::integral() }) });
    REQUIRE(nested == type::union_of({ type::integral(), type::text() }));
    REQUIRE(type::union_of({ type::integral() }) == type::integral());
    REQUIRE(type::optional(type::integral()).repr() == "union<int, none>");
    REQUIRE_THROWS_AS(type::union_of({}), std::invalid_argument);
}

TEST_CASE("Malformed Descriptors Throw") {
    REQUIRE_THROWS_AS(type::record(nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(type::opaque(""), std::invalid_argument);
    REQUIRE_THROWS_AS(type::of(kind::fixed_integer), std::invalid_argument);
}

TEST_CASE("Descriptors From C++ Types") {
    REQUIRE(type::of<int>() == type::integral());
    REQUIRE(type::of<std::vector<std::string>>() == type::list(type::text()));
    REQUIRE(type::of<std::map<int, double>>() == type::dict(type::integral(), type::real()));
    REQUIRE(type::of<std::optional<bool>>() == type::optional(type::boolean()));
    REQUIRE(type::of<std::variant<int, std::string>>() == type::union_of({ type::integral(), type::text() }));
}

TEST_CASE("Opaque Descriptors Match by Class Name") {
    value w{ std::make_shared<widget>() };
    REQUIRE(is_instance(w, type::opaque("Widget")));
    REQUIRE_FALSE(is_instance(w, type::opaque("Gadget")));
    REQUIRE_FALSE(is_instance(value{ 1 }, type::opaque("Widget")));
}
