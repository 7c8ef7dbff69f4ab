#include <catch2/catch_all.hpp>

#include "conform/conform.hpp"
#include "conform/handlers.hpp"

#include <cstdint>
#include <limits>

using namespace Conform;

using code = ConversionError::code;


TEST_CASE("Instance Checks on Scalars") {
    REQUIRE(is_instance(value{ 1 }, type::integral()));
    REQUIRE(is_instance(value{ true }, type::integral()));
    REQUIRE(is_instance(value{ true }, type::boolean()));
    REQUIRE_FALSE(is_instance(value{ 1 }, type::boolean()));
    REQUIRE_FALSE(is_instance(value{ 1 }, type::real()));
    REQUIRE(is_instance(value{}, type::none()));
    REQUIRE(is_instance(value{ "x" }, type::any()));
    REQUIRE_FALSE(is_instance(value::fixed(std::int32_t{ 1 }), type::integral()));
}

TEST_CASE("Text Is Not a Sequence") {
    REQUIRE_FALSE(is_instance(value{ "abc" }, type::sequence()));
    REQUIRE_FALSE(is_instance(value{ "abc" }, type::sequence(type::text())));
    REQUIRE_FALSE(is_instance(value{ "abc" }, type::collection()));

    auto r = convert(value{ "abc" }, type::list(type::text()));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == code::type_mismatch);
}

TEST_CASE("Parameterized Instance Checks Look Inside") {
    REQUIRE(is_instance(value::list({ 1, 2 }), type::list(type::integral())));
    REQUIRE_FALSE(is_instance(value::list({ 1, "2" }), type::list(type::integral())));
    REQUIRE(is_instance(value::tuple({ 1, 2 }), type::sequence(type::integral())));
    REQUIRE_FALSE(is_instance(value::tuple({ 1, 2 }), type::list(type::integral())));
    REQUIRE(is_instance(value::dict({ { "a", 1 } }), type::mapping(type::text(), type::integral())));
    REQUIRE_FALSE(is_instance(value::dict({ { 1, 1 } }), type::mapping(type::text(), type::integral())));
    REQUIRE(is_instance(value::set({ 1, 2 }), type::abstract_set(type::integral())));
    REQUIRE(is_instance(value::frozen_set({ 1 }), type::abstract_set()));
    REQUIRE_FALSE(is_instance(value::list({ 1 }), type::abstract_set()));
}

TEST_CASE("Collections Check Mapping Keys") {
    auto d = value::dict({ { "a", 1.5 }, { "b", 2.5 } });
    REQUIRE(is_instance(d, type::collection(type::text())));
    REQUIRE_FALSE(is_instance(d, type::collection(type::real())));
}

TEST_CASE("Ensure Reports the Failing Element") {
    auto r = ensure_is_instance(value::dict({ { "a", 1 }, { "b", "x" } }), type::mapping(type::text(), type::integral()));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == code::type_mismatch);
    REQUIRE(r.error().path.size() == 1);
    REQUIRE(r.error().path[0] == value{ "b" });
    REQUIRE(r.error().offending == value{ "x" });
    REQUIRE(r.error().target == type::integral());
}

TEST_CASE("Unparameterized Conversion Returns the Same Object") {
    auto l = value::list({ 1, "two" });
    auto r = convert(l, type::list());
    REQUIRE(r);
    REQUIRE(r->same(l));

    auto d = value::dict({ { "a", 1 } });
    auto rd = convert(d, type::dict());
    REQUIRE(rd);
    REQUIRE(rd->same(d));

    auto s = value::set({ 1 });
    auto rs = convert(s, type::set());
    REQUIRE(rs);
    REQUIRE(rs->same(s));
}

TEST_CASE("Unparameterized Conversion Rebuilds Foreign Containers") {
    auto t = value::tuple({ 1, 2 });
    auto r = convert(t, type::list());
    REQUIRE(r);
    REQUIRE(r->type() == kind::list);
    REQUIRE(*r == value::list({ 1, 2 }));

    auto fd = value::frozen_dict({ { "a", 1 } });
    auto rd = convert(fd, type::dict());
    REQUIRE(rd);
    REQUIRE(rd->type() == kind::dict);
    REQUIRE_FALSE(rd->same(fd));
}

TEST_CASE("Parameterized Conversion Builds a New Container") {
    auto l = value::list({ 1, 2 });
    auto r = convert(l, type::list(type::integral()));
    REQUIRE(r);
    REQUIRE_FALSE(r->same(l));
    REQUIRE(*r == l);
}

TEST_CASE("Sequence Conversion of a Tuple Yields a List") {
    auto t = value::tuple({ 1, value::fixed(std::int16_t{ 2 }), value::fixed(std::uint8_t{ 3 }) });
    auto r = convert(t, type::sequence(type::integral()));
    REQUIRE(r);
    REQUIRE(r->type() == kind::list);
    REQUIRE(*r == value::list({ 1, 2, 3 }));
    for (const auto& e : r->elements()) REQUIRE(e.is_integer());
}

TEST_CASE("Conversion Failure Carries the Path") {
    auto r = convert(value::list({ 1, "two", 3 }), type::list(type::integral()));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == code::type_mismatch);
    REQUIRE(r.error().path.size() == 1);
    REQUIRE(r.error().path[0] == value{ 1 });
    REQUIRE(r.error().msg == R"(expected int, got "two")");
    REQUIRE(describe(r.error()) == R"(expected int, got "two" (at $[1]))");
}

TEST_CASE("Nested Paths") {
    auto data = value::dict({ { "points", value::list({ value::list({ 1, 2 }), value::list({ 3, "x" }) }) } });
    auto t = type::dict(type::text(), type::list(type::list(type::integral())));
    auto r = convert(data, t);
    REQUIRE_FALSE(r);
    REQUIRE(format_path(r.error().path) == R"($["points"][1][1])");
}

TEST_CASE("Fixed-Width Numbers Become Native") {
    auto i = convert(value::fixed(std::int8_t{ -3 }), type::integral());
    REQUIRE(i);
    REQUIRE(i->is_integer());
    REQUIRE(i->as_integer() == -3);

    auto f = convert(value::fixed(2.5f), type::real());
    REQUIRE(f);
    REQUIRE(f->is_real());
    REQUIRE(f->as_real() == Catch::Approx(2.5));

    auto widened = convert(value{ 4 }, type::real());
    REQUIRE(widened);
    REQUIRE(widened->is_real());
    REQUIRE(widened->as_real() == Catch::Approx(4.0));
}

TEST_CASE("Oversized Fixed Integer Is Out of Range") {
    auto big = value::fixed(std::numeric_limits<std::uint64_t>::max());
    auto r = convert(big, type::integral());
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == code::out_of_range);
    REQUIRE(r.error().offending == big);
}

TEST_CASE("Booleans Are Not Widened to Reals") {
    auto r = convert(value{ true }, type::real());
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == code::type_mismatch);

    auto i = convert(value{ true }, type::integral());
    REQUIRE(i);
    REQUIRE(i->is_bool());
}

TEST_CASE("Reals Are Not Narrowed to Integers") {
    auto r = convert(value{ 1.0 }, type::integral());
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == code::type_mismatch);
}

TEST_CASE("Union Conversion") {
    auto u = type::union_of({ type::integral(), type::text() });

    SECTION("Matching branch") {
        auto r = convert(value{ "x" }, u);
        REQUIRE(r);
        REQUIRE(*r == value{ "x" });
    }

    SECTION("Converting branch") {
        auto r = convert(value::fixed(std::int32_t{ 9 }), u);
        REQUIRE(r);
        REQUIRE(r->is_integer());
    }

    SECTION("No branch") {
        auto r = convert(value{ 3.5 }, u);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == code::no_union_branch);
        REQUIRE(r.error().msg.find("int, str") != std::string::npos);
        REQUIRE_FALSE(is_instance(value{ 3.5 }, u));

        auto e = ensure_is_instance(value{ 3.5 }, u);
        REQUIRE_FALSE(e);
        REQUIRE(e.error().errc == code::no_union_branch);
    }
}

TEST_CASE("Union Prefers a Branch the Value Already Belongs To") {
    auto u = type::union_of({ type::real(), type::integral() });
    auto r = convert(value{ 1 }, u);
    REQUIRE(r);
    REQUIRE(r->is_integer());

    auto f = convert(value::fixed(std::int16_t{ 1 }), u);
    REQUIRE(f);
    REQUIRE(f->is_real());
}

TEST_CASE("Optional Accepts None") {
    auto t = type::optional(type::list(type::integral()));
    REQUIRE(is_instance(value{}, t));
    auto r = convert(value::tuple({ 1 }), t);
    REQUIRE(r);
    REQUIRE(*r == value::list({ 1 }));
}

TEST_CASE("Fixed-Arity Tuples Are Not Implemented") {
    auto t = type::tuple({ type::integral(), type::text() });
    auto v = value::tuple({ 1, "a" });

    REQUIRE_FALSE(is_instance(v, t));

    auto e = ensure_is_instance(v, t);
    REQUIRE_FALSE(e);
    REQUIRE(e.error().errc == code::not_implemented);

    auto r = convert(v, t);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == code::not_implemented);

    REQUIRE(is_instance(v, type::tuple()));
}

TEST_CASE("Conversion Is Idempotent") {
    auto t = type::dict(type::text(), type::sequence(type::real()));
    auto v = value::frozen_dict({ { "a", value::tuple({ 1, value::fixed(0.5f) }) } });

    auto once = convert(v, t);
    REQUIRE(once);
    auto twice = convert(*once, t);
    REQUIRE(twice);
    REQUIRE(*once == *twice);
    REQUIRE(is_instance(*once, t));
}

TEST_CASE("Registry Picks Handlers by Shape") {
    HandlerRegistry reg;

    REQUIRE(reg.resolve(type::any()).name() == "any");
    REQUIRE(reg.resolve(type::union_of({ type::integral(), type::none() })).name() == "union");
    REQUIRE(reg.resolve(type::tuple({ type::integral() })).name() == "unsupported");
    REQUIRE(reg.resolve(type::tuple_of(type::integral())).name() == "unsupported");
    REQUIRE(reg.resolve(type::tuple()).name() == "trivial");
    REQUIRE(reg.resolve(type::dict()).name() == "dict");
    REQUIRE(reg.resolve(type::mapping(type::text(), type::integral())).name() == "dict");
    REQUIRE(reg.resolve(type::mapping()).name() == "dict");
    REQUIRE(reg.resolve(type::frozen_dict(type::text(), type::integral())).name() == "mapping");
    REQUIRE(reg.resolve(type::frozen_dict()).name() == "trivial");
    REQUIRE(reg.resolve(type::list()).name() == "list");
    REQUIRE(reg.resolve(type::sequence(type::integral())).name() == "list");
    REQUIRE(reg.resolve(type::collection(type::integral())).name() == "collection");
    REQUIRE(reg.resolve(type::collection()).name() == "trivial");
    REQUIRE(reg.resolve(type::set(type::integral())).name() == "collection");
    REQUIRE(reg.resolve(type::set()).name() == "trivial");
    REQUIRE(reg.resolve(type::integral()).name() == "integral");
    REQUIRE(reg.resolve(type::real()).name() == "real");
    REQUIRE(reg.resolve(type::text()).name() == "trivial");
}

TEST_CASE("Registry Caches Resolutions") {
    HandlerRegistry reg;
    TypeConverter conv{ reg };

    REQUIRE(reg.cache_size() == 0);

    REQUIRE(conv.is_instance(value{ 1 }, type::integral()));
    REQUIRE(reg.cache_size() == 1);

    REQUIRE(conv.is_instance(value{ 2 }, type::integral()));
    REQUIRE(reg.cache_size() == 1);

    REQUIRE(conv.is_instance(value{ 2 }, type::any()));
    REQUIRE(reg.cache_size() == 1);

    const handler& a = reg.resolve(type::list(type::text()));
    const handler& b = reg.resolve(type::list(type::text()));
    REQUIRE(&a == &b);
    REQUIRE(reg.cache_size() == 2);

    REQUIRE(&reg.resolve(type::list()) == &a);
}
