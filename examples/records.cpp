#include <cstdint>
#include <iostream>

#include <fmt/core.h>

#include "conform/conform.hpp"

int main() {
    using namespace Conform;

    auto point = record_type::builder{ "Point" }
        .add({ .name = "x", .field_type = type::integral() })
        .add({ .name = "y", .field_type = type::integral(), .default_value = value{ 0 } })
        .add({ .name = "label", .field_type = type::text(), .optional = true })
        .json(json_support::both)
        .build();

    auto p = point->construct({ { "x", value::fixed(std::int16_t{ 3 }) }, { "label", "origin-ish" } });
    if (!p) {
        print_error(std::cerr, p.error());
        return 1;
    }
    fmt::print("{}\n", p->repr());

    auto polyline = value::tuple({ *p, *point->construct({ { "x", 7 }, { "y", 9 } }) });
    auto points = convert(polyline, type::list(point->descriptor()));
    if (!points) {
        print_error(std::cerr, points.error());
        return 1;
    }

    auto serialized = to_serialized(*points);
    if (!serialized) {
        print_error(std::cerr, serialized.error());
        return 1;
    }
    fmt::print("{}\n", dump(*serialized, { .pretty = true, .indent = 4 }));

    auto decoded = from_serialized(type::list(point->descriptor()), *serialized);
    if (!decoded) {
        print_error(std::cerr, decoded.error());
        return 1;
    }
    fmt::print("round trip equal: {}\n", *decoded == *points);

    // unknown keys are rejected unless decoding is lenient
    tree bad = tree::make_object();
    bad["x"] = 1;
    bad["z"] = 2;
    auto strict = from_serialized(point->descriptor(), bad);
    if (!strict) print_error(std::cout, strict.error());

    auto lenient = from_serialized(point->descriptor(), bad, { .lenient = true });
    if (lenient) fmt::print("lenient: {}\n", lenient->repr());

    auto mixed = convert(value::list({ 1, "two", 3 }), type::list(type::integral()));
    if (!mixed) fmt::print("{}\n", describe(mixed.error()));

    return 0;
}
