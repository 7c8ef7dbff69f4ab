#include "conform/value.hpp"
#include "conform/record.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include <fmt/format.h>


namespace Conform {

    // Ordered members plus a hash index from key to position in `members`.
    struct mapping_storage {
        entries members;
        std::unordered_map<value, std::size_t, value_hash> index;

        const value* find(const value& key) const {
            auto it = index.find(key);
            if (it == index.end()) return nullptr;
            return std::addressof(members[it->second].second);
        }

        // A repeated key keeps its first position and takes the new value.
        void put(value key, value v) {
            auto it = index.find(key);
            if (it != index.end()) {
                members[it->second].second = std::move(v);
                return;
            }
            index.emplace(key, members.size());
            members.emplace_back(std::move(key), std::move(v));
        }
    };

    namespace {

        struct integral_parts {
            bool negative = false;
            std::uint64_t magnitude = 0;
        };

        integral_parts split(std::int64_t i) noexcept {
            if (i >= 0) return { false, static_cast<std::uint64_t>(i) };
            return { true, static_cast<std::uint64_t>(-(i + 1)) + 1u };
        }

        integral_parts split(const fixed_integer& f) noexcept {
            return std::visit([](auto x) -> integral_parts {
                using X = decltype(x);
                if constexpr (std::is_signed_v<X>) return split(static_cast<std::int64_t>(x));
                else return { false, static_cast<std::uint64_t>(x) };
            }, f);
        }

        integral_parts integral_of(const value& v) {
            if (v.is_integer()) return split(v.as_integer());
            return split(v.as_fixed_integer());
        }

        double real_of(const fixed_real& f) noexcept {
            return std::visit([](auto x) { return static_cast<double>(x); }, f);
        }

        std::string format_real(double d) {
            if (std::isnan(d)) return "nan";
            if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{}) return fmt::format("{}", d);
            std::string out{ buf, ptr };
            if (out.find_first_of(".en") == std::string::npos) out += ".0";
            return out;
        }

        std::string quote(std::string_view s) {
            std::string out;
            out.reserve(s.size() + 2);
            out.push_back('"');
            for (char c : s) {
                switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\t': out += "\\t"; break;
                default: out.push_back(c); break;
                }
            }
            out.push_back('"');
            return out;
        }

        std::string join_items(const items& xs) {
            std::string out;
            for (std::size_t i = 0; i < xs.size(); i++) {
                if (i) out += ", ";
                out += xs[i].repr();
            }
            return out;
        }

        std::string join_entries(const entries& xs) {
            std::string out;
            for (std::size_t i = 0; i < xs.size(); i++) {
                if (i) out += ", ";
                out += xs[i].first.repr();
                out += ": ";
                out += xs[i].second.repr();
            }
            return out;
        }

        items unique(items xs) {
            std::unordered_set<value, value_hash> seen;
            seen.reserve(xs.size());
            items out;
            out.reserve(xs.size());
            for (auto& x : xs) {
                if (seen.insert(x).second) out.push_back(std::move(x));
            }
            return out;
        }

        std::shared_ptr<mapping_storage> index_members(entries xs) {
            auto store = std::make_shared<mapping_storage>();
            store->members.reserve(xs.size());
            store->index.reserve(xs.size());
            for (auto& [k, v] : xs) store->put(std::move(k), std::move(v));
            return store;
        }

        bool numeric_equal(const value& a, const value& b) {
            if (a.is_integral_like() && b.is_integral_like()) {
                auto pa = integral_of(a);
                auto pb = integral_of(b);
                if (pa.magnitude == 0 && pb.magnitude == 0) return true;
                return pa.negative == pb.negative && pa.magnitude == pb.magnitude;
            }
            auto da = a.to_double();
            auto db = b.to_double();
            return da && db && *da == *db;
        }

        bool mappings_equal(const mapping_storage& a, const mapping_storage& b) {
            if (a.members.size() != b.members.size()) return false;
            for (const auto& [k, v] : a.members) {
                const value* other = b.find(k);
                if (!other || !(v == *other)) return false;
            }
            return true;
        }

        bool sets_equal(const items& a, const items& b) {
            if (a.size() != b.size()) return false;
            std::unordered_set<value, value_hash> lookup(b.begin(), b.end());
            for (const auto& x : a) {
                if (!lookup.contains(x)) return false;
            }
            return true;
        }

        void hash_combine(std::size_t& seed, std::size_t h) noexcept {
            seed ^= h + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
        }

        // tags keep kinds that never compare equal apart
        enum class hash_tag : std::size_t { none = 1, boolean, number, text, list, tuple, mapping, set, record, opaque };

    } // namespace

    std::string_view kind_name(kind k) noexcept {
        switch (k) {
        case kind::none: return "none";
        case kind::boolean: return "bool";
        case kind::integer: return "int";
        case kind::real: return "float";
        case kind::text: return "str";
        case kind::fixed_integer: return "fixed_integer";
        case kind::fixed_real: return "fixed_real";
        case kind::list: return "list";
        case kind::tuple: return "tuple";
        case kind::dict: return "dict";
        case kind::frozen_dict: return "frozen_dict";
        case kind::set: return "set";
        case kind::frozen_set: return "frozen_set";
        case kind::record: return "record";
        case kind::opaque: return "opaque";
        }
        return "unknown";
    }

    std::string opaque::repr() const {
        return fmt::format("<{} object>", type_name());
    }

    value::value() noexcept
        : m_Kind{ kind::none }, m_Storage{ std::monostate{} } {}

    value::value(std::nullptr_t) noexcept
        : m_Kind{ kind::none }, m_Storage{ std::monostate{} } {}

    value::value(bool b) noexcept
        : m_Kind{ kind::boolean }, m_Storage{ b } {}

    value::value(double d) noexcept
        : m_Kind{ kind::real }, m_Storage{ d } {}

    value::value(const char* s)
        : m_Kind{ kind::text }, m_Storage{ std::string{ s } } {}

    value::value(std::string_view sv)
        : m_Kind{ kind::text }, m_Storage{ std::string{ sv } } {}

    value::value(std::string s)
        : m_Kind{ kind::text }, m_Storage{ std::move(s) } {}

    value::value(std::shared_ptr<const record> r)
        : m_Kind{ r ? kind::record : kind::none }, m_Storage{ std::monostate{} } {
        if (r) m_Storage = std::move(r);
    }

    value::value(std::shared_ptr<const opaque> o)
        : m_Kind{ o ? kind::opaque : kind::none }, m_Storage{ std::monostate{} } {
        if (o) m_Storage = std::move(o);
    }

    value::value(kind k, storage_t s) noexcept
        : m_Kind{ k }, m_Storage{ std::move(s) } {}

    value value::fixed(float f) noexcept { return value{ kind::fixed_real, fixed_real{ f } }; }
    value value::fixed(double d) noexcept { return value{ kind::fixed_real, fixed_real{ d } }; }

    value value::list(items elements) {
        return value{ kind::list, std::make_shared<items>(std::move(elements)) };
    }

    value value::tuple(items elements) {
        return value{ kind::tuple, std::make_shared<items>(std::move(elements)) };
    }

    value value::set(items elements) {
        return value{ kind::set, std::make_shared<items>(unique(std::move(elements))) };
    }

    value value::frozen_set(items elements) {
        return value{ kind::frozen_set, std::make_shared<items>(unique(std::move(elements))) };
    }

    value value::dict(entries members) {
        return value{ kind::dict, index_members(std::move(members)) };
    }

    value value::frozen_dict(entries members) {
        return value{ kind::frozen_dict, index_members(std::move(members)) };
    }

    bool value::is_sequence() const noexcept {
        return m_Kind == kind::list || m_Kind == kind::tuple;
    }

    bool value::is_mapping() const noexcept {
        return m_Kind == kind::dict || m_Kind == kind::frozen_dict;
    }

    bool value::is_collection() const noexcept {
        return is_sequence() || is_mapping() || m_Kind == kind::set || m_Kind == kind::frozen_set;
    }

    bool value::is_integral_like() const noexcept {
        return m_Kind == kind::integer || m_Kind == kind::fixed_integer;
    }

    bool value::is_real_like() const noexcept {
        return is_integral_like() || m_Kind == kind::real || m_Kind == kind::fixed_real;
    }

    bool value::as_bool() const { return std::get<bool>(m_Storage); }
    std::int64_t value::as_integer() const { return std::get<std::int64_t>(m_Storage); }
    double value::as_real() const { return std::get<double>(m_Storage); }
    const std::string& value::as_text() const { return std::get<std::string>(m_Storage); }
    const fixed_integer& value::as_fixed_integer() const { return std::get<fixed_integer>(m_Storage); }
    const fixed_real& value::as_fixed_real() const { return std::get<fixed_real>(m_Storage); }
    const record& value::as_record() const { return *std::get<std::shared_ptr<const record>>(m_Storage); }
    std::shared_ptr<const record> value::record_ptr() const { return std::get<std::shared_ptr<const record>>(m_Storage); }
    const opaque& value::as_opaque() const { return *std::get<std::shared_ptr<const opaque>>(m_Storage); }
    const items& value::elements() const { return *std::get<std::shared_ptr<items>>(m_Storage); }
    const entries& value::members() const { return std::get<std::shared_ptr<mapping_storage>>(m_Storage)->members; }

    std::size_t value::size() const noexcept {
        if (auto* xs = std::get_if<std::shared_ptr<items>>(&m_Storage)) return (*xs)->size();
        if (auto* ms = std::get_if<std::shared_ptr<mapping_storage>>(&m_Storage)) return (*ms)->members.size();
        return 0;
    }

    std::optional<std::int64_t> value::to_int64() const noexcept {
        if (m_Kind == kind::integer) return std::get<std::int64_t>(m_Storage);
        if (m_Kind != kind::fixed_integer) return std::nullopt;
        auto parts = split(std::get<fixed_integer>(m_Storage));
        constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        if (!parts.negative) {
            if (parts.magnitude > max) return std::nullopt;
            return static_cast<std::int64_t>(parts.magnitude);
        }
        if (parts.magnitude > max + 1u) return std::nullopt;
        if (parts.magnitude == max + 1u) return std::numeric_limits<std::int64_t>::min();
        return -static_cast<std::int64_t>(parts.magnitude);
    }

    std::optional<double> value::to_double() const noexcept {
        switch (m_Kind) {
        case kind::real: return std::get<double>(m_Storage);
        case kind::integer: return static_cast<double>(std::get<std::int64_t>(m_Storage));
        case kind::fixed_real: return real_of(std::get<fixed_real>(m_Storage));
        case kind::fixed_integer: {
            auto parts = split(std::get<fixed_integer>(m_Storage));
            double d = static_cast<double>(parts.magnitude);
            return parts.negative ? -d : d;
        }
        default: return std::nullopt;
        }
    }

    void value::append(value v) {
        if (m_Kind != kind::list) throw std::logic_error{ "Conform::value::append: value is not a list" };
        std::get<std::shared_ptr<items>>(m_Storage)->push_back(std::move(v));
    }

    void value::insert(value key, value v) {
        if (m_Kind != kind::dict) throw std::logic_error{ "Conform::value::insert: value is not a dict" };
        std::get<std::shared_ptr<mapping_storage>>(m_Storage)->put(std::move(key), std::move(v));
    }

    const value* value::find(const value& key) const {
        if (!is_mapping()) return nullptr;
        return std::get<std::shared_ptr<mapping_storage>>(m_Storage)->find(key);
    }

    bool value::same(const value& other) const noexcept {
        if (m_Kind != other.m_Kind) return false;
        switch (m_Kind) {
        case kind::list:
        case kind::tuple:
        case kind::set:
        case kind::frozen_set:
            return std::get<std::shared_ptr<items>>(m_Storage) == std::get<std::shared_ptr<items>>(other.m_Storage);
        case kind::dict:
        case kind::frozen_dict:
            return std::get<std::shared_ptr<mapping_storage>>(m_Storage) == std::get<std::shared_ptr<mapping_storage>>(other.m_Storage);
        case kind::record:
            return std::get<std::shared_ptr<const record>>(m_Storage) == std::get<std::shared_ptr<const record>>(other.m_Storage);
        case kind::opaque:
            return std::get<std::shared_ptr<const opaque>>(m_Storage) == std::get<std::shared_ptr<const opaque>>(other.m_Storage);
        default:
            return m_Storage == other.m_Storage;
        }
    }

    bool operator==(const value& lhs, const value& rhs) {
        if (lhs.is_real_like() && rhs.is_real_like()) return numeric_equal(lhs, rhs);
        if (lhs.is_mapping() && rhs.is_mapping()) {
            if (lhs.same(rhs)) return true;
            return mappings_equal(*std::get<std::shared_ptr<mapping_storage>>(lhs.storage()),
                                  *std::get<std::shared_ptr<mapping_storage>>(rhs.storage()));
        }

        auto set_like = [](const value& v) { return v.type() == kind::set || v.type() == kind::frozen_set; };
        if (set_like(lhs) && set_like(rhs)) return sets_equal(lhs.elements(), rhs.elements());

        if (lhs.type() != rhs.type()) return false;
        switch (lhs.type()) {
        case kind::none: return true;
        case kind::boolean: return lhs.as_bool() == rhs.as_bool();
        case kind::text: return lhs.as_text() == rhs.as_text();
        case kind::list:
        case kind::tuple: {
            if (lhs.same(rhs)) return true;
            const auto& a = lhs.elements();
            const auto& b = rhs.elements();
            if (a.size() != b.size()) return false;
            for (std::size_t i = 0; i < a.size(); i++) {
                if (!(a[i] == b[i])) return false;
            }
            return true;
        }
        case kind::record: return lhs.same(rhs) || lhs.as_record() == rhs.as_record();
        case kind::opaque: return lhs.same(rhs);
        default: return false;
        }
    }

    std::size_t value_hash::operator()(const value& v) const noexcept {
        auto tagged = [](hash_tag tag) { return static_cast<std::size_t>(tag); };

        // Equal numbers of any kind share a real value; -0.0 folds into 0.0
        if (v.is_real_like()) {
            double d = *v.to_double();
            if (d == 0.0) d = 0.0;
            std::size_t h = tagged(hash_tag::number);
            hash_combine(h, std::hash<double>{}(d));
            return h;
        }

        std::size_t h = 0;
        switch (v.type()) {
        case kind::none: return tagged(hash_tag::none);
        case kind::boolean:
            h = tagged(hash_tag::boolean);
            hash_combine(h, v.as_bool() ? 1u : 0u);
            return h;
        case kind::text:
            h = tagged(hash_tag::text);
            hash_combine(h, std::hash<std::string>{}(v.as_text()));
            return h;
        case kind::list:
        case kind::tuple:
            h = tagged(v.type() == kind::list ? hash_tag::list : hash_tag::tuple);
            for (const auto& e : v.elements()) hash_combine(h, (*this)(e));
            return h;
        case kind::set:
        case kind::frozen_set: {
            std::size_t sum = 0;
            for (const auto& e : v.elements()) sum += (*this)(e);
            h = tagged(hash_tag::set);
            hash_combine(h, sum);
            return h;
        }
        case kind::dict:
        case kind::frozen_dict: {
            std::size_t sum = 0;
            for (const auto& [k, item] : v.members()) {
                std::size_t pair = (*this)(k);
                hash_combine(pair, (*this)(item));
                sum += pair;
            }
            h = tagged(hash_tag::mapping);
            hash_combine(h, sum);
            return h;
        }
        case kind::record: {
            const record& r = v.as_record();
            h = tagged(hash_tag::record);
            hash_combine(h, std::hash<const void*>{}(r.schema().get()));
            for (const auto& field : r.values()) hash_combine(h, (*this)(field));
            return h;
        }
        case kind::opaque:
            h = tagged(hash_tag::opaque);
            hash_combine(h, std::hash<const void*>{}(std::addressof(v.as_opaque())));
            return h;
        default:
            return h;
        }
    }

    std::string value::repr() const {
        switch (m_Kind) {
        case kind::none: return "none";
        case kind::boolean: return as_bool() ? "true" : "false";
        case kind::integer: return fmt::format("{}", as_integer());
        case kind::real: return format_real(as_real());
        case kind::text: return quote(as_text());
        case kind::fixed_integer:
            return std::visit([](auto x) {
                using X = decltype(x);
                constexpr auto bits = sizeof(X) * 8;
                if constexpr (std::is_signed_v<X>) return fmt::format("int{}({})", bits, static_cast<std::int64_t>(x));
                else return fmt::format("uint{}({})", bits, static_cast<std::uint64_t>(x));
            }, as_fixed_integer());
        case kind::fixed_real:
            return std::visit([](auto x) {
                return fmt::format("float{}({})", sizeof(x) * 8, format_real(static_cast<double>(x)));
            }, as_fixed_real());
        case kind::list: return fmt::format("[{}]", join_items(elements()));
        case kind::tuple: return fmt::format("({})", join_items(elements()));
        case kind::set: return fmt::format("{{{}}}", join_items(elements()));
        case kind::frozen_set: return fmt::format("frozen_set{{{}}}", join_items(elements()));
        case kind::dict: return fmt::format("{{{}}}", join_entries(members()));
        case kind::frozen_dict: return fmt::format("frozen_dict{{{}}}", join_entries(members()));
        case kind::record: return as_record().repr();
        case kind::opaque: return as_opaque().repr();
        }
        return "?";
    }

} // namespace Conform
