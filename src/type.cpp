#include "conform/type.hpp"
#include "conform/record.hpp"

#include <stdexcept>

#include <fmt/format.h>


namespace Conform {

    struct type::node {
        category shape = category::any;
        kind_mask base = 0;
        std::vector<type> args;
        bool parameterized = false;
        bool variadic = false;
        std::shared_ptr<const record_type> schema;
        std::string name;
        std::size_t hash = 0;
    };

    namespace {

        constexpr kind_mask all_kinds = ~kind_mask{ 0 };

        constexpr kind_mask container_kinds = mask_of(
            kind::list, kind::tuple, kind::dict, kind::frozen_dict, kind::set, kind::frozen_set);

        void hash_combine(std::size_t& seed, std::size_t h) noexcept {
            seed ^= h + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
        }

        constexpr kind_mask sequence_kinds = mask_of(kind::list, kind::tuple);
        constexpr kind_mask mapping_kinds = mask_of(kind::dict, kind::frozen_dict);
        constexpr kind_mask set_kinds = mask_of(kind::set, kind::frozen_set);

        // "list<int>", "dict<str, union<int, none>>", ...
        std::string parameterized_name(std::string_view base, const std::vector<type>& args) {
            std::string out{ base };
            out += '<';
            for (std::size_t i = 0; i < args.size(); i++) {
                if (i) out += ", ";
                out += args[i].repr();
            }
            out += '>';
            return out;
        }

    } // namespace

    type::type(std::shared_ptr<const node> n) noexcept
        : m_Node{ std::move(n) } {}

    type::type()
        : type{ any() } {}

    type type::make(node n) {
        std::size_t h = static_cast<std::size_t>(n.shape);
        hash_combine(h, n.base);
        hash_combine(h, n.parameterized ? 1u : 0u);
        hash_combine(h, n.variadic ? 1u : 0u);
        hash_combine(h, std::hash<std::string>{}(n.name));
        hash_combine(h, std::hash<const void*>{}(n.schema.get()));
        for (const auto& a : n.args) hash_combine(h, a.hash());
        n.hash = h;
        return type{ std::make_shared<const node>(std::move(n)) };
    }

    type type::any() {
        static const type t = make({ .shape = category::any, .base = all_kinds, .name = "any" });
        return t;
    }

    type type::none() {
        static const type t = make({ .shape = category::none, .base = mask_of(kind::none), .name = "none" });
        return t;
    }

    type type::boolean() {
        static const type t = make({ .shape = category::boolean, .base = mask_of(kind::boolean), .name = "bool" });
        return t;
    }

    // bool is a native instance of int, but is never widened into one
    type type::integral() {
        static const type t = make({ .shape = category::integral, .base = mask_of(kind::integer, kind::boolean), .name = "int" });
        return t;
    }

    type type::real() {
        static const type t = make({ .shape = category::real, .base = mask_of(kind::real), .name = "float" });
        return t;
    }

    type type::text() {
        static const type t = make({ .shape = category::text, .base = mask_of(kind::text), .name = "str" });
        return t;
    }

    type type::union_of(std::vector<type> branches) {
        std::vector<type> flat;
        auto add = [&flat](const type& t) {
            for (const auto& existing : flat)
                if (existing == t) return;
            flat.push_back(t);
        };
        for (const auto& b : branches) {
            if (b.shape() == category::union_) {
                for (const auto& inner : b.args()) add(inner);
            } else {
                add(b);
            }
        }
        if (flat.empty()) throw std::invalid_argument{ "Conform::type::union_of: a union needs at least one branch" };
        if (flat.size() == 1) return flat.front();

        kind_mask base = 0;
        for (const auto& b : flat) base |= b.runtime_base();
        std::string name = parameterized_name("union", flat);
        return make({ .shape = category::union_, .base = base, .args = std::move(flat), .parameterized = true, .name = std::move(name) });
    }

    type type::optional(type t) {
        return union_of({ std::move(t), none() });
    }

    type type::sequence() {
        return make({ .shape = category::sequence, .base = sequence_kinds, .name = "sequence" });
    }

    type type::sequence(type element) {
        std::vector<type> args{ std::move(element) };
        std::string name = parameterized_name("sequence", args);
        return make({ .shape = category::sequence, .base = sequence_kinds, .args = std::move(args), .parameterized = true, .name = std::move(name) });
    }

    type type::list() {
        return make({ .shape = category::sequence, .base = mask_of(kind::list), .name = "list" });
    }

    type type::list(type element) {
        std::vector<type> args{ std::move(element) };
        std::string name = parameterized_name("list", args);
        return make({ .shape = category::sequence, .base = mask_of(kind::list), .args = std::move(args), .parameterized = true, .name = std::move(name) });
    }

    type type::mapping() {
        return make({ .shape = category::mapping, .base = mapping_kinds, .name = "mapping" });
    }

    type type::mapping(type key, type mapped) {
        std::vector<type> args{ std::move(key), std::move(mapped) };
        std::string name = parameterized_name("mapping", args);
        return make({ .shape = category::mapping, .base = mapping_kinds, .args = std::move(args), .parameterized = true, .name = std::move(name) });
    }

    type type::dict() {
        return make({ .shape = category::mapping, .base = mask_of(kind::dict), .name = "dict" });
    }

    type type::dict(type key, type mapped) {
        std::vector<type> args{ std::move(key), std::move(mapped) };
        std::string name = parameterized_name("dict", args);
        return make({ .shape = category::mapping, .base = mask_of(kind::dict), .args = std::move(args), .parameterized = true, .name = std::move(name) });
    }

    type type::frozen_dict() {
        return make({ .shape = category::mapping, .base = mask_of(kind::frozen_dict), .name = "frozen_dict" });
    }

    type type::frozen_dict(type key, type mapped) {
        std::vector<type> args{ std::move(key), std::move(mapped) };
        std::string name = parameterized_name("frozen_dict", args);
        return make({ .shape = category::mapping, .base = mask_of(kind::frozen_dict), .args = std::move(args), .parameterized = true, .name = std::move(name) });
    }

    type type::collection() {
        return make({ .shape = category::collection, .base = container_kinds, .name = "collection" });
    }

    type type::collection(type element) {
        std::vector<type> args{ std::move(element) };
        std::string name = parameterized_name("collection", args);
        return make({ .shape = category::collection, .base = container_kinds, .args = std::move(args), .parameterized = true, .name = std::move(name) });
    }

    type type::set() {
        return make({ .shape = category::collection, .base = mask_of(kind::set), .name = "set" });
    }

    type type::set(type element) {
        std::vector<type> args{ std::move(element) };
        std::string name = parameterized_name("set", args);
        return make({ .shape = category::collection, .base = mask_of(kind::set), .args = std::move(args), .parameterized = true, .name = std::move(name) });
    }

    type type::frozen_set() {
        return make({ .shape = category::collection, .base = mask_of(kind::frozen_set), .name = "frozen_set" });
    }

    type type::frozen_set(type element) {
        std::vector<type> args{ std::move(element) };
        std::string name = parameterized_name("frozen_set", args);
        return make({ .shape = category::collection, .base = mask_of(kind::frozen_set), .args = std::move(args), .parameterized = true, .name = std::move(name) });
    }

    type type::abstract_set() {
        return make({ .shape = category::collection, .base = set_kinds, .name = "abstract_set" });
    }

    type type::abstract_set(type element) {
        std::vector<type> args{ std::move(element) };
        std::string name = parameterized_name("abstract_set", args);
        return make({ .shape = category::collection, .base = set_kinds, .args = std::move(args), .parameterized = true, .name = std::move(name) });
    }

    type type::tuple() {
        return make({ .shape = category::tuple, .base = mask_of(kind::tuple), .name = "tuple" });
    }

    // tuple<> has no elements but is still a fixed-arity tuple
    type type::tuple(std::vector<type> elements) {
        std::string name = parameterized_name("tuple", elements);
        return make({ .shape = category::tuple, .base = mask_of(kind::tuple), .args = std::move(elements), .parameterized = true, .name = std::move(name) });
    }

    type type::tuple_of(type element) {
        std::string name = fmt::format("tuple<{}, ...>", element.repr());
        return make({ .shape = category::tuple, .base = mask_of(kind::tuple), .args = { std::move(element) },
                      .parameterized = true, .variadic = true, .name = std::move(name) });
    }

    type type::record(std::shared_ptr<const record_type> rt) {
        if (!rt) throw std::invalid_argument{ "Conform::type::record: record type must not be null" };
        std::string name = rt->name();
        return make({ .shape = category::record, .base = mask_of(kind::record), .schema = std::move(rt), .name = std::move(name) });
    }

    type type::opaque(std::string name) {
        if (name.empty()) throw std::invalid_argument{ "Conform::type::opaque: class name must not be empty" };
        return make({ .shape = category::opaque, .base = mask_of(kind::opaque), .name = std::move(name) });
    }


    type type::of(kind k) {
        switch (k) {
        case kind::none: return none();
        case kind::boolean: return boolean();
        case kind::integer: return integral();
        case kind::real: return real();
        case kind::text: return text();
        case kind::list: return list();
        case kind::tuple: return tuple();
        case kind::dict: return dict();
        case kind::frozen_dict: return frozen_dict();
        case kind::set: return set();
        case kind::frozen_set: return frozen_set();
        default: break;
        }
        throw std::invalid_argument{ fmt::format("{} is not a valid type annotation", kind_name(k)) };
    }

    category type::shape() const noexcept { return m_Node->shape; }
    kind_mask type::runtime_base() const noexcept { return m_Node->base; }
    bool type::is_parameterized() const noexcept { return m_Node->parameterized; }
    bool type::is_variadic() const noexcept { return m_Node->variadic; }
    const std::vector<type>& type::args() const noexcept { return m_Node->args; }
    const std::shared_ptr<const record_type>& type::record_schema() const noexcept { return m_Node->schema; }
    const std::string& type::opaque_name() const noexcept { return m_Node->name; }
    std::size_t type::hash() const noexcept { return m_Node->hash; }
    std::string type::repr() const { return m_Node->name; }

    bool type::admits(const value& v) const {
        switch (m_Node->shape) {
        case category::any:
            return true;
        case category::union_:
            for (const auto& b : m_Node->args) if (b.admits(v)) return true;
            return false;
        case category::record:
            return v.is_record() && v.as_record().schema().get() == m_Node->schema.get();
        case category::opaque:
            return v.is_opaque() && v.as_opaque().type_name() == m_Node->name;
        default:
            return mask_contains(m_Node->base, v.type());
        }
    }

    bool operator==(const type& lhs, const type& rhs) noexcept {
        if (lhs.m_Node == rhs.m_Node) return true;
        const auto& a = *lhs.m_Node;
        const auto& b = *rhs.m_Node;
        if (a.hash != b.hash) return false;
        return a.shape == b.shape
            && a.base == b.base
            && a.parameterized == b.parameterized
            && a.variadic == b.variadic
            && a.schema == b.schema
            && a.name == b.name
            && a.args == b.args;
    }

} // namespace Conform
