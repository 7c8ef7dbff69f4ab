#include "conform/tree.hpp"

#include <stdexcept>

#include <fmt/format.h>


namespace Conform {

    using allocator_type = std::pmr::polymorphic_allocator<tree>;

    tree::tree(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    tree::tree(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    tree::tree(bool b, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ b } {}

    tree::tree(double d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ d } {}

    tree::tree(const char* s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ tree_string{ s, res } } {}

    tree::tree(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ tree_string{ sv.begin(), sv.end(), res } } {}

    tree::tree(tree_string s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(s) } {}

    tree::tree(tree_array a, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(a) } {}

    tree::tree(tree_object o, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(o) } {}

    tree::tree(const tree& other)
        : m_MemRes{ other.m_MemRes }, m_Storage{ clone_storage(other.m_Storage, other.m_MemRes) } {}

    tree::tree(tree&& other) noexcept
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) } {}

    tree& tree::operator=(const tree& other) {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = clone_storage(other.m_Storage, other.m_MemRes);
        return *this;
    }

    tree& tree::operator=(tree&& other) noexcept {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = std::move(other.m_Storage);
        return *this;
    }

    tree tree::make_array(std::pmr::memory_resource* res) {
        return tree{ tree_array{ allocator_type{ res } }, res };
    }

    tree tree::make_object(std::pmr::memory_resource* res) {
        return tree{ tree_object{ std::less<>{}, res }, res };
    }

    tree_kind tree::type() const noexcept {
        switch (m_Storage.index()) {
        case 0: return tree_kind::null;
        case 1: return tree_kind::boolean;
        case 2: return tree_kind::integer;
        case 3: return tree_kind::real;
        case 4: return tree_kind::string;
        case 5: return tree_kind::array;
        case 6: return tree_kind::object;
        }
        return tree_kind::null;
    }

    bool tree::as_bool() const { return std::get<bool>(m_Storage); }
    std::int64_t tree::as_integer() const { return std::get<std::int64_t>(m_Storage); }
    double tree::as_real() const { return std::get<double>(m_Storage); }
    const tree_string& tree::as_string() const { return std::get<tree_string>(m_Storage); }
    tree_array& tree::as_array() { if (!is_array()) m_Storage = tree_array{ allocator_type{ m_MemRes } }; return std::get<tree_array>(m_Storage); }
    const tree_array& tree::as_array() const { return std::get<tree_array>(m_Storage); }
    tree_object& tree::as_object() { if (!is_object()) m_Storage = tree_object{ std::less<>{}, m_MemRes }; return std::get<tree_object>(m_Storage); }
    const tree_object& tree::as_object() const { return std::get<tree_object>(m_Storage); }

    std::size_t tree::size() const noexcept {
        if (is_array()) return as_array().size();
        if (is_object()) return as_object().size();
        return 0;
    }

    tree& tree::push_back(tree t) {
        return as_array().emplace_back(std::move(t));
    }

    tree& tree::operator[](std::size_t idx) {
        auto& arr = as_array();
        if (idx >= arr.size()) {
            arr.resize(idx + 1, tree{ m_MemRes });
        }
        return arr[idx];
    }

    const tree& tree::operator[](std::size_t idx) const {
        static const tree null_sentinel{};
        if (!is_array()) return null_sentinel;
        const auto& arr = as_array();
        if (idx >= arr.size()) return null_sentinel;
        return arr[idx];
    }

    tree& tree::operator[](std::string_view key) {
        auto& obj = as_object();
        auto it = obj.find(key);
        if (it == obj.end()) {
            it = obj.emplace(tree_string{ key.begin(), key.end(), m_MemRes }, tree{ m_MemRes }).first;
        }
        return it->second;
    }

    const tree* tree::find(std::string_view key) const {
        if (!is_object()) return nullptr;
        const auto& obj = as_object();
        auto it = obj.find(key);
        if (it == obj.end()) return nullptr;
        return std::addressof(it->second);
    }

    const tree& tree::at(std::string_view key) const {
        if (auto* t = find(key)) return *t;
        throw std::out_of_range{ fmt::format("Conform::tree::at: key \"{}\" not found", key) };
    }

    tree_storage_t tree::clone_storage(const tree_storage_t& s, std::pmr::memory_resource* res) {
        switch (s.index()) {
        case 0: return std::monostate{};
        case 1: return std::get<bool>(s);
        case 2: return std::get<std::int64_t>(s);
        case 3: return std::get<double>(s);
        case 4: return tree_string{ std::get<tree_string>(s), res };
        case 5: {
            const auto& arr = std::get<tree_array>(s);
            tree_array copy{ allocator_type{ res } };
            copy.reserve(arr.size());
            for (const auto& t : arr) copy.emplace_back(t);
            return copy;
        }
        case 6: {
            const auto& obj = std::get<tree_object>(s);
            tree_object copy{ std::less<>{}, res };
            for (const auto& [k, t] : obj) copy.emplace(tree_string{ k, res }, tree{ t });
            return copy;
        }
        }
        return std::monostate{};
    }

} // namespace Conform
