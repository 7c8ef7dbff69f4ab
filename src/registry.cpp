#include "conform/registry.hpp"


namespace Conform {

    const handler& HandlerRegistry::resolve(const type& t) {
        if (t.shape() == category::any) return instance<any_handler>();

        {
            std::shared_lock lock{ m_CacheMutex };
            auto it = m_Cache.find(t);
            if (it != m_Cache.end()) return *it->second;
        }

        const handler& h = resolve_uncached(t);
        std::unique_lock lock{ m_CacheMutex };
        m_Cache.try_emplace(t, &h);
        return h;
    }

    std::size_t HandlerRegistry::cache_size() const {
        std::shared_lock lock{ m_CacheMutex };
        return m_Cache.size();
    }

    const handler& HandlerRegistry::resolve_uncached(const type& t) {
        const kind_mask base = t.runtime_base();

        switch (t.shape()) {
        case category::any:
            return instance<any_handler>();
        case category::union_:
            return instance<union_handler>();
        case category::tuple:
            if (t.is_parameterized()) return instance<unsupported_handler>();
            break;
        case category::mapping:
            if (mask_contains(base, kind::dict)) return instance<dict_handler>();
            if (t.is_parameterized()) return instance<mapping_handler>();
            break;
        case category::sequence:
            if (mask_contains(base, kind::list)) return instance<list_handler>();
            if (t.is_parameterized()) return instance<collection_handler>();
            break;
        case category::collection:
            if (t.is_parameterized()) return instance<collection_handler>();
            break;
        case category::integral:
            return instance<integral_handler>();
        case category::real:
            return instance<real_handler>();
        default:
            break;
        }
        return instance<trivial_handler>();
    }

    HandlerRegistry& default_registry() {
        static HandlerRegistry registry;
        return registry;
    }

} // namespace Conform
