#pragma once


/*
    ------------------------------------------------------
    Conform::HandlerRegistry - Descriptor to handler lookup
    ------------------------------------------------------
    `resolve(t)` picks the handler for a descriptor. First match wins:

    1. `any`                      -> any handler
    2. union                      -> union handler
    3. containers:
        * tuple: parameterized    -> unsupported handler, otherwise trivial
        * mapping: base admits the native dict -> dict handler;
          otherwise parameterized -> mapping handler, otherwise trivial
        * sequence: base admits the native list -> list handler;
          otherwise parameterized -> collection handler, otherwise trivial
        * collection: parameterized -> collection handler, otherwise trivial
    4. `int`                      -> integral handler (never `bool`)
    5. `float`                    -> real handler
    6. anything else              -> trivial handler

    -------
    Caching
    -------
    - Handler instances are created lazily, once per handler class, and live
      as long as the registry
    - Resolutions are cached by descriptor (structural hash and equality)
      behind a shared mutex, so lookups from many threads only contend on
      the first resolution of a descriptor. `any` is resolved directly
    - Racing first resolutions of one descriptor store the same handler,
      so the cache is write-once per key in effect
*/

/// @defgroup ConformRegistry Handler Registry
/// @ingroup ConformConverter

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

#include "conform/config.hpp"
#include "conform/handlers.hpp"
#include "conform/type.hpp"

namespace Conform {

    /// @ingroup ConformRegistry
    /// @brief Resolves descriptors to handlers and caches the result.
    class CONFORM_API HandlerRegistry {
    public:
        HandlerRegistry() = default;

        HandlerRegistry(const HandlerRegistry&) = delete;
        HandlerRegistry& operator=(const HandlerRegistry&) = delete;

        /// @brief Handler responsible for @p t
        [[nodiscard]] const handler& resolve(const type& t);

        /// @brief The shared instance of handler class @p H
        template<class H>
        [[nodiscard]] const H& instance() {
            std::lock_guard lock{ m_InstanceMutex };
            auto& slot = m_Instances[std::type_index{ typeid(H) }];
            if (!slot) slot = std::make_unique<H>();
            return static_cast<const H&>(*slot);
        }

        /// @brief Number of cached resolutions
        [[nodiscard]] std::size_t cache_size() const;

    private:
        [[nodiscard]] const handler& resolve_uncached(const type& t);

        std::mutex m_InstanceMutex;
        std::unordered_map<std::type_index, std::unique_ptr<handler>> m_Instances;

        mutable std::shared_mutex m_CacheMutex;
        std::unordered_map<type, const handler*, type_hash> m_Cache;
    };

    /// @ingroup ConformRegistry
    /// @brief Process-lifetime registry shared by the default converters
    [[nodiscard]] CONFORM_API HandlerRegistry& default_registry();

} // namespace Conform
