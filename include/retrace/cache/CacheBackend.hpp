#pragma once

#include <retrace/core/Error.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace RT::Cache {

/**
 * Byte store behind the replay cache. Keys are CacheKey::str() values.
 *
 * Implementations must be safe to call from several threads at once. A get()
 * miss is std::nullopt; an error from get() is treated by callers as a miss.
 * put() may silently drop or later evict entries to honour its own limits.
 */
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    [[nodiscard]] virtual auto get(std::string const& key) -> Expected<std::optional<std::vector<std::byte>>> = 0;
    virtual auto put(std::string const& key, std::span<const std::byte> bytes) -> Expected<void> = 0;
    virtual auto evict(std::string const& key) -> Expected<void> = 0;

    // Drops every entry whose key starts with "<session>/"; returns how many were removed.
    virtual auto evictSession(std::string_view session) -> Expected<std::size_t> = 0;
    virtual auto clear() -> Expected<void> = 0;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

} // namespace RT::Cache
