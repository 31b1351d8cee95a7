#pragma once

#include <retrace/cache/CacheBackend.hpp>

#include <chrono>
#include <filesystem>

namespace RT::Cache {

/*
 * One file per entry under `directory`, grouped in one sub-directory per
 * session:
 *   <directory>/<session>/<sha256(key)>.rtbf
 * Writes go through a temp file and a rename, so readers never observe a
 * partially written entry. With a non-zero ttl, entries older than ttl (by
 * modification time) read as misses and are removed.
 */
class FileCacheBackend final : public CacheBackend {
public:
    struct Options {
        std::filesystem::path     directory = "cache-directory";
        std::chrono::milliseconds ttl{0};
        bool                      fsyncWrites = false;
    };

    explicit FileCacheBackend(Options options);

    [[nodiscard]] auto get(std::string const& key) -> Expected<std::optional<std::vector<std::byte>>> override;
    auto put(std::string const& key, std::span<const std::byte> bytes) -> Expected<void> override;
    auto evict(std::string const& key) -> Expected<void> override;
    auto evictSession(std::string_view session) -> Expected<std::size_t> override;
    auto clear() -> Expected<void> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "filesystem"; }
    [[nodiscard]] auto directory() const -> std::filesystem::path const& { return options_.directory; }
    [[nodiscard]] auto pathForKey(std::string const& key) const -> std::filesystem::path;

private:
    [[nodiscard]] auto sessionDirectory(std::string_view session) const -> std::filesystem::path;

    Options options_;
};

} // namespace RT::Cache
