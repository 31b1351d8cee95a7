#pragma once

#include <retrace/cache/CacheBackend.hpp>
#include <retrace/cache/ReplayCache.hpp>
#include <retrace/session/SessionRegistry.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace RT::Config {

struct RetraceOptions {
    std::string  cache_backend{"memory"};
    std::string  cache_dir{"cache-directory"};
    std::int64_t ram_cache_entries{64};
    std::int64_t cache_max_entries{0};
    std::int64_t cache_max_bytes{512ll * 1024 * 1024};
    std::int64_t cache_ttl_seconds{0};
    std::int64_t session_idle_timeout_seconds{1800};
    std::int64_t session_absolute_timeout_seconds{28800};
    std::int64_t max_sessions{0};
    bool         log_enabled{false};
    bool         show_help{false};
};

// Defaults, then RETRACE_* environment overrides, then flags. Unknown flags are errors.
auto ParseRetraceArguments(int argc, char** argv) -> std::optional<RetraceOptions>;

/*
 * Consumes the configuration flag at argv[index] (and its value, advancing
 * index). Returns std::nullopt when argv[index] is not a configuration flag,
 * false when it is one but its value is rejected, true otherwise.
 */
auto TryParseRetraceFlag(RetraceOptions& options, int argc, char** argv, int& index) -> std::optional<bool>;

void PrintRetraceOptionsUsage();

bool ApplyRetraceEnvOverrides(RetraceOptions& options);

auto ValidateRetraceOptions(RetraceOptions const& options) -> std::optional<std::string>;

bool IsValidCacheBackend(std::string_view backend);

[[nodiscard]] auto makeCacheBackend(RetraceOptions const& options) -> std::shared_ptr<Cache::CacheBackend>;
[[nodiscard]] auto makeReplayCacheOptions(RetraceOptions const& options) -> Cache::ReplayCache::Options;
[[nodiscard]] auto makeSessionConfig(RetraceOptions const& options) -> Session::SessionConfig;

} // namespace RT::Config
