#include <retrace/config/RetraceOptions.hpp>

#include <retrace/cache/FileCacheBackend.hpp>
#include <retrace/cache/MemoryCacheBackend.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>

namespace RT::Config {

namespace {

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

constexpr std::int64_t kMaxI64 = std::numeric_limits<std::int64_t>::max();

struct IntegerSetting {
    char const*   flag;
    char const*   env;
    std::int64_t RetraceOptions::*field;
};

constexpr IntegerSetting kIntegerSettings[] = {
    {"--ram-cache-entries", "RETRACE_RAM_CACHE_ENTRIES", &RetraceOptions::ram_cache_entries},
    {"--cache-max-entries", "RETRACE_CACHE_MAX_ENTRIES", &RetraceOptions::cache_max_entries},
    {"--cache-max-bytes", "RETRACE_CACHE_MAX_BYTES", &RetraceOptions::cache_max_bytes},
    {"--cache-ttl", "RETRACE_CACHE_TTL_SECONDS", &RetraceOptions::cache_ttl_seconds},
    {"--session-timeout", "RETRACE_SESSION_TIMEOUT", &RetraceOptions::session_idle_timeout_seconds},
    {"--session-max-age", "RETRACE_SESSION_MAX_AGE", &RetraceOptions::session_absolute_timeout_seconds},
    {"--max-sessions", "RETRACE_MAX_SESSIONS", &RetraceOptions::max_sessions},
};

} // namespace

bool IsValidCacheBackend(std::string_view backend) {
    return backend == "memory" || backend == "filesystem";
}

auto ValidateRetraceOptions(RetraceOptions const& options) -> std::optional<std::string> {
    if (!IsValidCacheBackend(options.cache_backend)) {
        return std::string{"Unsupported cache backend: " + options.cache_backend};
    }
    if (options.cache_backend == "filesystem" && options.cache_dir.empty()) {
        return std::string{"The filesystem cache backend requires a non-empty --cache-dir"};
    }
    for (auto const& setting : kIntegerSettings) {
        if (options.*setting.field < 0) {
            return std::string{setting.flag} + " must be >= 0";
        }
    }
    return std::nullopt;
}

bool ApplyRetraceEnvOverrides(RetraceOptions& options) {
    if (!apply_env("RETRACE_CACHE_BACKEND", [&](std::string_view value) {
            if (!IsValidCacheBackend(value)) {
                std::cerr << "RETRACE_CACHE_BACKEND must be 'memory' or 'filesystem'\n";
                return false;
            }
            options.cache_backend = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("RETRACE_CACHE_DIR", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "RETRACE_CACHE_DIR must not be empty\n";
                return false;
            }
            options.cache_dir = std::string{value};
            return true;
        })) {
        return false;
    }

    for (auto const& setting : kIntegerSettings) {
        auto& target = options.*setting.field;
        if (!apply_env(setting.env, [&](std::string_view value) {
                std::int64_t parsed = target;
                if (!parse_integer_in_range<std::int64_t>(value, 0, kMaxI64, parsed)) {
                    std::cerr << setting.env << " must be >= 0\n";
                    return false;
                }
                target = parsed;
                return true;
            })) {
            return false;
        }
    }

    if (!apply_env("RETRACE_LOG", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << "RETRACE_LOG must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            options.log_enabled = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintRetraceOptionsUsage() {
    std::cout << "  --cache-backend <name>  Cache storage backend (memory|filesystem, default memory)\n"
              << "  --cache-dir <path>      Directory of the filesystem backend (default cache-directory)\n"
              << "  --ram-cache-entries <n> Resolved buffers kept in RAM, 0 disables (default 64)\n"
              << "  --cache-max-entries <n> Memory backend entry limit, 0 = unlimited (default 0)\n"
              << "  --cache-max-bytes <n>   Memory backend byte limit, 0 = unlimited (default 536870912)\n"
              << "  --cache-ttl <sec>       Cache entry lifetime in seconds, 0 = forever (default 0)\n"
              << "  --session-timeout <sec> Session idle timeout in seconds (default 1800)\n"
              << "  --session-max-age <sec> Session absolute lifetime in seconds (default 28800)\n"
              << "  --max-sessions <n>      Live session limit, 0 = unlimited (default 0)\n"
              << "  --log                   Enable debug logging (builds with RT_LOG_DEBUG)\n"
              << "  --help                  Show this help\n";
}

auto TryParseRetraceFlag(RetraceOptions& options, int argc, char** argv, int& index) -> std::optional<bool> {
    std::string_view arg{argv[index]};

    auto require_value = [&](std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    if (arg == "--help" || arg == "-h") {
        options.show_help = true;
        return true;
    }
    if (arg == "--log") {
        options.log_enabled = true;
        return true;
    }
    if (arg == "--cache-backend") {
        auto value = require_value(arg);
        if (!value) {
            return false;
        }
        if (!IsValidCacheBackend(*value)) {
            std::cerr << "--cache-backend must be 'memory' or 'filesystem'\n";
            return false;
        }
        options.cache_backend = std::string{*value};
        return true;
    }
    if (arg == "--cache-dir") {
        auto value = require_value(arg);
        if (!value) {
            return false;
        }
        if (value->empty()) {
            std::cerr << "--cache-dir must not be empty\n";
            return false;
        }
        options.cache_dir = std::string{*value};
        return true;
    }
    for (auto const& setting : kIntegerSettings) {
        if (arg != setting.flag) {
            continue;
        }
        auto value = require_value(arg);
        if (!value) {
            return false;
        }
        std::int64_t parsed = options.*setting.field;
        if (!parse_integer_in_range<std::int64_t>(*value, 0, kMaxI64, parsed)) {
            std::cerr << setting.flag << " must be >= 0\n";
            return false;
        }
        options.*setting.field = parsed;
        return true;
    }
    return std::nullopt;
}

std::optional<RetraceOptions> ParseRetraceArguments(int argc, char** argv) {
    RetraceOptions options{};
    if (!ApplyRetraceEnvOverrides(options)) {
        return std::nullopt;
    }

    for (int i = 1; i < argc; ++i) {
        auto handled = TryParseRetraceFlag(options, argc, argv, i);
        if (!handled.has_value()) {
            std::cerr << "Unknown argument: " << argv[i] << "\n";
            return std::nullopt;
        }
        if (!*handled) {
            return std::nullopt;
        }
    }

    if (auto error = ValidateRetraceOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

auto makeCacheBackend(RetraceOptions const& options) -> std::shared_ptr<Cache::CacheBackend> {
    auto const ttl = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::seconds{options.cache_ttl_seconds});
    if (options.cache_backend == "filesystem") {
        Cache::FileCacheBackend::Options fileOptions;
        fileOptions.directory = options.cache_dir;
        fileOptions.ttl       = ttl;
        return std::make_shared<Cache::FileCacheBackend>(std::move(fileOptions));
    }
    Cache::MemoryCacheBackend::Limits limits;
    limits.maxEntries = static_cast<std::size_t>(options.cache_max_entries);
    limits.maxBytes   = static_cast<std::size_t>(options.cache_max_bytes);
    limits.ttl        = ttl;
    return std::make_shared<Cache::MemoryCacheBackend>(limits);
}

auto makeReplayCacheOptions(RetraceOptions const& options) -> Cache::ReplayCache::Options {
    Cache::ReplayCache::Options cacheOptions;
    cacheOptions.ramCacheEntries = static_cast<std::size_t>(options.ram_cache_entries);
    return cacheOptions;
}

auto makeSessionConfig(RetraceOptions const& options) -> Session::SessionConfig {
    Session::SessionConfig config;
    config.idleTimeout     = std::chrono::seconds{options.session_idle_timeout_seconds};
    config.absoluteTimeout = std::chrono::seconds{options.session_absolute_timeout_seconds};
    config.maxSessions     = static_cast<std::size_t>(options.max_sessions);
    return config;
}

} // namespace RT::Config
