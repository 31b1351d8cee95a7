#include <retrace/cache/FileCacheBackend.hpp>

#include <retrace/core/Digest.hpp>

#include "log/TaggedLogger.hpp"
#include "utils/FileUtils.hpp"

#include <algorithm>
#include <system_error>

namespace RT::Cache {

namespace {

constexpr std::string_view kEntryExtension = ".rtbf";

auto is_plain_component(std::string_view text) -> bool {
    if (text.empty() || text == "." || text == ".." || text.size() > 128) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_'
               || c == '.';
    });
}

auto session_of(std::string_view key) -> std::string_view {
    auto const slash = key.find('/');
    return slash == std::string_view::npos ? key : key.substr(0, slash);
}

auto make_backend_error(std::string message) -> Error {
    return Error{Error::Code::CacheBackendError, std::move(message)};
}

} // namespace

FileCacheBackend::FileCacheBackend(Options options)
    : options_(std::move(options)) {}

auto FileCacheBackend::sessionDirectory(std::string_view session) const -> std::filesystem::path {
    if (is_plain_component(session)) {
        return options_.directory / std::string{session};
    }
    return options_.directory / ("s-" + sha256Hex(session).substr(0, 32));
}

auto FileCacheBackend::pathForKey(std::string const& key) const -> std::filesystem::path {
    auto file = sha256Hex(std::string_view{key});
    file.append(kEntryExtension);
    return sessionDirectory(session_of(key)) / file;
}

auto FileCacheBackend::get(std::string const& key) -> Expected<std::optional<std::vector<std::byte>>> {
    auto const path = pathForKey(key);
    if (options_.ttl.count() > 0) {
        if (auto age = FileUtils::fileAge(path); age && *age > options_.ttl) {
            rt_log("Expired cache file " + path.string(), "ReplayCache");
            if (auto removed = FileUtils::removePathIfExists(path); !removed) {
                return std::unexpected(removed.error());
            }
            return std::optional<std::vector<std::byte>>{};
        }
    }
    return FileUtils::readBinaryFile(path);
}

auto FileCacheBackend::put(std::string const& key, std::span<const std::byte> bytes) -> Expected<void> {
    return FileUtils::writeFileAtomic(pathForKey(key), bytes, options_.fsyncWrites);
}

auto FileCacheBackend::evict(std::string const& key) -> Expected<void> {
    return FileUtils::removePathIfExists(pathForKey(key));
}

auto FileCacheBackend::evictSession(std::string_view session) -> Expected<std::size_t> {
    auto const      dir = sessionDirectory(session);
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return std::size_t{0};
    }
    std::size_t removed = 0;
    for (auto const& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.path().extension() == kEntryExtension) {
            ++removed;
        }
    }
    if (ec) {
        return std::unexpected(make_backend_error("failed to list '" + dir.string() + "'"));
    }
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        return std::unexpected(make_backend_error("failed to remove '" + dir.string() + "'"));
    }
    return removed;
}

auto FileCacheBackend::clear() -> Expected<void> {
    std::error_code ec;
    if (!std::filesystem::exists(options_.directory, ec)) {
        return {};
    }
    for (auto const& entry : std::filesystem::directory_iterator(options_.directory, ec)) {
        std::error_code removeEc;
        std::filesystem::remove_all(entry.path(), removeEc);
        if (removeEc) {
            return std::unexpected(make_backend_error("failed to remove '" + entry.path().string() + "'"));
        }
    }
    if (ec) {
        return std::unexpected(make_backend_error("failed to list '" + options_.directory.string() + "'"));
    }
    return {};
}

} // namespace RT::Cache
