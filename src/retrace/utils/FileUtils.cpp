#include "utils/FileUtils.hpp"

#include <atomic>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace RT::FileUtils {

namespace {

auto make_io_error(std::string message, std::filesystem::path const& path) -> Error {
    return Error{Error::Code::CacheBackendError, std::move(message) + " '" + path.string() + "'"};
}

auto temp_suffix() -> std::string {
    static std::atomic<std::uint64_t>            counter{0};
    thread_local std::mt19937_64                 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::ostringstream                           oss;
    oss << ".tmp-" << std::hex << std::nouppercase << std::setfill('0') << std::setw(16) << dist(engine) << '-'
        << counter.fetch_add(1, std::memory_order_relaxed);
    return oss.str();
}

auto fsync_directory(std::filesystem::path const& dir) -> Expected<void> {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return std::unexpected(make_io_error("open directory failed", dir));
    }
    int const rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        return std::unexpected(make_io_error("fsync failed", dir));
    }
    return {};
}

} // namespace

auto writeFileAtomic(std::filesystem::path const& path, std::span<const std::byte> data, bool fsyncData)
    -> Expected<void> {
    std::error_code ec;
    auto            parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(make_io_error("failed to create directories for", path));
        }
    }

    auto tmpPath = path;
    tmpPath += temp_suffix();

    int fd = ::open(tmpPath.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd < 0) {
        return std::unexpected(make_io_error("failed to open temp file", tmpPath));
    }

    std::size_t totalWritten = 0;
    while (totalWritten < data.size()) {
        auto const* ptr       = data.data() + static_cast<std::ptrdiff_t>(totalWritten);
        auto const  remaining = data.size() - totalWritten;
        auto        written   = ::write(fd, reinterpret_cast<void const*>(ptr), remaining);
        if (written <= 0) {
            ::close(fd);
            std::filesystem::remove(tmpPath, ec);
            return std::unexpected(make_io_error("failed to write temp file", tmpPath));
        }
        totalWritten += static_cast<std::size_t>(written);
    }

    if (fsyncData && ::fsync(fd) != 0) {
        ::close(fd);
        std::filesystem::remove(tmpPath, ec);
        return std::unexpected(make_io_error("fsync failed", tmpPath));
    }

    if (::close(fd) != 0) {
        std::filesystem::remove(tmpPath, ec);
        return std::unexpected(make_io_error("failed to close temp file", tmpPath));
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        return std::unexpected(make_io_error("failed to rename temp file onto", path));
    }

    if (fsyncData && !parent.empty()) {
        return fsync_directory(parent);
    }
    return {};
}

auto readBinaryFile(std::filesystem::path const& path) -> Expected<std::optional<std::vector<std::byte>>> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) && !ec) {
            return std::optional<std::vector<std::byte>>{};
        }
        return std::unexpected(make_io_error("failed to open", path));
    }
    stream.seekg(0, std::ios::end);
    auto const end = stream.tellg();
    if (end < 0) {
        return std::unexpected(make_io_error("failed to size", path));
    }
    stream.seekg(0, std::ios::beg);
    std::vector<std::byte> buffer(static_cast<std::size_t>(end));
    if (!stream.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()))) {
        return std::unexpected(make_io_error("failed to read", path));
    }
    return std::optional<std::vector<std::byte>>{std::move(buffer)};
}

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(Error{Error::Code::InvalidError, "cannot open '" + path.string() + "'"});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof()) {
        return std::unexpected(Error{Error::Code::UnknownError, "failed to read '" + path.string() + "'"});
    }
    return oss.str();
}

auto removePathIfExists(std::filesystem::path const& path) -> Expected<void> {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return std::unexpected(make_io_error("failed to remove", path));
    }
    return {};
}

auto fileAge(std::filesystem::path const& path) -> std::optional<std::chrono::nanoseconds> {
    std::error_code ec;
    auto const      written = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    auto const age = std::filesystem::file_time_type::clock::now() - written;
    return std::chrono::duration_cast<std::chrono::nanoseconds>(age);
}

} // namespace RT::FileUtils
