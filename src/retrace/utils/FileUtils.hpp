#pragma once

#include <retrace/core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace RT::FileUtils {

// Writes to a uniquely named sibling temp file, then renames it over path.
[[nodiscard]] auto writeFileAtomic(std::filesystem::path const& path,
                                   std::span<const std::byte> data,
                                   bool fsyncData) -> Expected<void>;

// std::nullopt when the file does not exist.
[[nodiscard]] auto readBinaryFile(std::filesystem::path const& path)
    -> Expected<std::optional<std::vector<std::byte>>>;
[[nodiscard]] auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

[[nodiscard]] auto removePathIfExists(std::filesystem::path const& path) -> Expected<void>;
[[nodiscard]] auto fileAge(std::filesystem::path const& path) -> std::optional<std::chrono::nanoseconds>;

} // namespace RT::FileUtils
