#pragma once

#include <retrace/core/Error.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace RT {

[[nodiscard]] auto sha256Hex(std::span<const std::uint8_t> bytes) -> std::string;
[[nodiscard]] auto sha256Hex(std::string_view text) -> std::string;

/**
 * Incremental SHA-256. snapshotHex() finalises a copy of the running context,
 * so the digest of every prefix of a byte stream can be read off while the
 * stream is still being fed.
 */
class Sha256Stream {
public:
    Sha256Stream();
    ~Sha256Stream();

    Sha256Stream(Sha256Stream const&)                    = delete;
    auto operator=(Sha256Stream const&) -> Sha256Stream& = delete;

    auto update(std::string_view bytes) -> Expected<void>;
    [[nodiscard]] auto snapshotHex(std::string_view trailer = {}) const -> Expected<std::string>;

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    std::unique_ptr<evp_md_ctx_st, ContextDeleter> context_;
    bool                                           ready_ = false;
};

} // namespace RT
