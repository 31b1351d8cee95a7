#include <retrace/core/Digest.hpp>

#include <openssl/evp.h>
#include <openssl/sha.h>

namespace RT {

namespace {

auto to_hex(unsigned char const* data, std::size_t size) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string           hex;
    hex.resize(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        hex[i * 2]     = digits[(data[i] >> 4) & 0x0F];
        hex[i * 2 + 1] = digits[data[i] & 0x0F];
    }
    return hex;
}

auto make_digest_error(char const* what) -> Error {
    return Error{Error::Code::UnknownError, std::string{"sha256: "} + what};
}

} // namespace

auto sha256Hex(std::span<const std::uint8_t> bytes) -> std::string {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(bytes.data(), bytes.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

auto sha256Hex(std::string_view text) -> std::string {
    return sha256Hex(std::span<const std::uint8_t>{reinterpret_cast<std::uint8_t const*>(text.data()), text.size()});
}

void Sha256Stream::ContextDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Sha256Stream::Sha256Stream()
    : context_(EVP_MD_CTX_new()) {
    ready_ = context_ && EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr) == 1;
}

Sha256Stream::~Sha256Stream() = default;

auto Sha256Stream::update(std::string_view bytes) -> Expected<void> {
    if (!ready_) {
        return std::unexpected(make_digest_error("context unavailable"));
    }
    if (EVP_DigestUpdate(context_.get(), bytes.data(), bytes.size()) != 1) {
        return std::unexpected(make_digest_error("update failed"));
    }
    return {};
}

auto Sha256Stream::snapshotHex(std::string_view trailer) const -> Expected<std::string> {
    if (!ready_) {
        return std::unexpected(make_digest_error("context unavailable"));
    }
    std::unique_ptr<EVP_MD_CTX, ContextDeleter> copy(EVP_MD_CTX_new());
    if (!copy || EVP_MD_CTX_copy_ex(copy.get(), context_.get()) != 1) {
        return std::unexpected(make_digest_error("context copy failed"));
    }
    if (!trailer.empty() && EVP_DigestUpdate(copy.get(), trailer.data(), trailer.size()) != 1) {
        return std::unexpected(make_digest_error("update failed"));
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int  length = 0;
    if (EVP_DigestFinal_ex(copy.get(), hash, &length) != 1) {
        return std::unexpected(make_digest_error("finalisation failed"));
    }
    return to_hex(hash, length);
}

} // namespace RT
