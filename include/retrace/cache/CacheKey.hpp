#pragma once

#include <string>

namespace RT::Cache {

/*
 * Address of one resolved buffer: the session it belongs to, the signature of
 * that session's source image and the digest of the canonical serialization
 * of the action-stack prefix. Equal inputs always give the same key, and a
 * session's keys all share the "<session>/" prefix of their string form.
 */
struct CacheKey {
    std::string session;
    std::string signature;
    std::string prefixDigest;

    [[nodiscard]] auto str() const -> std::string { return session + '/' + signature + '/' + prefixDigest; }

    auto operator==(CacheKey const&) const -> bool = default;
};

} // namespace RT::Cache
