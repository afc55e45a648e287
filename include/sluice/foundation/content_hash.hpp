#pragma once

/// @file content_hash.hpp
/// @brief Canonical serialization and SHA-256 digests for cache keys and
///        request fingerprints (OpenSSL EVP).

#include <cstddef>
#include <string>
#include <string_view>

#include "sluice/foundation/types.hpp"

namespace sluice::foundation {

/// Serialize @p payload as a JSON object with keys in sorted order.
///
/// Two payloads with the same key/value pairs always produce the same text.
[[nodiscard]] std::string canonicalJson(const Payload& payload);

/// Lowercase hex SHA-256 of @p data (64 characters).
[[nodiscard]] std::string sha256Hex(std::string_view data);

/// The first @p hexChars characters of sha256Hex(data).
[[nodiscard]] std::string shortDigest(std::string_view data, std::size_t hexChars = 16);

/// Content fingerprint of a request: SHA-256 over
/// "<requestType>:<canonicalJson(payload)>".
[[nodiscard]] std::string requestFingerprint(std::string_view requestType,
                                             const Payload& payload);

}  // namespace sluice::foundation
