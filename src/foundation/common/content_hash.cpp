/// @file content_hash.cpp
/// @brief SHA-256 digests using the OpenSSL 3.x EVP API.

#include "sluice/foundation/content_hash.hpp"

#include "sluice/foundation/json_log_formatter.hpp"

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <stdexcept>

namespace sluice::foundation {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

}  // namespace

std::string canonicalJson(const Payload& payload) {
    std::string out;
    out += '{';
    bool first = true;
    for (const auto& [key, value] : payload) {
        if (!first) {
            out += ',';
        }
        appendJsonString(out, key);
        out += ':';
        appendJsonString(out, value);
        first = false;
    }
    out += '}';
    return out;
}

std::string sha256Hex(std::string_view data) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestLen) != 1) {
        // Only reachable on allocation failure inside libcrypto.
        throw std::runtime_error("SHA-256 digest failed");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(static_cast<std::size_t>(digestLen) * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        hex += kHex[digest[i] >> 4];
        hex += kHex[digest[i] & 0x0F];
    }
    return hex;
}

std::string shortDigest(std::string_view data, std::size_t hexChars) {
    auto full = sha256Hex(data);
    if (hexChars < full.size()) {
        full.resize(hexChars);
    }
    return full;
}

std::string requestFingerprint(std::string_view requestType, const Payload& payload) {
    std::string material(requestType);
    material += ':';
    material += canonicalJson(payload);
    return sha256Hex(material);
}

}  // namespace sluice::foundation
