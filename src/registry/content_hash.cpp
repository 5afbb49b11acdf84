#include "calibet/registry/content_hash.hpp"

#include <memory>

#include <openssl/evp.h>

namespace calibet::registry {

namespace {

constexpr const char* kComponent = "registry.hash";

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

} // anonymous namespace

auto sha1_hex(std::string_view data) -> std::expected<std::string, core::error> {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return core::make_error(core::error_code::internal, "EVP_MD_CTX_new failed", kComponent);
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        return core::make_error(core::error_code::internal, "SHA-1 digest failed", kComponent);
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0x0F]);
    }
    return out;
}

auto make_version_id(std::string_view name, const nlohmann::json& metadata,
                     std::string_view created_at)
    -> std::expected<std::string, core::error> {
    const nlohmann::json payload{
        {"name", std::string(name)},
        {"metadata", metadata},
        {"created_at", std::string(created_at)},
    };
    std::string canonical;
    try {
        canonical = payload.dump();
    } catch (const nlohmann::json::exception& e) {
        return core::make_error(core::error_code::invalid_argument,
                                std::string("metadata is not serializable: ") + e.what(), kComponent);
    }
    auto digest = sha1_hex(canonical);
    if (!digest) return std::unexpected(digest.error());
    return digest->substr(0, kVersionIdLength);
}

auto is_version_id(std::string_view s) noexcept -> bool {
    if (s.size() != kVersionIdLength) return false;
    for (char c : s) {
        const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) return false;
    }
    return true;
}

} // namespace calibet::registry
