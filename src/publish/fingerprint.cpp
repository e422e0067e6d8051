/// @file fingerprint.cpp
/// @brief Content fingerprints via OpenSSL's EVP digest interface

#include <pipeforge/publish/fingerprint.hpp>

#include <pipeforge/core/log.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace pipeforge_publish {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

/// Incremental MD5 over one or more buffers
class Md5 {
public:
    Md5() : m_ctx(EVP_MD_CTX_new()) {
        if (!m_ctx || EVP_DigestInit_ex(m_ctx.get(), EVP_md5(), nullptr) != 1) {
            throw std::runtime_error("MD5 digest initialization failed");
        }
    }

    void update(const void* data, std::size_t size) {
        if (EVP_DigestUpdate(m_ctx.get(), data, size) != 1) {
            throw std::runtime_error("MD5 digest update failed");
        }
    }

    Fingerprint finish() {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(m_ctx.get(), digest, &len) != 1 || len != Fingerprint::SIZE) {
            throw std::runtime_error("MD5 digest finalization failed");
        }

        Fingerprint fp;
        std::copy(digest, digest + Fingerprint::SIZE, fp.bytes.begin());
        return fp;
    }

private:
    DigestContext m_ctx;
};

} // anonymous namespace

std::string Fingerprint::to_hex() const {
    static constexpr char DIGITS[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(SIZE * 2);
    for (auto byte : bytes) {
        hex += DIGITS[byte >> 4];
        hex += DIGITS[byte & 0x0f];
    }
    return hex;
}

Fingerprint fingerprint_bytes(std::string_view data) {
    Md5 md5;
    md5.update(data.data(), data.size());
    return md5.finish();
}

std::optional<Fingerprint> fingerprint_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        pipeforge_core::publish_logger()->warn("Cannot read {}, treating it as unpublished", path.string());
        return std::nullopt;
    }

    try {
        Md5 md5;
        char buffer[8192];
        while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
            md5.update(buffer, static_cast<std::size_t>(file.gcount()));
        }
        if (file.bad()) {
            pipeforge_core::publish_logger()->warn("Read error on {}, treating it as unpublished", path.string());
            return std::nullopt;
        }
        return md5.finish();
    } catch (const std::runtime_error& ex) {
        pipeforge_core::publish_logger()->warn("Cannot fingerprint {}: {}", path.string(), ex.what());
        return std::nullopt;
    }
}

} // namespace pipeforge_publish
