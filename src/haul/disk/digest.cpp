// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/disk/digest.hpp>
#include <haul/disk/error.hpp>
#include <haul/core/error.hpp>
#include <openssl/evp.h>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <memory>
#include <vector>

namespace haul::disk {

namespace {

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;  // 256 KB

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

struct FileCloser {
    void operator()(std::FILE* f) const noexcept { std::fclose(f); }
};

const EVP_MD* evp_for(core::DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case core::DigestAlgorithm::md5:    return EVP_md5();
        case core::DigestAlgorithm::sha1:   return EVP_sha1();
        case core::DigestAlgorithm::sha256: return EVP_sha256();
    }
    return nullptr;
}

} // namespace

std::expected<std::string, std::error_code>
file_digest(const std::filesystem::path& path, core::DigestAlgorithm algorithm) noexcept {
    const EVP_MD* md = evp_for(algorithm);
    if (!md) {
        return std::unexpected(make_error_code(core::TaskErrc::unsupported_digest));
    }

    std::unique_ptr<std::FILE, FileCloser> file(std::fopen(path.c_str(), "rb"));
    if (!file) {
        return std::unexpected(from_errno(errno, DiskErrc::read_error));
    }

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        return std::unexpected(make_error_code(core::TaskErrc::unsupported_digest));
    }

    std::vector<unsigned char> buffer(READ_BUFFER_SIZE);
    while (true) {
        auto n = std::fread(buffer.data(), 1, buffer.size(), file.get());
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), n) != 1) {
            return std::unexpected(make_error_code(core::TaskErrc::unsupported_digest));
        }
        if (n < buffer.size()) {
            if (std::ferror(file.get())) {
                return std::unexpected(make_error_code(DiskErrc::read_error));
            }
            break;
        }
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
        return std::unexpected(make_error_code(core::TaskErrc::unsupported_digest));
    }

    constexpr char HEX[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(out_len * 2);
    for (unsigned int i = 0; i < out_len; ++i) {
        hex += HEX[out[i] >> 4];
        hex += HEX[out[i] & 0x0F];
    }
    return hex;
}

bool digest_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace haul::disk
