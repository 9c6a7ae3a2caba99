#include "ContentHasher.hpp"

#include "OrganizerErrors.hpp"

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

#include <openssl/evp.h>

namespace {
struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::error_code lastErrorOr(std::errc fallback) {
    return errno != 0 ? std::error_code(errno, std::generic_category()) : std::make_error_code(fallback);
}
} // namespace

std::string hashFile(const std::filesystem::path& path) {
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throwIoError("Unable to open for hashing", path, lastErrorOr(std::errc::io_error));
    }

    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw OrganizerError("Unable to initialize SHA-256 digest");
    }

    std::vector<char> buffer(kHashChunkSize);
    while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || in.gcount() > 0) {
        const auto got = static_cast<std::size_t>(in.gcount());
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), got) != 1) {
            throw OrganizerError("SHA-256 digest update failed for `" + path.string() + "`");
        }
        if (got < buffer.size()) {
            break;
        }
    }

    if (in.bad()) {
        throwIoError("Failed to read while hashing", path, lastErrorOr(std::errc::io_error));
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLength) != 1) {
        throw OrganizerError("SHA-256 digest finalization failed for `" + path.string() + "`");
    }

    std::string hex;
    hex.reserve(digestLength * 2);
    for (unsigned int i = 0; i < digestLength; ++i) {
        char byte[3];
        std::snprintf(byte, sizeof(byte), "%02x", digest[i]);
        hex += byte;
    }
    return hex;
}
