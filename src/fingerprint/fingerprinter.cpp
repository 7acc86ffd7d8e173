#include "fingerprint/fingerprinter.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace clipstash {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

// Digest context already fed with the type tag and separator
MdCtxPtr begin_digest(ContentType type) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest initialisation failed");
    }
    const std::string_view tag = content_type_name(type);
    static constexpr unsigned char kSeparator = 0x00;
    if (EVP_DigestUpdate(ctx.get(), tag.data(), tag.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), &kSeparator, 1) != 1) {
        throw std::runtime_error("SHA-256 digest update failed");
    }
    return ctx;
}

ContentFingerprint finish_digest(EVP_MD_CTX* ctx) {
    ContentFingerprint fp;
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, fp.digest.data(), &len) != 1 ||
        len != ContentFingerprint::kDigestSize) {
        throw std::runtime_error("SHA-256 digest finalisation failed");
    }
    fp.hex = utils::bytes_to_hex(fp.digest.data(), fp.digest.size());
    return fp;
}

} // anonymous namespace

ContentFingerprint Fingerprinter::fingerprint(ContentType type, std::string_view payload) {
    auto ctx = begin_digest(type);
    if (!payload.empty() &&
        EVP_DigestUpdate(ctx.get(), payload.data(), payload.size()) != 1) {
        throw std::runtime_error("SHA-256 digest update failed");
    }
    return finish_digest(ctx.get());
}

Result<ContentFingerprint> Fingerprinter::fingerprint_file(
    ContentType type, const std::string& path) {

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<ContentFingerprint>::error(ErrorCategory::STORAGE_IO_ERROR,
            std::format("Cannot open {} for hashing: {}", path, std::strerror(errno)));
    }

    auto ctx = begin_digest(type);
    std::vector<char> buf(kReadChunk);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(got)) != 1) {
            throw std::runtime_error("SHA-256 digest update failed");
        }
    }
    if (in.bad()) {
        return Result<ContentFingerprint>::error(ErrorCategory::STORAGE_IO_ERROR,
            std::format("Read error while hashing {}", path));
    }
    return Result<ContentFingerprint>::ok(finish_digest(ctx.get()));
}

} // namespace clipstash
