#include "quire/hash.hpp"

#include "quire/mmap.hpp"

#include <array>
#include <format>
#include <memory>
#include <new>
#include <openssl/evp.h>

namespace quire {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const {
        EVP_MD_CTX_free(ctx);
    }
};

std::string to_hex(const unsigned char *digest, unsigned int len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "sha256-";
    out.reserve(out.size() + len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(digits[(digest[i] >> 4) & 0xF]);
        out.push_back(digits[digest[i] & 0xF]);
    }
    return out;
}

} // namespace

std::string sha256_hex(std::initializer_list<std::string_view> parts) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;

    // Allocation failure inside OpenSSL leaves nothing sensible to return.
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw std::bad_alloc();
    for (std::string_view part : parts) {
        if (!part.empty() && EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1)
            throw std::bad_alloc();
    }
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1)
        throw std::bad_alloc();

    return to_hex(digest.data(), len);
}

std::string content_hash(std::string_view body, std::string_view front_matter_json) {
    const std::string body_len = std::format("{}:", body.size());
    return sha256_hex({body_len, body, front_matter_json});
}

Result<std::string> file_hash(const std::filesystem::path &path) {
    auto file = MappedFile::open(path);
    if (!file)
        return std::unexpected(file.error());
    return sha256_hex({(*file)->content()});
}

} // namespace quire
