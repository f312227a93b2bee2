#include "katafetch/digest.hpp"

#include <openssl/evp.h>
#include <fstream>
#include <memory>
#include <vector>

namespace katafetch {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const unsigned char* data, unsigned int len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

MdCtxPtr new_sha256_ctx() {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return nullptr;
    return ctx;
}

std::optional<std::string> finish(EVP_MD_CTX* ctx) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx, md, &md_len) != 1) return std::nullopt;
    return to_hex(md, md_len);
}

}  // namespace

std::optional<std::string> sha256_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return std::nullopt;

    auto ctx = new_sha256_ctx();
    if (!ctx) return std::nullopt;

    std::vector<char> buf(1 << 20);
    while (ifs) {
        ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = ifs.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
            return std::nullopt;
        }
    }
    if (ifs.bad()) return std::nullopt;
    return finish(ctx.get());
}

std::string sha256_hex(const std::string& data) {
    auto ctx = new_sha256_ctx();
    if (!ctx || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) return {};
    return finish(ctx.get()).value_or(std::string());
}

}  // namespace katafetch
