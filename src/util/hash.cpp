#include "util/hash.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace zs::util {

namespace {
using MdCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

MdCtx newSha256() {
    MdCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("Failed to initialise SHA-256 context");
    return ctx;
}

std::string finish(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &len) != 1)
        throw std::runtime_error("Failed to finalise SHA-256 digest");

    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; ++i) oss << std::setw(2) << static_cast<int>(digest[i]);
    return oss.str();
}
}

std::string sha256Hex(const std::string& data) {
    const auto ctx = newSha256();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
        throw std::runtime_error("Failed to update SHA-256 digest");
    return finish(ctx.get());
}

std::string sha256File(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + path.string());

    const auto ctx = newSha256();
    std::array<char, 64 * 1024> buffer{};
    while (file.good()) {
        file.read(buffer.data(), buffer.size());
        if (file.gcount() > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(file.gcount())) != 1)
            throw std::runtime_error("Failed to update SHA-256 digest for " + path.string());
    }

    if (file.bad()) throw std::runtime_error("Failed to read file for hashing: " + path.string());
    return finish(ctx.get());
}

}
