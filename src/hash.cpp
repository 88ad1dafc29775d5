#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

} // anonymous namespace

std::string calculate_sha256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw NudlException(string_format("error.open_file_failed", file_path.string()));
    }

    EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx || EVP_DigestInit_ex(md_ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw NudlException(get_string("error.openssl_init_failed"));
    }

    std::array<char, 8192> buffer;
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        if (EVP_DigestUpdate(md_ctx.get(), buffer.data(), static_cast<size_t>(file.gcount())) != 1) {
            throw NudlException(get_string("error.openssl_update_failed"));
        }
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest;
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(md_ctx.get(), digest.data(), &digest_len) != 1) {
        throw NudlException(get_string("error.openssl_final_failed"));
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < digest_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

bool sha256_matches(const std::filesystem::path& file_path, const std::string& expected) {
    return iequals(calculate_sha256(file_path), expected);
}
