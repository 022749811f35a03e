#include "core/Crypto.hpp"
#include "core/Logger.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace ward {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSha256Context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

std::string FinishHex(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
        return "";
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; i++) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

} // namespace

std::string GenerateUUID() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        LOG_ERROR("RAND_bytes failed while generating a UUID");
        return "";
    }

    // Set version 4 bits
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    // Set variant bits
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    char uuid_str[37];
    std::snprintf(uuid_str, sizeof(uuid_str),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0], bytes[1], bytes[2], bytes[3],
        bytes[4], bytes[5],
        bytes[6], bytes[7],
        bytes[8], bytes[9],
        bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);

    return std::string(uuid_str);
}

std::string Sha256Hex(const std::string& data) {
    DigestContext ctx = NewSha256Context();
    if (!ctx) return "";

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return "";
    }
    return FinishHex(ctx.get());
}

std::string FileSha256Hex(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) return "";

    DigestContext ctx = NewSha256Context();
    if (!ctx) return "";

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount()));
    }
    return FinishHex(ctx.get());
}

} // namespace ward
