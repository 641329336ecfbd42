#include "Digest.hpp"
#include "AppException.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>
#include <vector>

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext new_sha256_context()
{
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        THROW_APP_ERROR(ErrorCodes::Code::SYSTEM_DIGEST_FAILED, "EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        THROW_APP_ERROR(ErrorCodes::Code::SYSTEM_DIGEST_FAILED, "EVP_DigestInit_ex failed");
    }
    return ctx;
}

void update(EVP_MD_CTX* ctx, const void* data, std::size_t size)
{
    if (EVP_DigestUpdate(ctx, data, size) != 1) {
        THROW_APP_ERROR(ErrorCodes::Code::SYSTEM_DIGEST_FAILED, "EVP_DigestUpdate failed");
    }
}

std::string finish_hex(EVP_MD_CTX* ctx)
{
    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash.data(), &hash_len) != 1) {
        THROW_APP_ERROR(ErrorCodes::Code::SYSTEM_DIGEST_FAILED, "EVP_DigestFinal_ex failed");
    }

    static constexpr char kHexDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(static_cast<std::size_t>(hash_len) * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex.push_back(kHexDigits[hash[i] >> 4]);
        hex.push_back(kHexDigits[hash[i] & 0x0F]);
    }
    return hex;
}

} // namespace

namespace Digest {

std::string sha256_hex(const ByteBuffer& data)
{
    auto ctx = new_sha256_context();
    update(ctx.get(), data.data(), data.size());
    return finish_hex(ctx.get());
}

std::string sha256_file_hex(const std::string& path, std::size_t block_size)
{
    if (block_size == 0) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID_VALUE, "Digest read block size must be positive");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_OPEN_FAILED, "File: " + path);
    }

    auto ctx = new_sha256_context();
    std::vector<char> buffer(block_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0) {
            update(ctx.get(), buffer.data(), static_cast<std::size_t>(bytes_read));
        }
    }
    if (file.bad()) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_READ_FAILED, "File: " + path);
    }
    return finish_hex(ctx.get());
}

} // namespace Digest
