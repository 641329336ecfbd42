#ifndef DIGEST_HPP
#define DIGEST_HPP

#include "Types.hpp"
#include <cstddef>
#include <string>

namespace Digest {

constexpr std::size_t kDefaultReadBlockSize = 8 * 1024;

/**
 * @brief SHA-256 of an in-memory payload as lowercase hex.
 * @throws ErrorCodes::AppException (SYSTEM_DIGEST_FAILED) when OpenSSL fails.
 */
std::string sha256_hex(const ByteBuffer& data);

/**
 * @brief SHA-256 of a file, read in blocks of block_size bytes.
 * @throws ErrorCodes::AppException when the file cannot be opened or read,
 * or block_size is zero.
 */
std::string sha256_file_hex(const std::string& path,
                            std::size_t block_size = kDefaultReadBlockSize);

} // namespace Digest

#endif
