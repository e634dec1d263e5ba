/**
 * tierstage - Crypto helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>

namespace tierstage::crypto
{

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // Hex string of `byte_count` random bytes, used for private scratch names.
    std::string random_token(std::size_t byte_count = 8);

} // namespace tierstage::crypto
