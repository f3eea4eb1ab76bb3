/**
 * ChunkDrive - Random token helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <string>

namespace chunkdrive::crypto
{

    void ensure_sodium_init();

    // Hex encoding of `byte_count` random bytes.
    std::string random_token(std::size_t byte_count = 16);

} // namespace chunkdrive::crypto
