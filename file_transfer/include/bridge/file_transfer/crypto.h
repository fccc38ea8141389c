/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <bridge/internal/types.h>

namespace bridge
{
    namespace file_transfer
    {
        constexpr size_t aes_key_size = 16;

        int generate_aes_key(bytes& key);

        // AES in ECB mode with PKCS#7 padding, the key length selects AES-128/192/256
        int aes_ecb_encrypt(const bytes& key, const bytes& plaintext, bytes& ciphertext);
        int aes_ecb_decrypt(const bytes& key, const bytes& ciphertext, bytes& plaintext);

        uint32_t adler32(const bytes& data, uint32_t seed = 0);

        // lower case hex
        int md5_hex(const bytes& data, std::string& digest);
    }
}
