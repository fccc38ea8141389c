/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <limits>
#include <memory>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <zlib.h>

#include <bridge/internal/error_codes.h>
#include <bridge/internal/logger.h>
#include <bridge/file_transfer/crypto.h>

namespace bridge
{
    namespace file_transfer
    {
        namespace
        {
            struct cipher_ctx_deleter
            {
                void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
            };
            using cipher_ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, cipher_ctx_deleter>;

            const EVP_CIPHER* ecb_cipher_for(size_t key_size)
            {
                switch (key_size)
                {
                case 16:
                    return EVP_aes_128_ecb();
                case 24:
                    return EVP_aes_192_ecb();
                case 32:
                    return EVP_aes_256_ecb();
                default:
                    return nullptr;
                }
            }

            std::string last_openssl_error()
            {
                char buf[256] = {};
                ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                return buf;
            }

            int run_cipher(bool encrypt, const bytes& key, const bytes& input, bytes& output)
            {
                auto* cipher = ecb_cipher_for(key.size());
                if (!cipher)
                {
                    BRIDGE_ERROR("unsupported aes key size {}", key.size());
                    return error::CRYPTO_ERROR();
                }
                if (input.size() > static_cast<size_t>(std::numeric_limits<int>::max() - EVP_MAX_BLOCK_LENGTH))
                {
                    BRIDGE_ERROR("aes input of {} bytes is too large", input.size());
                    return error::CRYPTO_ERROR();
                }

                cipher_ctx_ptr ctx(EVP_CIPHER_CTX_new());
                if (!ctx)
                {
                    BRIDGE_ERROR("EVP_CIPHER_CTX_new failed: {}", last_openssl_error());
                    return error::CRYPTO_ERROR();
                }
                if (EVP_CipherInit_ex(ctx.get(), cipher, nullptr, key.data(), nullptr, encrypt ? 1 : 0) != 1)
                {
                    BRIDGE_ERROR("EVP_CipherInit_ex failed: {}", last_openssl_error());
                    return error::CRYPTO_ERROR();
                }

                bytes result(input.size() + EVP_MAX_BLOCK_LENGTH);
                int written = 0;
                if (EVP_CipherUpdate(ctx.get(), result.data(), &written, input.data(), static_cast<int>(input.size()))
                    != 1)
                {
                    BRIDGE_ERROR("EVP_CipherUpdate failed: {}", last_openssl_error());
                    return error::CRYPTO_ERROR();
                }
                int final_written = 0;
                if (EVP_CipherFinal_ex(ctx.get(), result.data() + written, &final_written) != 1)
                {
                    // for decryption this is almost always bad padding, i.e. the wrong key
                    BRIDGE_ERROR("EVP_CipherFinal_ex failed: {}", last_openssl_error());
                    return error::CRYPTO_ERROR();
                }
                result.resize(static_cast<size_t>(written + final_written));
                output = std::move(result);
                return error::OK();
            }
        }

        int generate_aes_key(bytes& key)
        {
            bytes generated(aes_key_size);
            if (RAND_bytes(generated.data(), static_cast<int>(generated.size())) != 1)
            {
                BRIDGE_ERROR("RAND_bytes failed: {}", last_openssl_error());
                return error::CRYPTO_ERROR();
            }
            key = std::move(generated);
            return error::OK();
        }

        int aes_ecb_encrypt(const bytes& key, const bytes& plaintext, bytes& ciphertext)
        {
            return run_cipher(true, key, plaintext, ciphertext);
        }

        int aes_ecb_decrypt(const bytes& key, const bytes& ciphertext, bytes& plaintext)
        {
            return run_cipher(false, key, ciphertext, plaintext);
        }

        uint32_t adler32(const bytes& data, uint32_t seed)
        {
            uLong checksum = seed;
            const Bytef* cursor = data.data();
            size_t remaining = data.size();
            while (remaining > 0)
            {
                auto chunk = static_cast<uInt>(std::min<size_t>(remaining, std::numeric_limits<uInt>::max()));
                checksum = ::adler32(checksum, cursor, chunk);
                cursor += chunk;
                remaining -= chunk;
            }
            return static_cast<uint32_t>(checksum);
        }

        int md5_hex(const bytes& data, std::string& digest)
        {
            unsigned char md[EVP_MAX_MD_SIZE];
            unsigned int md_len = 0;
            if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_md5(), nullptr) != 1)
            {
                BRIDGE_ERROR("md5 digest failed: {}", last_openssl_error());
                return error::CRYPTO_ERROR();
            }

            static constexpr char hex[] = "0123456789abcdef";
            std::string text;
            text.reserve(md_len * 2);
            for (unsigned int i = 0; i < md_len; ++i)
            {
                text.push_back(hex[md[i] >> 4]);
                text.push_back(hex[md[i] & 0x0f]);
            }
            digest = std::move(text);
            return error::OK();
        }
    }
}
