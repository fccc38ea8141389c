/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <string>

#include <gtest/gtest.h>

#include <bridge/internal/error_codes.h>
#include <bridge/file_transfer/file_transfer.h>

using bridge::bytes;
namespace ft = bridge::file_transfer;

namespace
{
    bytes as_bytes(const std::string& text)
    {
        return bytes(text.begin(), text.end());
    }

    bytes sequential(size_t size, uint8_t start = 0)
    {
        bytes data(size);
        for (size_t i = 0; i < size; ++i)
            data[i] = static_cast<uint8_t>(start + i);
        return data;
    }
}

TEST(crypto_test, generated_key_is_128_bits)
{
    bytes first;
    bytes second;
    ASSERT_EQ(ft::generate_aes_key(first), bridge::error::OK());
    ASSERT_EQ(ft::generate_aes_key(second), bridge::error::OK());
    EXPECT_EQ(first.size(), ft::aes_key_size);
    EXPECT_NE(first, second);
}

// FIPS-197 appendix C.1
TEST(crypto_test, aes_128_known_answer)
{
    auto key = sequential(16);
    bytes plaintext = {0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88, 0x99, 0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff};
    bytes expected = {0x69, 0xc4, 0xe0, 0xd8, 0x6a, 0x7b, 0x04, 0x30, 0xd8, 0xcd, 0xb7, 0x80, 0x70, 0xb4, 0xc5, 0x5a};

    bytes ciphertext;
    ASSERT_EQ(ft::aes_ecb_encrypt(key, plaintext, ciphertext), bridge::error::OK());
    // a whole block of padding follows a block aligned input
    ASSERT_EQ(ciphertext.size(), 32u);
    EXPECT_EQ(bytes(ciphertext.begin(), ciphertext.begin() + 16), expected);
}

TEST(crypto_test, ciphertext_is_padded_to_block)
{
    bytes key;
    ASSERT_EQ(ft::generate_aes_key(key), bridge::error::OK());

    for (size_t size : {0u, 1u, 15u, 17u, 1000u})
    {
        auto plaintext = sequential(size, 3);
        bytes ciphertext;
        ASSERT_EQ(ft::aes_ecb_encrypt(key, plaintext, ciphertext), bridge::error::OK());
        EXPECT_EQ(ciphertext.size(), (size / 16 + 1) * 16) << "size " << size;

        bytes decrypted;
        ASSERT_EQ(ft::aes_ecb_decrypt(key, ciphertext, decrypted), bridge::error::OK());
        EXPECT_EQ(decrypted, plaintext);
    }
}

TEST(crypto_test, longer_keys_select_wider_cipher)
{
    auto plaintext = as_bytes("the quick brown fox");
    for (size_t key_size : {24u, 32u})
    {
        auto key = sequential(key_size, 7);
        bytes ciphertext;
        ASSERT_EQ(ft::aes_ecb_encrypt(key, plaintext, ciphertext), bridge::error::OK());

        bytes decrypted;
        ASSERT_EQ(ft::aes_ecb_decrypt(key, ciphertext, decrypted), bridge::error::OK());
        EXPECT_EQ(decrypted, plaintext);
    }
}

TEST(crypto_test, bad_key_size_is_rejected)
{
    bytes ciphertext;
    EXPECT_EQ(ft::aes_ecb_encrypt(sequential(15), as_bytes("x"), ciphertext), bridge::error::CRYPTO_ERROR());
    EXPECT_EQ(ft::aes_ecb_encrypt(bytes{}, as_bytes("x"), ciphertext), bridge::error::CRYPTO_ERROR());
}

TEST(crypto_test, wrong_key_or_truncated_ciphertext_fails)
{
    auto key = sequential(16);
    bytes ciphertext;
    ASSERT_EQ(ft::aes_ecb_encrypt(key, as_bytes("attack at dawn"), ciphertext), bridge::error::OK());

    bytes decrypted;
    EXPECT_EQ(ft::aes_ecb_decrypt(key, bytes(ciphertext.begin(), ciphertext.end() - 1), decrypted),
        bridge::error::CRYPTO_ERROR());

    // a wrong key almost always breaks the padding
    auto other = sequential(16, 100);
    bytes garbage;
    auto err = ft::aes_ecb_decrypt(other, ciphertext, garbage);
    if (err == bridge::error::OK())
        EXPECT_NE(garbage, as_bytes("attack at dawn"));
    else
        EXPECT_EQ(err, bridge::error::CRYPTO_ERROR());
}

TEST(crypto_test, adler32_known_values)
{
    EXPECT_EQ(ft::adler32(bytes{}), 0u);
    EXPECT_EQ(ft::adler32(as_bytes("Wikipedia")), 0x11dd0397u);
    EXPECT_EQ(ft::adler32(as_bytes("Wikipedia"), 1), 0x11e60398u);
    // running checksum over split input
    EXPECT_EQ(ft::adler32(as_bytes("pedia"), ft::adler32(as_bytes("Wiki"))), 0x11dd0397u);
}

TEST(crypto_test, md5_known_values)
{
    std::string digest;
    ASSERT_EQ(ft::md5_hex(bytes{}, digest), bridge::error::OK());
    EXPECT_EQ(digest, "d41d8cd98f00b204e9800998ecf8427e");
    ASSERT_EQ(ft::md5_hex(as_bytes("abc"), digest), bridge::error::OK());
    EXPECT_EQ(digest, "900150983cd24fb0d6963f7d28e17f72");
}
