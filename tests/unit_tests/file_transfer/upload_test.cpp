/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <string>

#include <gtest/gtest.h>

#include <bridge/internal/error_codes.h>
#include <bridge/file_transfer/file_transfer.h>

#include <fixtures/fake_file_transfer.h>

using bridge::bytes;
namespace ft = bridge::file_transfer;

namespace
{
    bytes make_asset(size_t size, uint8_t seed)
    {
        bytes data(size);
        for (size_t i = 0; i < size; ++i)
            data[i] = static_cast<uint8_t>(seed * 31 + i * 7);
        return data;
    }

    std::string md5_of(const bytes& data)
    {
        std::string digest;
        EXPECT_EQ(ft::md5_hex(data, digest), bridge::error::OK());
        return digest;
    }

    // the bag entry for meta must decrypt with key to the described plaintext
    void expect_decryptable(const ft::data_bag& bag, const bytes& key, const ft::data_meta& plain,
        const ft::encrypted_data_meta& encrypted)
    {
        auto it = bag.find(encrypted.md5);
        ASSERT_NE(it, bag.end());
        EXPECT_EQ(it->second.size(), encrypted.size);
        EXPECT_EQ(ft::adler32(it->second), encrypted.checksum);
        EXPECT_EQ(encrypted.aes_key, key);

        bytes decrypted;
        ASSERT_EQ(ft::aes_ecb_decrypt(key, it->second, decrypted), bridge::error::OK());
        EXPECT_EQ(decrypted.size(), plain.size);
        EXPECT_EQ(ft::adler32(decrypted), plain.checksum);
        EXPECT_EQ(md5_of(decrypted), plain.md5);
    }
}

TEST(upload_test, encrypt_asset_describes_both_sides)
{
    auto plaintext = make_asset(1000, 1);
    bytes key(ft::aes_key_size, 0x42);

    ft::upload_unit unit;
    ASSERT_EQ(ft::encrypt_asset(plaintext, key, unit), bridge::error::OK());

    EXPECT_EQ(unit.plain.size, 1000u);
    EXPECT_EQ(unit.plain.checksum, ft::adler32(plaintext));
    EXPECT_EQ(unit.plain.md5, md5_of(plaintext));

    bytes expected;
    ASSERT_EQ(ft::aes_ecb_encrypt(key, plaintext, expected), bridge::error::OK());
    EXPECT_EQ(unit.ciphertext, expected);
    EXPECT_EQ(unit.encrypted.size, 1008u);
    EXPECT_EQ(unit.encrypted.checksum, ft::adler32(expected));
    EXPECT_EQ(unit.encrypted.md5, md5_of(expected));
    EXPECT_EQ(unit.encrypted.aes_key, key);

    // a fixed key gives a repeatable result
    ft::upload_unit again;
    ASSERT_EQ(ft::encrypt_asset(plaintext, key, again), bridge::error::OK());
    EXPECT_EQ(again.encrypted.md5, unit.encrypted.md5);
}

TEST(upload_test, encrypt_asset_generates_key)
{
    auto plaintext = make_asset(10, 2);

    ft::upload_unit first;
    ft::upload_unit second;
    ASSERT_EQ(ft::encrypt_asset(plaintext, std::nullopt, first), bridge::error::OK());
    ASSERT_EQ(ft::encrypt_asset(plaintext, std::nullopt, second), bridge::error::OK());
    EXPECT_EQ(first.encrypted.aes_key.size(), ft::aes_key_size);
    EXPECT_NE(first.encrypted.aes_key, second.encrypted.aes_key);
    EXPECT_EQ(first.plain.md5, second.plain.md5);
    EXPECT_NE(first.encrypted.md5, second.encrypted.md5);
}

TEST(upload_test, image_with_thumb_shares_one_key)
{
    bridge_test::fake_media_probe probe({1024, 768});
    auto image = make_asset(5000, 3);

    ft::image_upload upload;
    ASSERT_EQ(ft::prepare_image_upload(image, true, probe, upload), bridge::error::OK());

    EXPECT_EQ(upload.aes_key.size(), ft::aes_key_size);
    EXPECT_EQ(upload.data.size(), 2u);
    EXPECT_EQ(probe.get_thumb_edges(), std::vector<uint32_t>{ft::image_thumb_max_edge});

    auto& params = upload.params;
    EXPECT_EQ(params.image.width, 1024u);
    EXPECT_EQ(params.image.height, 768u);
    EXPECT_EQ(params.image.plain.md5, md5_of(image));
    expect_decryptable(upload.data, upload.aes_key, params.image.plain, params.image.encrypted);

    ASSERT_TRUE(params.thumb.has_value());
    EXPECT_EQ(params.thumb->plain.size, ft::image_thumb_max_edge);
    expect_decryptable(upload.data, upload.aes_key, params.thumb->plain, params.thumb->encrypted);
}

TEST(upload_test, image_thumb_is_the_default)
{
    bridge_test::fake_media_probe probe;
    auto image = make_asset(700, 6);

    ft::image_upload upload;
    ASSERT_EQ(ft::prepare_image_upload(image, probe, upload), bridge::error::OK());

    EXPECT_EQ(upload.data.size(), 2u);
    ASSERT_TRUE(upload.params.thumb.has_value());
    EXPECT_EQ(probe.get_thumb_edges(), std::vector<uint32_t>{ft::image_thumb_max_edge});
    expect_decryptable(upload.data, upload.aes_key, upload.params.thumb->plain, upload.params.thumb->encrypted);
}

TEST(upload_test, image_without_thumb)
{
    bridge_test::fake_media_probe probe;
    auto image = make_asset(300, 4);

    ft::image_upload upload;
    ASSERT_EQ(ft::prepare_image_upload(image, false, probe, upload), bridge::error::OK());

    EXPECT_EQ(upload.data.size(), 1u);
    EXPECT_FALSE(upload.params.thumb.has_value());
    EXPECT_TRUE(probe.get_thumb_edges().empty());
    EXPECT_EQ(upload.params.image.width, 640u);
    expect_decryptable(upload.data, upload.aes_key, upload.params.image.plain, upload.params.image.encrypted);
}

TEST(upload_test, video_always_has_thumb)
{
    bridge_test::fake_media_probe probe({1920, 1080}, 93);
    auto video = make_asset(20000, 5);

    ft::video_upload upload;
    ASSERT_EQ(ft::prepare_video_upload(video, probe, upload), bridge::error::OK());

    auto& params = upload.params;
    EXPECT_EQ(params.duration, 93u);
    EXPECT_EQ(params.plain.size, 20000u);
    EXPECT_EQ(upload.data.size(), 2u);
    EXPECT_EQ(probe.get_thumb_edges(), std::vector<uint32_t>{ft::video_thumb_max_edge});
    EXPECT_EQ(params.thumb.width, 1920u);
    EXPECT_EQ(params.thumb.plain.size, ft::video_thumb_max_edge);
    expect_decryptable(upload.data, upload.aes_key, params.plain, params.encrypted);
    expect_decryptable(upload.data, upload.aes_key, params.thumb.plain, params.thumb.encrypted);
}

TEST(upload_test, plain_file)
{
    auto file = make_asset(64, 6);

    ft::file_upload upload;
    ASSERT_EQ(ft::prepare_file_upload(file, upload), bridge::error::OK());

    EXPECT_EQ(upload.data.size(), 1u);
    EXPECT_EQ(upload.params.plain.size, 64u);
    EXPECT_EQ(upload.params.encrypted.size, 80u);
    expect_decryptable(upload.data, upload.aes_key, upload.params.plain, upload.params.encrypted);
}

TEST(upload_test, probe_failure_propagates)
{
    bridge_test::fake_media_probe probe;
    probe.set_error(bridge::error::MEDIA_PROBE_FAILED());

    ft::image_upload image;
    EXPECT_EQ(ft::prepare_image_upload(make_asset(10, 7), true, probe, image), bridge::error::MEDIA_PROBE_FAILED());
    EXPECT_TRUE(image.data.empty());

    ft::video_upload video;
    EXPECT_EQ(ft::prepare_video_upload(make_asset(10, 8), probe, video), bridge::error::MEDIA_PROBE_FAILED());
    EXPECT_TRUE(video.data.empty());
}
