/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <bridge/internal/types.h>
#include <bridge/file_transfer/media_probe.h>

namespace bridge
{
    namespace file_transfer
    {
        constexpr uint32_t image_thumb_max_edge = 120;
        constexpr uint32_t video_thumb_max_edge = 360;

        struct data_meta
        {
            uint64_t size = 0;
            uint32_t checksum = 0;
            std::string md5;
        };

        struct encrypted_data_meta
        {
            bytes aes_key;
            uint64_t size = 0;
            uint32_t checksum = 0;
            std::string md5;
        };

        // one encrypted payload ready to be uploaded
        struct upload_unit
        {
            data_meta plain;
            // encrypted.aes_key holds the key used
            encrypted_data_meta encrypted;
            bytes ciphertext;
        };

        // ciphertext md5 -> ciphertext
        using data_bag = std::map<std::string, bytes>;

        struct image_meta
        {
            data_meta plain;
            encrypted_data_meta encrypted;
            uint32_t width = 0;
            uint32_t height = 0;
        };

        struct image_upload_params
        {
            image_meta image;
            std::optional<image_meta> thumb;
        };

        struct video_upload_params
        {
            data_meta plain;
            encrypted_data_meta encrypted;
            uint32_t duration = 0;
            image_meta thumb;
        };

        struct file_upload_params
        {
            data_meta plain;
            encrypted_data_meta encrypted;
        };

        template<class Params> struct prepared_upload
        {
            Params params;
            data_bag data;
            bytes aes_key;
        };

        using image_upload = prepared_upload<image_upload_params>;
        using video_upload = prepared_upload<video_upload_params>;
        using file_upload = prepared_upload<file_upload_params>;

        // encrypts plaintext with key, or with a fresh key if none is given
        int encrypt_asset(const bytes& plaintext, const std::optional<bytes>& key, upload_unit& unit);

        int prepare_image_upload(const bytes& image, bool use_thumb, i_media_probe& probe, image_upload& upload);
        // with a thumbnail
        int prepare_image_upload(const bytes& image, i_media_probe& probe, image_upload& upload);
        int prepare_video_upload(const bytes& video, i_media_probe& probe, video_upload& upload);
        int prepare_file_upload(const bytes& file, file_upload& upload);
    }
}
