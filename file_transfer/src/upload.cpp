/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <utility>

#include <bridge/internal/error_codes.h>
#include <bridge/internal/logger.h>
#include <bridge/file_transfer/crypto.h>
#include <bridge/file_transfer/upload.h>

namespace bridge
{
    namespace file_transfer
    {
        namespace
        {
            int describe_data(const bytes& data, uint64_t& size, uint32_t& checksum, std::string& md5)
            {
                size = data.size();
                checksum = adler32(data);
                return md5_hex(data, md5);
            }

            int encrypt_image(const bytes& image, const bytes& key, i_media_probe& probe, image_meta& meta, data_bag& bag)
            {
                image_size size;
                auto err = probe.get_image_size(image, size);
                if (err != error::OK())
                {
                    BRIDGE_ERROR("unable to read image size, err:{}", error::to_string(err));
                    return err;
                }

                upload_unit unit;
                err = encrypt_asset(image, key, unit);
                if (err != error::OK())
                    return err;

                meta.plain = std::move(unit.plain);
                meta.encrypted = unit.encrypted;
                meta.width = size.width;
                meta.height = size.height;
                bag[unit.encrypted.md5] = std::move(unit.ciphertext);
                return error::OK();
            }
        }

        int encrypt_asset(const bytes& plaintext, const std::optional<bytes>& key, upload_unit& unit)
        {
            bytes aes_key;
            if (key)
            {
                aes_key = *key;
            }
            else
            {
                auto err = generate_aes_key(aes_key);
                if (err != error::OK())
                    return err;
            }

            upload_unit result;
            auto err = describe_data(plaintext, result.plain.size, result.plain.checksum, result.plain.md5);
            if (err != error::OK())
                return err;

            err = aes_ecb_encrypt(aes_key, plaintext, result.ciphertext);
            if (err != error::OK())
                return err;

            err = describe_data(
                result.ciphertext, result.encrypted.size, result.encrypted.checksum, result.encrypted.md5);
            if (err != error::OK())
                return err;

            result.encrypted.aes_key = std::move(aes_key);
            unit = std::move(result);
            return error::OK();
        }

        int prepare_image_upload(const bytes& image, i_media_probe& probe, image_upload& upload)
        {
            return prepare_image_upload(image, true, probe, upload);
        }

        int prepare_image_upload(const bytes& image, bool use_thumb, i_media_probe& probe, image_upload& upload)
        {
            image_upload result;
            auto err = generate_aes_key(result.aes_key);
            if (err != error::OK())
                return err;

            err = encrypt_image(image, result.aes_key, probe, result.params.image, result.data);
            if (err != error::OK())
                return err;

            if (use_thumb)
            {
                bytes thumb;
                err = probe.create_image_thumb(image, image_thumb_max_edge, thumb);
                if (err != error::OK())
                {
                    BRIDGE_ERROR("unable to create image thumbnail, err:{}", error::to_string(err));
                    return err;
                }

                image_meta thumb_meta;
                err = encrypt_image(thumb, result.aes_key, probe, thumb_meta, result.data);
                if (err != error::OK())
                    return err;
                result.params.thumb = std::move(thumb_meta);
            }

            BRIDGE_DEBUG("prepared image upload {}x{}, {} bytes, {} parts",
                result.params.image.width,
                result.params.image.height,
                result.params.image.plain.size,
                result.data.size());
            upload = std::move(result);
            return error::OK();
        }

        int prepare_video_upload(const bytes& video, i_media_probe& probe, video_upload& upload)
        {
            video_upload result;
            auto err = generate_aes_key(result.aes_key);
            if (err != error::OK())
                return err;

            err = probe.get_video_duration(video, result.params.duration);
            if (err != error::OK())
            {
                BRIDGE_ERROR("unable to read video duration, err:{}", error::to_string(err));
                return err;
            }

            upload_unit unit;
            err = encrypt_asset(video, result.aes_key, unit);
            if (err != error::OK())
                return err;
            result.params.plain = std::move(unit.plain);
            result.params.encrypted = unit.encrypted;
            result.data[unit.encrypted.md5] = std::move(unit.ciphertext);

            bytes thumb;
            err = probe.create_video_thumb(video, video_thumb_max_edge, thumb);
            if (err != error::OK())
            {
                BRIDGE_ERROR("unable to create video thumbnail, err:{}", error::to_string(err));
                return err;
            }
            err = encrypt_image(thumb, result.aes_key, probe, result.params.thumb, result.data);
            if (err != error::OK())
                return err;

            BRIDGE_DEBUG("prepared video upload {}s, {} bytes", result.params.duration, result.params.plain.size);
            upload = std::move(result);
            return error::OK();
        }

        int prepare_file_upload(const bytes& file, file_upload& upload)
        {
            file_upload result;
            upload_unit unit;
            auto err = encrypt_asset(file, std::nullopt, unit);
            if (err != error::OK())
                return err;

            result.aes_key = unit.encrypted.aes_key;
            result.params.plain = std::move(unit.plain);
            result.params.encrypted = unit.encrypted;
            result.data[unit.encrypted.md5] = std::move(unit.ciphertext);
            upload = std::move(result);
            return error::OK();
        }
    }
}
