/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>

#include <bridge/internal/types.h>

namespace bridge
{
    namespace file_transfer
    {
        struct image_size
        {
            uint32_t width = 0;
            uint32_t height = 0;
        };

        // image and video inspection is supplied by the embedding application
        class i_media_probe
        {
        public:
            virtual ~i_media_probe() = default;

            virtual int get_image_size(const bytes& image, image_size& size) = 0;
            virtual int get_video_duration(const bytes& video, uint32_t& seconds) = 0;
            // thumbnails fit inside a max_edge x max_edge box
            virtual int create_image_thumb(const bytes& image, uint32_t max_edge, bytes& thumb) = 0;
            virtual int create_video_thumb(const bytes& video, uint32_t max_edge, bytes& thumb) = 0;
        };
    }
}
