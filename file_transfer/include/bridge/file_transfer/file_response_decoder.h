/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <bridge/internal/types.h>

namespace bridge
{
    namespace file_transfer
    {
        constexpr char file_data_field[] = "filedata";

        // one decoded response from a file server
        struct download_frame
        {
            int64_t result_code = 0;
            std::map<std::string, bytes> fields;

            // nullptr if the field is absent
            const bytes* find_field(const std::string& name) const
            {
                auto it = fields.find(name);
                return it == fields.end() ? nullptr : &it->second;
            }
        };

        // incremental decoder of the binary file response protocol
        class i_file_response_decoder
        {
        public:
            virtual ~i_file_response_decoder() = default;

            virtual void reset() = 0;
            virtual std::vector<download_frame> update(const bytes& chunk) = 0;
        };
    }
}
