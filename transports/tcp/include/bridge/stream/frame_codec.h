/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <bridge/internal/duplex_stream.h>
#include <bridge/internal/types.h>

namespace bridge
{
    namespace stream
    {
        constexpr uint64_t envelope_version = 1;
        constexpr size_t default_max_payload_size = 64 * 1024 * 1024;

        // fixed size header in front of every envelope body
        struct envelope_prefix
        {
            uint64_t version = envelope_version;
            uint64_t payload_size = 0;

            template<typename Ar> void serialize(Ar& ar) { ar & version & payload_size; }
        };

        // flattened frame as it travels on the wire
        struct envelope_body
        {
            enum record_kind : uint8_t
            {
                action_request_record = 0,
                action_response_record,
                proxied_request_record,
                proxied_response_record,
                system_event_request_record,
                system_event_response_record,
                metadata_record = 0x80
            };

            bool has_seq = false;
            uint64_t seq = 0;
            bool has_ack = false;
            uint64_t ack = 0;
            uint8_t kind = action_request_record;
            // index of the proxied request / response alternative
            uint8_t sub_kind = 0;
            // method, event name or short link path
            std::string name;
            std::string host;
            uint16_t port = 0;
            uint32_t link_seq = 0;
            bool init_mode = false;
            std::vector<uint8_t> body;
            std::vector<std::string> metadata_keys;
            std::vector<std::string> metadata_values;

            template<typename Ar> void serialize(Ar& ar)
            {
                ar & has_seq & seq & has_ack & ack & kind & sub_kind & name & host & port & link_seq & init_mode & body
                    & metadata_keys & metadata_values;
            }
        };

        size_t envelope_prefix_size();

        // prefix followed by the body, ready to be written to a socket
        int encode_frame(const frame& outbound, std::vector<char>& encoded);
        int encode_metadata(const stream_metadata& metadata, std::vector<char>& encoded);

        /**
         * @brief Incremental decoder for a stream of envelopes
         *
         * Bytes may arrive split at any point. Once an error is returned the decoder is
         * poisoned and every further update fails too.
         */
        class frame_decoder
        {
        public:
            explicit frame_decoder(size_t max_payload_size = default_max_payload_size);

            int update(const char* data, size_t size, std::vector<frame>& frames);

            // metadata records seen so far, in arrival order
            const std::vector<std::pair<std::string, std::string>>& get_metadata() const { return metadata_; }
            size_t get_buffered_size() const { return buffer_.size() - offset_; }

        private:
            size_t max_payload_size_;
            std::vector<char> buffer_;
            size_t offset_ = 0;
            bool failed_ = false;
            std::vector<std::pair<std::string, std::string>> metadata_;
        };
    }
}
