/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <bridge/internal/coroutine_support.h>
#include <bridge/internal/types.h>
#include <bridge/file_transfer/file_response_decoder.h>
#include <bridge/file_transfer/socket_client.h>

namespace bridge
{
    namespace file_transfer
    {
        struct file_download_request
        {
            host_address host;
            bytes payload;
            bytes aes_key;
        };

        // why a download returned DOWNLOAD_FAILED
        struct download_failure
        {
            // the server's result code, empty when no response frame arrived
            std::optional<int64_t> result_code;
            std::string cause;
            std::string trace_id;

            std::string describe() const;
        };

        /**
         * @brief Fetches one encrypted file and returns its plaintext
         *
         * The decoder is reset when the connection is established and fed every received chunk;
         * the first decoded frame ends the exchange. Returns DOWNLOAD_FAILED if the connection
         * closes before a frame is decoded or the frame carries a non zero result code, failure
         * then says which.
         */
        CORO_TASK(int)
        download_file(const file_download_request& request,
            i_socket_client_factory& sockets,
            i_file_response_decoder& decoder,
            const std::string& trace_id,
            bytes& plaintext,
            download_failure& failure);
    }
}
