/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <chrono>
#include <memory>
#include <optional>

#include <fmt/format.h>

#include <bridge/internal/error_codes.h>
#include <bridge/internal/logger.h>
#include <bridge/file_transfer/crypto.h>
#include <bridge/file_transfer/download.h>

namespace bridge
{
    namespace file_transfer
    {
        namespace
        {
            // feeds the socket into the decoder until the first frame comes out
            class download_handler : public i_socket_client_handler
            {
            public:
                explicit download_handler(i_file_response_decoder& decoder)
                    : decoder_(decoder)
                {
                }

                void on_connect() override { decoder_.reset(); }

                bool on_receive(const bytes& chunk) override
                {
                    if (response_)
                        return true;
                    auto frames = decoder_.update(chunk);
                    if (frames.empty())
                        return false;
                    response_ = std::move(frames.front());
                    return true;
                }

                std::optional<download_frame>& get_response() { return response_; }

            private:
                i_file_response_decoder& decoder_;
                std::optional<download_frame> response_;
            };

            int64_t elapsed_ms(std::chrono::steady_clock::time_point since)
            {
                return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since)
                    .count();
            }
        }

        std::string download_failure::describe() const
        {
            if (result_code)
                return fmt::format("[tid:{}] file download failed, retcode:{}", trace_id, *result_code);
            return fmt::format("[tid:{}] file download failed: {}", trace_id, cause);
        }

        CORO_TASK(int)
        download_file(const file_download_request& request,
            i_socket_client_factory& sockets,
            i_file_response_decoder& decoder,
            const std::string& trace_id,
            bytes& plaintext,
            download_failure& failure)
        {
            auto handler = std::make_shared<download_handler>(decoder);
            auto client = sockets.create_socket_client(request.host, trace_id, handler);
            if (!client)
            {
                BRIDGE_ERROR("[tid:{}] unable to open file socket to {}:{}", trace_id, request.host.host, request.host.port);
                CO_RETURN error::TRANSPORT_ERROR();
            }

            auto start = std::chrono::steady_clock::now();
            auto err = CO_AWAIT client->send(request.payload);
            auto network_ms = elapsed_ms(start);
            if (err != error::OK())
            {
                BRIDGE_ERROR("[tid:{}] file download from {}:{} failed, err:{}",
                    trace_id,
                    request.host.host,
                    request.host.port,
                    error::to_string(err));
                CO_RETURN err;
            }

            auto& response = handler->get_response();
            if (!response)
            {
                failure = download_failure{.result_code = std::nullopt, .cause = "no response", .trace_id = trace_id};
                BRIDGE_ERROR("{}", failure.describe());
                CO_RETURN error::DOWNLOAD_FAILED();
            }
            if (response->result_code != 0)
            {
                failure = download_failure{
                    .result_code = response->result_code, .cause = "server rejected the download", .trace_id = trace_id};
                BRIDGE_ERROR("{}", failure.describe());
                CO_RETURN error::DOWNLOAD_FAILED();
            }

            auto* file_data = response->find_field(file_data_field);
            if (!file_data)
            {
                BRIDGE_ERROR("[tid:{}] file download response carries no {} field", trace_id, file_data_field);
                CO_RETURN error::INVALID_DATA();
            }

            start = std::chrono::steady_clock::now();
            bytes decrypted;
            err = aes_ecb_decrypt(request.aes_key, *file_data, decrypted);
            if (err != error::OK())
                CO_RETURN err;

            BRIDGE_INFO("[tid:{}] downloaded {} bytes, network cost:{}ms, decrypt cost:{}ms",
                trace_id,
                decrypted.size(),
                network_ms,
                elapsed_ms(start));
            plaintext = std::move(decrypted);
            CO_RETURN error::OK();
        }
    }
}
