/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include <coro/coro.hpp>
#include <coro/net/tcp/client.hpp>

#include <bridge/internal/coroutine_support.h>
#include <bridge/internal/duplex_stream.h>
#include <bridge/stream/frame_codec.h>

namespace bridge
{
    namespace stream
    {
        /**
         * @brief Duplex stream over a connected libcoro tcp client
         *
         * write() only encodes and queues; the pump coroutine started by start() owns the
         * socket, drains the queue and decodes inbound envelopes. The listener gets either
         * on_end (peer closed) or on_error (socket failure or malformed data), never both.
         * After on_end the write side keeps draining until end() or cancel().
         */
        class tcp_stream : public i_duplex_stream, public std::enable_shared_from_this<tcp_stream>
        {
        public:
            struct options
            {
                size_t max_payload_size = default_max_payload_size;
                std::chrono::milliseconds poll_timeout{10};
                size_t read_buffer_size = 64 * 1024;
            };

            static std::shared_ptr<tcp_stream> create(
                std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client, options opts);

            ~tcp_stream() override;

            // spawns the pump, returns false if the scheduler refused it
            bool start() override;

            int write(const frame& outbound) override;
            int write_metadata(const stream_metadata& metadata);
            void set_listener(std::weak_ptr<i_stream_listener> listener) override;
            void cancel() override;
            void end() override;

            // metadata records the peer sent, only touched by the pump
            const std::vector<std::pair<std::string, std::string>>& get_peer_metadata() const
            {
                return decoder_.get_metadata();
            }

        private:
            tcp_stream(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client, options opts);

            int enqueue(std::vector<char> encoded);

            static CORO_TASK(void) pump_send_and_receive(std::shared_ptr<tcp_stream> self);
            CORO_TASK(int) flush_send_queue();
            CORO_TASK(bool) send_all(const std::vector<char>& item);

            void emit_data(frame inbound);
            void emit_end();
            void emit_error(const std::string& message);
            void kill_connection();

            std::shared_ptr<coro::io_scheduler> scheduler_;
            coro::net::tcp::client client_;
            options options_;

            // this is the queue of blobs awaiting to be sent over the wire
            std::mutex send_queue_mtx_;
            std::queue<std::vector<char>> send_queue_;

            std::mutex listener_mtx_;
            std::weak_ptr<i_stream_listener> listener_;

            frame_decoder decoder_;

            std::atomic<bool> started_{false};
            std::atomic<bool> cancelled_{false};
            std::atomic<bool> end_requested_{false};
            std::atomic<bool> terminal_emitted_{false};
            std::atomic<bool> pump_exited_{false};
            bool write_closed_ = false;
        };

        // opens one stream over an already connected client
        class tcp_stream_connector : public i_stream_connector
        {
        public:
            tcp_stream_connector(
                std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client, tcp_stream::options opts = {});

            std::shared_ptr<i_duplex_stream> open(
                const stream_metadata& metadata, std::weak_ptr<i_stream_listener> listener) override;

        private:
            std::shared_ptr<coro::io_scheduler> scheduler_;
            std::optional<coro::net::tcp::client> client_;
            tcp_stream::options options_;
        };
    }
}
