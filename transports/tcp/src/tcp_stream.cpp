/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <span>
#include <tuple>

#include <bridge/internal/error_codes.h>
#include <bridge/internal/logger.h>
#include <bridge/stream/tcp_stream.h>

namespace bridge
{
    namespace stream
    {
        tcp_stream::tcp_stream(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client, options opts)
            : scheduler_(std::move(scheduler))
            , client_(std::move(client))
            , options_(opts)
            , decoder_(opts.max_payload_size)
        {
        }

        std::shared_ptr<tcp_stream> tcp_stream::create(
            std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client, options opts)
        {
            return std::shared_ptr<tcp_stream>(new tcp_stream(std::move(scheduler), std::move(client), opts));
        }

        tcp_stream::~tcp_stream()
        {
            BRIDGE_DEBUG("tcp_stream released");
        }

        bool tcp_stream::start()
        {
            if (started_.exchange(true))
                return true;
            if (!scheduler_->spawn(pump_send_and_receive(shared_from_this())))
            {
                BRIDGE_ERROR("unable to start the tcp stream pump");
                return false;
            }
            return true;
        }

        void tcp_stream::set_listener(std::weak_ptr<i_stream_listener> listener)
        {
            std::unique_lock lock(listener_mtx_);
            listener_ = std::move(listener);
        }

        int tcp_stream::write(const frame& outbound)
        {
            std::vector<char> encoded;
            auto err = encode_frame(outbound, encoded);
            if (err != error::OK())
                return err;
            return enqueue(std::move(encoded));
        }

        int tcp_stream::write_metadata(const stream_metadata& metadata)
        {
            std::vector<char> encoded;
            auto err = encode_metadata(metadata, encoded);
            if (err != error::OK())
                return err;
            return enqueue(std::move(encoded));
        }

        int tcp_stream::enqueue(std::vector<char> encoded)
        {
            if (cancelled_.load(std::memory_order_acquire) || end_requested_.load(std::memory_order_acquire)
                || pump_exited_.load(std::memory_order_acquire))
            {
                return error::TRANSPORT_ERROR();
            }
            std::unique_lock lock(send_queue_mtx_);
            send_queue_.push(std::move(encoded));
            return error::OK();
        }

        void tcp_stream::cancel()
        {
            if (cancelled_.exchange(true))
                return;
            BRIDGE_DEBUG("tcp_stream cancelled");
            // wakes the pump out of its poll
            client_.socket().shutdown();
        }

        void tcp_stream::end()
        {
            end_requested_.store(true, std::memory_order_release);
        }

        void tcp_stream::kill_connection()
        {
            BRIDGE_DEBUG("tcp_stream closing socket");
            client_.socket().shutdown();
            client_.socket().close();
        }

        void tcp_stream::emit_data(frame inbound)
        {
            std::shared_ptr<i_stream_listener> listener;
            {
                std::unique_lock lock(listener_mtx_);
                listener = listener_.lock();
            }
            if (listener)
                listener->on_data(std::move(inbound));
        }

        void tcp_stream::emit_end()
        {
            if (terminal_emitted_.exchange(true))
                return;
            std::shared_ptr<i_stream_listener> listener;
            {
                std::unique_lock lock(listener_mtx_);
                listener = listener_.lock();
            }
            if (listener)
                listener->on_end();
        }

        void tcp_stream::emit_error(const std::string& message)
        {
            if (terminal_emitted_.exchange(true))
                return;
            BRIDGE_ERROR("tcp_stream failed: {}", message);
            std::shared_ptr<i_stream_listener> listener;
            {
                std::unique_lock lock(listener_mtx_);
                listener = listener_.lock();
            }
            if (listener)
                listener->on_error(message);
        }

        CORO_TASK(bool) tcp_stream::send_all(const std::vector<char>& item)
        {
            std::span<const char> remaining(item.data(), item.size());
            while (!remaining.empty())
            {
                auto [send_status, unsent] = client_.send(remaining);
                if (send_status == coro::net::send_status::ok)
                {
                    remaining = unsent;
                    continue;
                }
                if (send_status != coro::net::send_status::try_again && send_status != coro::net::send_status::would_block)
                {
                    BRIDGE_ERROR("failed to send data to peer, status:{}", static_cast<int>(send_status));
                    CO_RETURN false;
                }

                auto poll_status = CO_AWAIT client_.poll(coro::poll_op::write, options_.poll_timeout);
                if (cancelled_.load(std::memory_order_acquire))
                    CO_RETURN false;
                if (poll_status == coro::poll_status::timeout)
                    continue;
                if (poll_status != coro::poll_status::event)
                {
                    BRIDGE_ERROR("failed to send data to peer, poll status:{}", static_cast<int>(poll_status));
                    CO_RETURN false;
                }
            }
            CO_RETURN true;
        }

        CORO_TASK(int) tcp_stream::flush_send_queue()
        {
            std::queue<std::vector<char>> batch;
            {
                std::unique_lock lock(send_queue_mtx_);
                std::swap(batch, send_queue_);
            }
            while (!batch.empty())
            {
                if (!CO_AWAIT send_all(batch.front()))
                    CO_RETURN error::TRANSPORT_ERROR();
                batch.pop();
            }

            if (end_requested_.load(std::memory_order_acquire) && !write_closed_)
            {
                bool drained = false;
                {
                    std::unique_lock lock(send_queue_mtx_);
                    drained = send_queue_.empty();
                }
                if (drained)
                {
                    // half close, keep reading until the peer closes its side
                    client_.socket().shutdown(coro::poll_op::write);
                    write_closed_ = true;
                }
            }
            CO_RETURN error::OK();
        }

        CORO_TASK(void) tcp_stream::pump_send_and_receive(std::shared_ptr<tcp_stream> self)
        {
            BRIDGE_DEBUG("tcp_stream pump started");
            std::vector<char> buf(self->options_.read_buffer_size);
            bool peer_closed = false;

            while (!self->cancelled_.load(std::memory_order_acquire))
            {
                if (CO_AWAIT self->flush_send_queue() != error::OK())
                {
                    self->emit_error("unable to send to peer");
                    break;
                }

                if (peer_closed)
                {
                    // only the write side is left, it stays open until end() or cancel()
                    if (self->write_closed_)
                        break;
                    CO_AWAIT self->scheduler_->yield_for(self->options_.poll_timeout);
                    continue;
                }

                auto [recv_status, recv_bytes] = self->client_.recv(std::span<char>(buf.data(), buf.size()));
                if (recv_status == coro::net::recv_status::try_again || recv_status == coro::net::recv_status::would_block)
                {
                    auto pstatus = CO_AWAIT self->client_.poll(coro::poll_op::read, self->options_.poll_timeout);
                    if (self->cancelled_.load(std::memory_order_acquire))
                        break;
                    if (pstatus == coro::poll_status::timeout || pstatus == coro::poll_status::event)
                        continue;
                    if (pstatus == coro::poll_status::closed)
                    {
                        self->emit_end();
                        peer_closed = true;
                        continue;
                    }
                    self->emit_error("socket poll failed");
                    break;
                }

                if (recv_status == coro::net::recv_status::closed)
                {
                    self->emit_end();
                    peer_closed = true;
                    continue;
                }
                if (recv_status != coro::net::recv_status::ok)
                {
                    if (!self->cancelled_.load(std::memory_order_acquire))
                        self->emit_error("socket receive failed");
                    break;
                }

                std::vector<frame> frames;
                if (self->decoder_.update(recv_bytes.data(), recv_bytes.size(), frames) != error::OK())
                {
                    self->emit_error("malformed data received from peer");
                    break;
                }
                for (auto& inbound : frames)
                    self->emit_data(std::move(inbound));

                // Yield to allow scheduled tasks to run
                CO_AWAIT self->scheduler_->schedule();
            }

            BRIDGE_DEBUG("tcp_stream pump exiting");
            self->pump_exited_.store(true, std::memory_order_release);
            self->kill_connection();
            CO_RETURN;
        }

        tcp_stream_connector::tcp_stream_connector(
            std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client, tcp_stream::options opts)
            : scheduler_(std::move(scheduler))
            , client_(std::move(client))
            , options_(opts)
        {
        }

        std::shared_ptr<i_duplex_stream> tcp_stream_connector::open(
            const stream_metadata& metadata, std::weak_ptr<i_stream_listener> listener)
        {
            if (!client_)
            {
                BRIDGE_ERROR("[tid:{}] tcp connection has already been handed to a stream", metadata.trace_id);
                return nullptr;
            }

            auto stream = tcp_stream::create(scheduler_, std::move(*client_), options_);
            client_.reset();
            stream->set_listener(std::move(listener));

            // queued ahead of every frame, the pump sends it once the stream is started
            if (stream->write_metadata(metadata) != error::OK())
                return nullptr;
            return stream;
        }
    }
}
