/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <coro/io_scheduler.hpp>

#include <bridge/internal/connection_status.h>
#include <bridge/internal/coroutine_support.h>
#include <bridge/internal/duplex_stream.h>
#include <bridge/internal/links.h>
#include <bridge/internal/pending_requests.h>
#include <bridge/internal/request_forwarder.h>
#include <bridge/internal/result.h>
#include <bridge/internal/types.h>

namespace bridge
{
    /**
     * @brief Multiplexes request/response pairs in both directions over one duplex stream
     *
     * Outbound requests get a fresh seq and wait for the frame whose ack matches it.
     * Inbound frames without an ack are classified: proxied requests are forwarded to the
     * local links, system events are acknowledged straight away and everything else is
     * handed to the message handler.
     *
     * Seq allocation, the pending table and the status are guarded by one mutex, writes
     * by a second one. No handler is ever called with either held.
     */
    class action_stream : public i_reply_target,
                          public i_stream_listener,
                          public std::enable_shared_from_this<action_stream>
    {
    public:
        static constexpr char client_type[] = "cpp";
        static constexpr size_t trace_id_length = 8;

        struct options
        {
            std::chrono::milliseconds request_timeout{60000};
            std::string client_version;
            std::optional<std::string> idempotent_id;
            // overrides the id reported by the link provider
            std::optional<std::string> long_link_id;
        };

        using message_handler = std::function<void(const frame&)>;
        using system_event_handler = std::function<void(const system_event_request&)>;
        using error_handler = std::function<void(int, const std::string&)>;

        // returns nullptr if the connector could not open a stream
        static std::shared_ptr<action_stream> create(std::shared_ptr<coro::io_scheduler> scheduler,
            i_stream_connector& connector,
            std::shared_ptr<request_forwarder> forwarder,
            options opts);

        ~action_stream() override;

        action_stream(const action_stream&) = delete;
        action_stream& operator=(const action_stream&) = delete;

        CORO_TASK(int) request(frame_payload payload, sub_response& response);
        int send_only(frame_payload payload);
        // failure is filled with the status that refused the frame when the result is not OK
        int send_only(frame_payload payload, request_failure& failure);
        int reply(uint64_t ack, frame_payload payload, request_failure& failure);

        // i_reply_target
        int reply(uint64_t ack, frame_payload payload) override;
        CORO_TASK(int) reply_and_request(uint64_t ack, frame_payload payload, sub_response& response) override;
        const std::string& get_trace_id() const override { return trace_id_; }

        // client side teardown, both are idempotent and no-ops once the status has left OK
        void error(const std::string& reason);
        void complete();

        void set_message_handler(message_handler handler);
        void set_system_event_handler(system_event_handler handler);
        void set_error_handler(error_handler handler);

        connection_status get_status() const { return status_.get(); }
        size_t get_pending_count() const;
        const stream_metadata& get_metadata() const { return metadata_; }

        // i_stream_listener
        void on_data(frame inbound) override;
        void on_end() override;
        void on_error(const std::string& message) override;

    private:
        action_stream(std::shared_ptr<coro::io_scheduler> scheduler,
            std::shared_ptr<request_forwarder> forwarder,
            options opts,
            std::string trace_id);

        CORO_TASK(int)
        send_and_wait(std::optional<uint64_t> ack, frame_payload payload, sub_response& response);
        int write_frame(std::optional<uint64_t> seq,
            std::optional<uint64_t> ack,
            frame_payload payload,
            request_failure* failure = nullptr);

        void complete_pending(uint64_t ack, frame_payload payload, std::optional<uint64_t> seq);
        void fail_pending(uint64_t seq, int code, std::string cause);
        bool fail_all_pending(connection_status terminal, const std::string& cause);

        void dispatch_proxied_request(std::optional<uint64_t> seq, proxied_request request);
        void acknowledge_system_event(std::optional<uint64_t> seq, const system_event_request& event);
        void report_error(int code, const std::string& message);

        request_failure make_failure(int code, connection_status reason, std::string cause) const;

        static CORO_TASK(void) run_request_timer(std::weak_ptr<action_stream> weak_self,
            coro::io_scheduler* scheduler,
            uint64_t seq,
            request_timer timer,
            std::chrono::milliseconds timeout);
        static CORO_TASK(void) run_forwarding(std::shared_ptr<action_stream> self, uint64_t ack, proxied_request request);

        std::shared_ptr<coro::io_scheduler> scheduler_;
        std::shared_ptr<request_forwarder> forwarder_;
        options options_;
        std::string trace_id_;
        stream_metadata metadata_;
        std::shared_ptr<i_duplex_stream> stream_;

        mutable std::mutex mtx_;
        uint64_t sequence_number_ = 0;
        pending_request_table pending_;
        connection_status_machine status_;

        std::mutex write_mtx_;

        std::mutex handler_mtx_;
        message_handler message_handler_;
        system_event_handler system_event_handler_;
        error_handler error_handler_;
    };

    std::string generate_trace_id(size_t length = action_stream::trace_id_length);
}
