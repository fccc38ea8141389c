/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

// Standard C++ headers
#include <random>
#include <type_traits>
#include <utility>

// bridge headers
#include <bridge/internal/action_stream.h>
#include <bridge/internal/error_codes.h>
#include <bridge/internal/logger.h>

namespace bridge
{
    std::string generate_trace_id(size_t length)
    {
        static constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
        thread_local std::mt19937 generator{std::random_device{}()};
        std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

        std::string trace_id;
        trace_id.reserve(length);
        for (size_t i = 0; i < length; ++i)
            trace_id.push_back(alphabet[pick(generator)]);
        return trace_id;
    }

    action_stream::action_stream(std::shared_ptr<coro::io_scheduler> scheduler,
        std::shared_ptr<request_forwarder> forwarder,
        options opts,
        std::string trace_id)
        : scheduler_(std::move(scheduler))
        , forwarder_(std::move(forwarder))
        , options_(std::move(opts))
        , trace_id_(std::move(trace_id))
    {
    }

    std::shared_ptr<action_stream> action_stream::create(std::shared_ptr<coro::io_scheduler> scheduler,
        i_stream_connector& connector,
        std::shared_ptr<request_forwarder> forwarder,
        options opts)
    {
        BRIDGE_ASSERT(scheduler);
        BRIDGE_ASSERT(forwarder);

        auto self = std::shared_ptr<action_stream>(
            new action_stream(std::move(scheduler), std::move(forwarder), std::move(opts), generate_trace_id()));

        auto& metadata = self->metadata_;
        metadata.trace_id = self->trace_id_;
        metadata.client_type = client_type;
        metadata.client_version = self->options_.client_version;
        metadata.long_link_id = self->options_.long_link_id;
        if (!metadata.long_link_id)
            metadata.long_link_id = self->forwarder_->get_link_provider()->get_long_link_id();
        metadata.idempotent_id = self->options_.idempotent_id;
        metadata.deadline = std::chrono::system_clock::now() + self->options_.request_timeout;

        self->stream_ = connector.open(metadata, self);
        if (!self->stream_)
        {
            BRIDGE_ERROR("[tid:{}] unable to open action stream", self->trace_id_);
            return nullptr;
        }
        // inbound frames may reply straight away, so stream_ has to be in place first
        if (!self->stream_->start())
        {
            BRIDGE_ERROR("[tid:{}] unable to start action stream", self->trace_id_);
            self->error("unable to start stream");
            return nullptr;
        }

        BRIDGE_INFO("[tid:{}] action stream opened, client version:{}", self->trace_id_, metadata.client_version);
        return self;
    }

    action_stream::~action_stream()
    {
        // a stream the server completed is still open for writes until it is released
        if (stream_
            && (fail_all_pending(connection_status::CLIENT_COMPLETE, "action stream destroyed")
                || status_.get() == connection_status::SERVER_COMPLETE))
        {
            stream_->end();
        }
        BRIDGE_DEBUG("[tid:{}] action stream released", trace_id_);
    }

    void action_stream::set_message_handler(message_handler handler)
    {
        std::unique_lock lock(handler_mtx_);
        message_handler_ = std::move(handler);
    }

    void action_stream::set_system_event_handler(system_event_handler handler)
    {
        std::unique_lock lock(handler_mtx_);
        system_event_handler_ = std::move(handler);
    }

    void action_stream::set_error_handler(error_handler handler)
    {
        std::unique_lock lock(handler_mtx_);
        error_handler_ = std::move(handler);
    }

    size_t action_stream::get_pending_count() const
    {
        std::unique_lock lock(mtx_);
        return pending_.size();
    }

    request_failure action_stream::make_failure(int code, connection_status reason, std::string cause) const
    {
        return request_failure{.code = code, .reason = reason, .cause = std::move(cause), .trace_id = trace_id_};
    }

    CORO_TASK(int) action_stream::request(frame_payload payload, sub_response& response)
    {
        CO_RETURN CO_AWAIT send_and_wait(std::nullopt, std::move(payload), response);
    }

    CORO_TASK(int) action_stream::reply_and_request(uint64_t ack, frame_payload payload, sub_response& response)
    {
        CO_RETURN CO_AWAIT send_and_wait(ack, std::move(payload), response);
    }

    int action_stream::send_only(frame_payload payload)
    {
        return write_frame(std::nullopt, std::nullopt, std::move(payload));
    }

    int action_stream::send_only(frame_payload payload, request_failure& failure)
    {
        return write_frame(std::nullopt, std::nullopt, std::move(payload), &failure);
    }

    int action_stream::reply(uint64_t ack, frame_payload payload)
    {
        return write_frame(std::nullopt, ack, std::move(payload));
    }

    int action_stream::reply(uint64_t ack, frame_payload payload, request_failure& failure)
    {
        return write_frame(std::nullopt, ack, std::move(payload), &failure);
    }

    CORO_TASK(int)
    action_stream::send_and_wait(std::optional<uint64_t> ack, frame_payload payload, sub_response& response)
    {
        uint64_t seq = 0;
        std::shared_ptr<pending_request> pending;
        {
            std::unique_lock lock(mtx_);
            auto status = status_.get();
            if (!is_sendable(status))
            {
                lock.unlock();
                response.failure = make_failure(error::CHANNEL_CLOSED(), status, "stream is no longer writable");
                BRIDGE_ERROR("{}", response.failure.describe());
                CO_RETURN error::CHANNEL_CLOSED();
            }
            seq = ++sequence_number_;
            pending = pending_.add(seq);
        }
        BRIDGE_ASSERT(pending);

        if (!scheduler_->spawn(
                run_request_timer(weak_from_this(), scheduler_.get(), seq, pending->timer, options_.request_timeout)))
        {
            BRIDGE_ERROR("[tid:{}] unable to start the timer of request seq:{}", trace_id_, seq);
        }

        auto err = write_frame(seq, ack, std::move(payload));
        if (err != error::OK())
        {
            std::shared_ptr<pending_request> unsent;
            connection_status status;
            {
                std::unique_lock lock(mtx_);
                unsent = pending_.take(seq);
                status = status_.get();
            }
            // if the entry is gone a teardown already resolved it, fall through and report that
            if (unsent)
            {
                unsent->fail(make_failure(err, status, "unable to write request"));
                response = std::move(unsent->response);
                CO_RETURN err;
            }
        }

        CO_AWAIT pending->completed.wait();
        response = std::move(pending->response);
        CO_RETURN pending->error_code;
    }

    int action_stream::write_frame(
        std::optional<uint64_t> seq, std::optional<uint64_t> ack, frame_payload payload, request_failure* failure)
    {
        auto status = status_.get();
        if (!is_sendable(status))
        {
            BRIDGE_ERROR("[tid:{}] unable to send {} while stream status is {}",
                trace_id_,
                payload_kind(payload),
                to_string(status));
            if (failure)
                *failure = make_failure(error::CHANNEL_CLOSED(), status, "stream is no longer writable");
            return error::CHANNEL_CLOSED();
        }

        frame outbound{.header = {.seq = seq, .ack = ack}, .payload = std::move(payload)};
        BRIDGE_DEBUG("[tid:{}] send frame to server, seq:{}, ack:{}, type:{}",
            trace_id_,
            optional_to_string(seq),
            optional_to_string(ack),
            payload_kind(outbound.payload));

        int err = error::OK();
        {
            std::unique_lock lock(write_mtx_);
            err = stream_->write(outbound);
        }
        if (err != error::OK() && failure)
            *failure = make_failure(err, status_.get(), "unable to write frame");
        return err;
    }

    void action_stream::complete_pending(uint64_t ack, frame_payload payload, std::optional<uint64_t> seq)
    {
        std::shared_ptr<pending_request> entry;
        {
            std::unique_lock lock(mtx_);
            entry = pending_.take(ack);
        }
        if (!entry)
        {
            BRIDGE_WARNING("[tid:{}] no pending request for ack:{}, frame discarded", trace_id_, ack);
            return;
        }
        entry->resolve(std::move(payload), seq);
    }

    void action_stream::fail_pending(uint64_t seq, int code, std::string cause)
    {
        std::shared_ptr<pending_request> entry;
        connection_status status;
        {
            std::unique_lock lock(mtx_);
            entry = pending_.take(seq);
            status = status_.get();
        }
        if (!entry)
            return;
        auto failure = make_failure(code, status, std::move(cause));
        BRIDGE_WARNING("{}, seq:{}", failure.describe(), seq);
        entry->fail(std::move(failure));
    }

    bool action_stream::fail_all_pending(connection_status terminal, const std::string& cause)
    {
        std::vector<std::shared_ptr<pending_request>> entries;
        {
            std::unique_lock lock(mtx_);
            if (!status_.try_transition(terminal))
                return false;
            entries = pending_.take_all();
        }

        BRIDGE_INFO("[tid:{}] action stream status changed to {}, failing {} pending requests",
            trace_id_,
            to_string(terminal),
            entries.size());
        for (auto& entry : entries)
            entry->fail(make_failure(error::PENDING_REQUEST_CANCELLED(), terminal, cause));
        return true;
    }

    void action_stream::error(const std::string& reason)
    {
        if (fail_all_pending(connection_status::CLIENT_ERROR, reason))
            stream_->cancel();
    }

    void action_stream::complete()
    {
        if (fail_all_pending(connection_status::CLIENT_COMPLETE, "client complete"))
            stream_->end();
    }

    void action_stream::on_end()
    {
        fail_all_pending(connection_status::SERVER_COMPLETE, "server complete");
    }

    void action_stream::on_error(const std::string& message)
    {
        if (fail_all_pending(connection_status::SERVER_ERROR, message))
            BRIDGE_ERROR("[tid:{}] action stream failed: {}", trace_id_, message);
    }

    void action_stream::on_data(frame inbound)
    {
        BRIDGE_DEBUG("[tid:{}] receive frame from server, seq:{}, ack:{}, type:{}",
            trace_id_,
            optional_to_string(inbound.header.seq),
            optional_to_string(inbound.header.ack),
            payload_kind(inbound.payload));

        if (inbound.header.ack)
        {
            complete_pending(*inbound.header.ack, std::move(inbound.payload), inbound.header.seq);
            return;
        }

        auto seq = inbound.header.seq;
        std::visit(
            [&](auto& payload)
            {
                using T = std::decay_t<decltype(payload)>;
                if constexpr (std::is_same_v<T, proxied_request>)
                {
                    dispatch_proxied_request(seq, std::move(payload));
                }
                else if constexpr (std::is_same_v<T, system_event_request>)
                {
                    acknowledge_system_event(seq, payload);
                }
                else
                {
                    message_handler handler;
                    {
                        std::unique_lock lock(handler_mtx_);
                        handler = message_handler_;
                    }
                    if (handler)
                        handler(inbound);
                    else
                        BRIDGE_DEBUG("[tid:{}] no message handler, {} discarded", trace_id_, payload_kind(inbound.payload));
                }
            },
            inbound.payload);
    }

    void action_stream::acknowledge_system_event(std::optional<uint64_t> seq, const system_event_request& event)
    {
        if (seq)
        {
            auto err = reply(*seq, system_event_response{});
            if (err != error::OK())
                BRIDGE_ERROR("[tid:{}] unable to acknowledge system event {}, err:{}",
                    trace_id_,
                    event.event,
                    error::to_string(err));
        }
        else
        {
            BRIDGE_WARNING("[tid:{}] system event {} carries no seq, not acknowledged", trace_id_, event.event);
        }

        system_event_handler handler;
        {
            std::unique_lock lock(handler_mtx_);
            handler = system_event_handler_;
        }
        if (handler)
            handler(event);
    }

    void action_stream::dispatch_proxied_request(std::optional<uint64_t> seq, proxied_request request)
    {
        if (!seq)
        {
            report_error(error::INVALID_DATA(),
                fmt::format(
                    "[tid:{}] proxied {} request carries no seq, unable to reply", trace_id_, proxied_request_kind(request)));
            return;
        }

        if (!scheduler_->spawn(run_forwarding(shared_from_this(), *seq, std::move(request))))
        {
            report_error(error::FORWARDING_FAILURE(),
                fmt::format("[tid:{}] unable to schedule forwarding of request ack:{}", trace_id_, *seq));
        }
    }

    void action_stream::report_error(int code, const std::string& message)
    {
        BRIDGE_ERROR("{}", message);
        error_handler handler;
        {
            std::unique_lock lock(handler_mtx_);
            handler = error_handler_;
        }
        if (handler)
            handler(code, message);
    }

    CORO_TASK(void)
    action_stream::run_request_timer(std::weak_ptr<action_stream> weak_self,
        coro::io_scheduler* scheduler,
        uint64_t seq,
        request_timer timer,
        std::chrono::milliseconds timeout)
    {
        auto expired = CO_AWAIT timer.wait(*scheduler, timeout);
        if (!expired)
            CO_RETURN;
        auto self = weak_self.lock();
        if (!self)
            CO_RETURN;
        self->fail_pending(seq, error::REQUEST_TIMEOUT(), fmt::format("no reply within {}ms", timeout.count()));
    }

    CORO_TASK(void) action_stream::run_forwarding(std::shared_ptr<action_stream> self, uint64_t ack, proxied_request request)
    {
        auto err = CO_AWAIT self->forwarder_->forward(self, ack, std::move(request));
        if (err != error::OK())
        {
            self->report_error(error::FORWARDING_FAILURE(),
                fmt::format("[tid:{}] failed to forward proxied request ack:{}, err:{}",
                    self->trace_id_,
                    ack,
                    error::to_string(err)));
        }
    }
}
