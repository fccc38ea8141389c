/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

#include <coro/io_scheduler.hpp>

#include <bridge/internal/coroutine_support.h>
#include <bridge/internal/event.h>
#include <bridge/internal/result.h>

namespace bridge
{
    /**
     * @brief Cancellable deadline for one pending request
     *
     * Copies share the same cancellation flag. The wait is sliced into short scheduler
     * timers so that a cancelled request releases its timer task promptly instead of
     * holding it for the full timeout.
     */
    class request_timer
    {
    public:
        static constexpr std::chrono::milliseconds tick{25};

        request_timer();

        void cancel() { cancelled_->store(true, std::memory_order_release); }
        bool is_cancelled() const { return cancelled_->load(std::memory_order_acquire); }

        // returns true if the deadline passed, false if cancelled first
        CORO_TASK(bool) wait(coro::io_scheduler& scheduler, std::chrono::milliseconds timeout) const;

    private:
        std::shared_ptr<std::atomic<bool>> cancelled_;
    };

    // the completion slot of one outstanding request
    struct pending_request
    {
        event completed;
        int error_code = error::OK();
        sub_response response;
        request_timer timer;

        // must only be called once, by whoever removed the entry from the table
        void resolve(frame_payload payload, std::optional<uint64_t> seq);
        void fail(request_failure failure);
    };

    /**
     * @brief Outstanding requests keyed by their local seq
     *
     * Not internally synchronised: the owning multiplexer guards it together with the
     * seq counter and the status machine. Entries are removed before they are resolved
     * so that exactly one of ack, timeout and teardown completes each of them.
     */
    class pending_request_table
    {
    public:
        // returns nullptr if seq is already present
        std::shared_ptr<pending_request> add(uint64_t seq);

        // removes and returns the entry, nullptr for an unknown seq
        std::shared_ptr<pending_request> take(uint64_t seq);

        std::vector<std::shared_ptr<pending_request>> take_all();

        bool contains(uint64_t seq) const { return entries_.find(seq) != entries_.end(); }
        size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }

    private:
        std::unordered_map<uint64_t, std::shared_ptr<pending_request>> entries_;
    };
}
