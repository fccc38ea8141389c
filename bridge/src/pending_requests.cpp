/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>

#include <bridge/internal/pending_requests.h>

namespace bridge
{
    request_timer::request_timer()
        : cancelled_(std::make_shared<std::atomic<bool>>(false))
    {
    }

    CORO_TASK(bool) request_timer::wait(coro::io_scheduler& scheduler, std::chrono::milliseconds timeout) const
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!is_cancelled())
        {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
                CO_RETURN true;
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            CO_AWAIT scheduler.yield_for(std::min(remaining, tick));
        }
        CO_RETURN false;
    }

    void pending_request::resolve(frame_payload payload, std::optional<uint64_t> seq)
    {
        timer.cancel();
        error_code = error::OK();
        response.payload = std::move(payload);
        response.seq = seq;
        completed.set();
    }

    void pending_request::fail(request_failure failure)
    {
        timer.cancel();
        error_code = failure.code;
        response.failure = std::move(failure);
        completed.set();
    }

    std::shared_ptr<pending_request> pending_request_table::add(uint64_t seq)
    {
        auto entry = std::make_shared<pending_request>();
        auto [it, inserted] = entries_.emplace(seq, entry);
        if (!inserted)
            return nullptr;
        return entry;
    }

    std::shared_ptr<pending_request> pending_request_table::take(uint64_t seq)
    {
        auto it = entries_.find(seq);
        if (it == entries_.end())
            return nullptr;
        auto entry = std::move(it->second);
        entries_.erase(it);
        return entry;
    }

    std::vector<std::shared_ptr<pending_request>> pending_request_table::take_all()
    {
        std::vector<std::shared_ptr<pending_request>> entries;
        entries.reserve(entries_.size());
        for (auto& [seq, entry] : entries_)
            entries.push_back(std::move(entry));
        entries_.clear();
        return entries;
    }
}
