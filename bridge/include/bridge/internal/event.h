/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <coro/event.hpp>

#include <bridge/internal/coroutine_support.h>

namespace bridge
{
    class event
    {
    public:
        // Signal the event: resumes every waiting coroutine on the calling thread
        void set() { event_.set(); }

        // Reset the event: future calls to wait() will suspend
        void reset() { event_.reset(); }

        bool is_set() const { return event_.is_set(); }

        CORO_TASK(void) wait() const { CO_AWAIT event_; }

    private:
        coro::event event_;
    };
}
