/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <atomic>

namespace bridge
{
    enum class connection_status
    {
        OK,
        SERVER_ERROR,
        SERVER_COMPLETE,
        CLIENT_ERROR,
        CLIENT_COMPLETE
    };

    const char* to_string(connection_status status);

    // a half closed stream (SERVER_COMPLETE) still accepts outbound frames
    bool is_sendable(connection_status status);

    /**
     * @brief Lifecycle of one multiplexed stream
     *
     * Starts in OK; the first transition out of OK wins and every later attempt is a no-op.
     */
    class connection_status_machine
    {
    public:
        connection_status get() const { return status_.load(std::memory_order_acquire); }

        // returns true if this call moved the machine out of OK
        bool try_transition(connection_status terminal);

    private:
        std::atomic<connection_status> status_{connection_status::OK};
    };
}
