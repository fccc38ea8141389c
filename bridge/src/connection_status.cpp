/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <bridge/internal/connection_status.h>

namespace bridge
{
    const char* to_string(connection_status status)
    {
        switch (status)
        {
        case connection_status::OK:
            return "OK";
        case connection_status::SERVER_ERROR:
            return "SERVER_ERROR";
        case connection_status::SERVER_COMPLETE:
            return "SERVER_COMPLETE";
        case connection_status::CLIENT_ERROR:
            return "CLIENT_ERROR";
        case connection_status::CLIENT_COMPLETE:
            return "CLIENT_COMPLETE";
        }
        return "UNKNOWN";
    }

    bool is_sendable(connection_status status)
    {
        return status == connection_status::OK || status == connection_status::SERVER_COMPLETE;
    }

    bool connection_status_machine::try_transition(connection_status terminal)
    {
        if (terminal == connection_status::OK)
            return false;
        auto expected = connection_status::OK;
        return status_.compare_exchange_strong(expected, terminal, std::memory_order_acq_rel);
    }
}
