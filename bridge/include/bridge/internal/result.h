/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <bridge/internal/connection_status.h>
#include <bridge/internal/error_codes.h>
#include <bridge/internal/types.h>

namespace bridge
{
    // detail attached to a failed request, code mirrors the value returned to the caller
    struct request_failure
    {
        int code = error::OK();
        connection_status reason = connection_status::OK;
        std::string cause;
        std::string trace_id;

        std::string describe() const;
    };

    // the outcome of request / reply_and_request
    struct sub_response
    {
        frame_payload payload;
        // set when the reply itself expects a reply
        std::optional<uint64_t> seq;
        request_failure failure;
    };
}
