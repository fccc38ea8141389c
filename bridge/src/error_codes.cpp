/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <bridge/internal/error_codes.h>

namespace bridge
{
    namespace error
    {
        const char* to_string(int err)
        {
            if (err == OK())
                return "OK";
            if (err == CHANNEL_CLOSED())
                return "CHANNEL_CLOSED";
            if (err == REQUEST_TIMEOUT())
                return "REQUEST_TIMEOUT";
            if (err == PENDING_REQUEST_CANCELLED())
                return "PENDING_REQUEST_CANCELLED";
            if (err == FORWARDING_FAILURE())
                return "FORWARDING_FAILURE";
            if (err == DOWNLOAD_FAILED())
                return "DOWNLOAD_FAILED";
            if (err == TRANSPORT_ERROR())
                return "TRANSPORT_ERROR";
            if (err == INVALID_DATA())
                return "INVALID_DATA";
            if (err == CRYPTO_ERROR())
                return "CRYPTO_ERROR";
            if (err == MEDIA_PROBE_FAILED())
                return "MEDIA_PROBE_FAILED";
            return "UNKNOWN_ERROR";
        }
    }
}
