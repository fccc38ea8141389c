/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

namespace bridge
{
    namespace error
    {
        // bridge error codes sit in their own range so that they can travel next to
        // codes produced by the links without being confused with them
        constexpr int OK() { return 0; }
        constexpr int MIN() { return 7000; }
        constexpr int CHANNEL_CLOSED() { return MIN() + 1; }
        constexpr int REQUEST_TIMEOUT() { return MIN() + 2; }
        constexpr int PENDING_REQUEST_CANCELLED() { return MIN() + 3; }
        constexpr int FORWARDING_FAILURE() { return MIN() + 4; }
        constexpr int DOWNLOAD_FAILED() { return MIN() + 5; }
        constexpr int TRANSPORT_ERROR() { return MIN() + 6; }
        constexpr int INVALID_DATA() { return MIN() + 7; }
        constexpr int CRYPTO_ERROR() { return MIN() + 8; }
        constexpr int MEDIA_PROBE_FAILED() { return MIN() + 9; }
        constexpr int MAX() { return MEDIA_PROBE_FAILED(); }

        const char* to_string(int err);
    }
}
