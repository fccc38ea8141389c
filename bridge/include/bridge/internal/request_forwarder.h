/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <memory>

#include <bridge/internal/coroutine_support.h>
#include <bridge/internal/links.h>
#include <bridge/internal/types.h>

namespace bridge
{
    /**
     * @brief Executes proxied requests against the local links
     *
     * Every reply written here carries ack equal to the seq of the inbound frame.
     * Init mode long link requests and socket sessions answer through the reply
     * target themselves, so forward() writes nothing for them.
     */
    class request_forwarder
    {
    public:
        explicit request_forwarder(std::shared_ptr<i_link_provider> links);

        CORO_TASK(int) forward(std::shared_ptr<i_reply_target> target, uint64_t ack, proxied_request request);

        const std::shared_ptr<i_link_provider>& get_link_provider() const { return links_; }

    private:
        CORO_TASK(int) forward_socket(std::shared_ptr<i_reply_target> target, uint64_t ack, socket_request request);
        CORO_TASK(int) forward_long_link(
            std::shared_ptr<i_reply_target> target, uint64_t ack, long_link_request request);
        CORO_TASK(int) forward_short_link(
            std::shared_ptr<i_reply_target> target, uint64_t ack, short_link_request request);
        static CORO_TASK(int) reject_unset(std::shared_ptr<i_reply_target> target, uint64_t ack);

        std::shared_ptr<i_link_provider> links_;
    };
}
