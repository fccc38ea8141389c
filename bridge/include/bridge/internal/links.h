/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <bridge/internal/coroutine_support.h>
#include <bridge/internal/result.h>
#include <bridge/internal/types.h>

namespace bridge
{
    // the side of the multiplexer that transports answering on their own are given
    class i_reply_target
    {
    public:
        virtual ~i_reply_target() = default;

        virtual int reply(uint64_t ack, frame_payload payload) = 0;
        virtual CORO_TASK(int) reply_and_request(uint64_t ack, frame_payload payload, sub_response& response) = 0;
        virtual const std::string& get_trace_id() const = 0;
    };

    // one shot request over a fresh connection
    class i_short_link
    {
    public:
        virtual ~i_short_link() = default;
        virtual CORO_TASK(int) send(const std::string& path, const bytes& payload, bytes& response) = 0;
    };

    // the session scoped connection shared by all long link requests
    class i_long_link
    {
    public:
        virtual ~i_long_link() = default;
        virtual CORO_TASK(int) send(uint32_t seq, const bytes& payload, bytes& response) = 0;
        // the link answers through target on its own, keyed to ack
        virtual int send_init_data(const bytes& payload, std::shared_ptr<i_reply_target> target, uint64_t ack) = 0;
    };

    // a raw socket bound to an inbound ack that produces its own replies
    class i_socket_session
    {
    public:
        virtual ~i_socket_session() = default;
        virtual CORO_TASK(int) send(const bytes& payload) = 0;
    };

    class i_link_provider
    {
    public:
        virtual ~i_link_provider() = default;

        virtual CORO_TASK(int) get_long_link(std::shared_ptr<i_long_link>& link) = 0;
        virtual std::shared_ptr<i_short_link> create_short_link(const host_address& host, const std::string& trace_id)
            = 0;
        virtual std::shared_ptr<i_socket_session> create_socket_session(
            const host_address& host, std::shared_ptr<i_reply_target> target, uint64_t ack)
            = 0;
        virtual std::optional<std::string> get_long_link_id() const = 0;
    };
}
