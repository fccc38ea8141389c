/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

#include <bridge/internal/error_codes.h>
#include <bridge/internal/logger.h>
#include <bridge/internal/request_forwarder.h>

namespace bridge
{
    request_forwarder::request_forwarder(std::shared_ptr<i_link_provider> links)
        : links_(std::move(links))
    {
        BRIDGE_ASSERT(links_);
    }

    CORO_TASK(int)
    request_forwarder::forward(std::shared_ptr<i_reply_target> target, uint64_t ack, proxied_request request)
    {
        BRIDGE_ASSERT(target);
        BRIDGE_DEBUG("[tid:{}] forwarding {} request, ack:{}", target->get_trace_id(), proxied_request_kind(request), ack);

        // links are supplied by the embedding application and may throw
        try
        {
            auto task = std::visit(
                [&](auto& value) -> CORO_TASK(int)
                {
                    using T = std::decay_t<decltype(value)>;
                    if constexpr (std::is_same_v<T, socket_request>)
                        return forward_socket(target, ack, std::move(value));
                    else if constexpr (std::is_same_v<T, long_link_request>)
                        return forward_long_link(target, ack, std::move(value));
                    else if constexpr (std::is_same_v<T, short_link_request>)
                        return forward_short_link(target, ack, std::move(value));
                    else
                    {
                        static_assert(std::is_same_v<T, std::monostate>, "proxied request type is not forwarded");
                        return reject_unset(target, ack);
                    }
                },
                request);
            CO_RETURN CO_AWAIT std::move(task);
        }
        catch (const std::exception& ex)
        {
            BRIDGE_ERROR("[tid:{}] link threw while forwarding request ack:{}: {}", target->get_trace_id(), ack, ex.what());
            CO_RETURN error::FORWARDING_FAILURE();
        }
    }

    CORO_TASK(int) request_forwarder::reject_unset(std::shared_ptr<i_reply_target> target, uint64_t ack)
    {
        BRIDGE_ERROR("[tid:{}] proxied request ack:{} carries no known request type", target->get_trace_id(), ack);
        CO_RETURN error::FORWARDING_FAILURE();
    }

    CORO_TASK(int)
    request_forwarder::forward_socket(std::shared_ptr<i_reply_target> target, uint64_t ack, socket_request request)
    {
        auto session = links_->create_socket_session(request.host, target, ack);
        if (!session)
        {
            BRIDGE_ERROR("[tid:{}] unable to open socket session to {}:{}",
                target->get_trace_id(),
                request.host.host,
                request.host.port);
            CO_RETURN error::TRANSPORT_ERROR();
        }
        // the session writes its own replies keyed to ack
        CO_RETURN CO_AWAIT session->send(request.payload);
    }

    CORO_TASK(int)
    request_forwarder::forward_long_link(std::shared_ptr<i_reply_target> target, uint64_t ack, long_link_request request)
    {
        std::shared_ptr<i_long_link> link;
        auto err = CO_AWAIT links_->get_long_link(link);
        if (err != error::OK())
            CO_RETURN err;
        if (!link)
        {
            BRIDGE_ERROR("[tid:{}] long link is not available", target->get_trace_id());
            CO_RETURN error::TRANSPORT_ERROR();
        }

        if (request.init_mode)
            CO_RETURN link->send_init_data(request.payload, target, ack);

        bytes response;
        err = CO_AWAIT link->send(request.seq, request.payload, response);
        if (err != error::OK())
        {
            BRIDGE_ERROR("[tid:{}] long link send failed, link seq:{}, err:{}",
                target->get_trace_id(),
                request.seq,
                error::to_string(err));
            CO_RETURN err;
        }
        CO_RETURN target->reply(ack, proxied_response{long_link_response{std::move(response)}});
    }

    CORO_TASK(int)
    request_forwarder::forward_short_link(std::shared_ptr<i_reply_target> target, uint64_t ack, short_link_request request)
    {
        auto link = links_->create_short_link(request.host, target->get_trace_id());
        if (!link)
        {
            BRIDGE_ERROR("[tid:{}] unable to open short link to {}:{}",
                target->get_trace_id(),
                request.host.host,
                request.host.port);
            CO_RETURN error::TRANSPORT_ERROR();
        }

        bytes response;
        auto err = CO_AWAIT link->send(request.path, request.payload, response);
        if (err != error::OK())
        {
            BRIDGE_ERROR("[tid:{}] short link send to {} failed, err:{}",
                target->get_trace_id(),
                request.path,
                error::to_string(err));
            CO_RETURN err;
        }
        CO_RETURN target->reply(ack, proxied_response{short_link_response{std::move(response)}});
    }
}
