/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <memory>
#include <string>

#include <bridge/internal/coroutine_support.h>
#include <bridge/internal/types.h>

namespace bridge
{
    namespace file_transfer
    {
        class i_socket_client_handler
        {
        public:
            virtual ~i_socket_client_handler() = default;

            virtual void on_connect() = 0;
            // return true once the response has been consumed, this completes the send
            virtual bool on_receive(const bytes& chunk) = 0;
        };

        class i_socket_client
        {
        public:
            virtual ~i_socket_client() = default;

            // completes when the handler reports the response consumed or the peer closes
            virtual CORO_TASK(int) send(const bytes& payload) = 0;
        };

        class i_socket_client_factory
        {
        public:
            virtual ~i_socket_client_factory() = default;

            virtual std::shared_ptr<i_socket_client> create_socket_client(
                const host_address& host, const std::string& trace_id, std::shared_ptr<i_socket_client_handler> handler)
                = 0;
        };
    }
}
