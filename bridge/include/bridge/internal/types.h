/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bridge
{
    using bytes = std::vector<uint8_t>;

    struct host_address
    {
        std::string host;
        uint16_t port = 0;
    };

    struct action_request
    {
        std::string method;
        bytes body;
    };

    struct action_response
    {
        std::string method;
        bytes body;
    };

    struct socket_request
    {
        host_address host;
        bytes payload;
    };

    struct long_link_request
    {
        uint32_t seq = 0;
        bytes payload;
        bool init_mode = false;
    };

    struct short_link_request
    {
        host_address host;
        std::string path;
        bytes payload;
    };

    // std::monostate is a request that was decoded but names no known variant
    using proxied_request = std::variant<std::monostate, socket_request, long_link_request, short_link_request>;

    struct socket_response
    {
        bytes payload;
    };

    struct long_link_response
    {
        bytes payload;
    };

    struct short_link_response
    {
        bytes payload;
    };

    using proxied_response = std::variant<socket_response, long_link_response, short_link_response>;

    struct system_event_request
    {
        std::string event;
        bytes body;
    };

    struct system_event_response
    {
    };

    using frame_payload = std::variant<action_request,
        action_response,
        proxied_request,
        proxied_response,
        system_event_request,
        system_event_response>;

    struct frame_header
    {
        // present when the sender expects a reply
        std::optional<uint64_t> seq;
        // present when this frame is a reply
        std::optional<uint64_t> ack;
    };

    struct frame
    {
        frame_header header;
        frame_payload payload;
    };

    const char* payload_kind(const frame_payload& payload);
    const char* proxied_request_kind(const proxied_request& request);

    // "-" when absent, used by the frame logging
    std::string optional_to_string(const std::optional<uint64_t>& value);
}
