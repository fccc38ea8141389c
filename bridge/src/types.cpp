/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <type_traits>

#include <fmt/format.h>

#include <bridge/internal/duplex_stream.h>
#include <bridge/internal/result.h>
#include <bridge/internal/types.h>

namespace bridge
{
    const char* payload_kind(const frame_payload& payload)
    {
        return std::visit(
            [](const auto& value) -> const char*
            {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, action_request>)
                    return "action_request";
                else if constexpr (std::is_same_v<T, action_response>)
                    return "action_response";
                else if constexpr (std::is_same_v<T, proxied_request>)
                    return "proxied_request";
                else if constexpr (std::is_same_v<T, proxied_response>)
                    return "proxied_response";
                else if constexpr (std::is_same_v<T, system_event_request>)
                    return "system_event_request";
                else
                    return "system_event_response";
            },
            payload);
    }

    const char* proxied_request_kind(const proxied_request& request)
    {
        return std::visit(
            [](const auto& value) -> const char*
            {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, socket_request>)
                    return "socket";
                else if constexpr (std::is_same_v<T, long_link_request>)
                    return "long_link";
                else if constexpr (std::is_same_v<T, short_link_request>)
                    return "short_link";
                else
                    return "unset";
            },
            request);
    }

    std::string optional_to_string(const std::optional<uint64_t>& value)
    {
        if (!value)
            return "-";
        return std::to_string(*value);
    }

    std::string request_failure::describe() const
    {
        if (code == error::REQUEST_TIMEOUT())
            return fmt::format("[tid:{}] request timeout", trace_id);

        auto text = fmt::format("[tid:{}] request has been cancelled for reason: {}", trace_id, to_string(reason));
        if (!cause.empty())
        {
            text += ", ";
            text += cause;
        }
        return text;
    }

    std::vector<std::pair<std::string, std::string>> stream_metadata::to_pairs() const
    {
        std::vector<std::pair<std::string, std::string>> pairs;
        pairs.emplace_back(metadata_keys::trace_id, trace_id);
        pairs.emplace_back(metadata_keys::client_type, client_type);
        pairs.emplace_back(metadata_keys::client_version, client_version);
        if (long_link_id)
            pairs.emplace_back(metadata_keys::long_link_id, *long_link_id);
        if (idempotent_id)
            pairs.emplace_back(metadata_keys::idempotent_id, *idempotent_id);
        return pairs;
    }
}
