/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <bridge/internal/types.h>

namespace bridge
{
    // receives the events of a duplex stream, each terminal event is delivered at most once
    class i_stream_listener
    {
    public:
        virtual ~i_stream_listener() = default;
        virtual void on_data(frame inbound) = 0;
        virtual void on_end() = 0;
        virtual void on_error(const std::string& message) = 0;
    };

    // one long lived bidirectional stream to the control plane server
    class i_duplex_stream
    {
    public:
        virtual ~i_duplex_stream() = default;

        virtual int write(const frame& outbound) = 0;
        virtual void set_listener(std::weak_ptr<i_stream_listener> listener) = 0;
        // inbound traffic reaches the listener only after this, false if the stream could not be started
        virtual bool start() = 0;
        // abort the stream in both directions
        virtual void cancel() = 0;
        // half close: no further writes
        virtual void end() = 0;
    };

    namespace metadata_keys
    {
        constexpr char trace_id[] = "x-trace-id";
        constexpr char client_type[] = "x-client-type";
        constexpr char client_version[] = "x-client-version";
        constexpr char long_link_id[] = "x-long-link-id";
        constexpr char idempotent_id[] = "x-idempotent-id";
    }

    // attached once when the stream is opened
    struct stream_metadata
    {
        std::string trace_id;
        std::string client_type;
        std::string client_version;
        std::optional<std::string> long_link_id;
        std::optional<std::string> idempotent_id;
        std::chrono::system_clock::time_point deadline;

        std::vector<std::pair<std::string, std::string>> to_pairs() const;
    };

    class i_stream_connector
    {
    public:
        virtual ~i_stream_connector() = default;
        // returns an unstarted stream with the listener attached, nullptr if the stream could not be opened
        virtual std::shared_ptr<i_duplex_stream> open(
            const stream_metadata& metadata, std::weak_ptr<i_stream_listener> listener)
            = 0;
    };
}
