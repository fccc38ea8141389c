/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <exception>
#include <type_traits>

#include <yas/count_streams.hpp>
#include <yas/mem_streams.hpp>
#include <yas/binary_iarchive.hpp>
#include <yas/binary_oarchive.hpp>
#include <yas/std_types.hpp>

#include <bridge/internal/error_codes.h>
#include <bridge/internal/logger.h>
#include <bridge/stream/frame_codec.h>

namespace bridge
{
    namespace stream
    {
        namespace
        {
            constexpr std::size_t archive_flags = yas::binary | yas::no_header;

            template<class T> std::vector<char> to_yas_binary(const T& value)
            {
                yas::mem_ostream os;
                yas::binary_oarchive<yas::mem_ostream, archive_flags> oa(os);
                oa & value;
                auto yas_buf = os.get_shared_buffer();
                return std::vector<char>(yas_buf.data.get(), yas_buf.data.get() + yas_buf.size);
            }

            template<class T> int from_yas_binary(const char* data, size_t size, T& value)
            {
                try
                {
                    yas::mem_istream is(data, size);
                    yas::binary_iarchive<yas::mem_istream, archive_flags> ia(is);
                    ia & value;
                }
                catch (const std::exception& ex)
                {
                    BRIDGE_ERROR("malformed envelope: {}", ex.what());
                    return error::INVALID_DATA();
                }
                return error::OK();
            }

            void write_envelope(const envelope_body& body, std::vector<char>& encoded)
            {
                auto payload = to_yas_binary(body);
                auto prefix = to_yas_binary(envelope_prefix{.version = envelope_version, .payload_size = payload.size()});
                encoded.clear();
                encoded.reserve(prefix.size() + payload.size());
                encoded.insert(encoded.end(), prefix.begin(), prefix.end());
                encoded.insert(encoded.end(), payload.begin(), payload.end());
            }

            void flatten_proxied_request(const proxied_request& request, envelope_body& body)
            {
                body.sub_kind = static_cast<uint8_t>(request.index());
                std::visit(
                    [&](const auto& value)
                    {
                        using T = std::decay_t<decltype(value)>;
                        if constexpr (std::is_same_v<T, socket_request>)
                        {
                            body.host = value.host.host;
                            body.port = value.host.port;
                            body.body = value.payload;
                        }
                        else if constexpr (std::is_same_v<T, long_link_request>)
                        {
                            body.link_seq = value.seq;
                            body.init_mode = value.init_mode;
                            body.body = value.payload;
                        }
                        else if constexpr (std::is_same_v<T, short_link_request>)
                        {
                            body.host = value.host.host;
                            body.port = value.host.port;
                            body.name = value.path;
                            body.body = value.payload;
                        }
                    },
                    request);
            }

            void flatten(const frame& outbound, envelope_body& body)
            {
                body.has_seq = outbound.header.seq.has_value();
                body.seq = outbound.header.seq.value_or(0);
                body.has_ack = outbound.header.ack.has_value();
                body.ack = outbound.header.ack.value_or(0);
                body.kind = static_cast<uint8_t>(outbound.payload.index());

                std::visit(
                    [&](const auto& value)
                    {
                        using T = std::decay_t<decltype(value)>;
                        if constexpr (std::is_same_v<T, action_request> || std::is_same_v<T, action_response>)
                        {
                            body.name = value.method;
                            body.body = value.body;
                        }
                        else if constexpr (std::is_same_v<T, proxied_request>)
                        {
                            flatten_proxied_request(value, body);
                        }
                        else if constexpr (std::is_same_v<T, proxied_response>)
                        {
                            body.sub_kind = static_cast<uint8_t>(value.index());
                            std::visit([&](const auto& response) { body.body = response.payload; }, value);
                        }
                        else if constexpr (std::is_same_v<T, system_event_request>)
                        {
                            body.name = value.event;
                            body.body = value.body;
                        }
                    },
                    outbound.payload);
            }

            int unflatten_proxied_request(envelope_body& body, proxied_request& request)
            {
                switch (body.sub_kind)
                {
                case 0:
                    request = std::monostate{};
                    return error::OK();
                case 1:
                    request = socket_request{.host = {std::move(body.host), body.port}, .payload = std::move(body.body)};
                    return error::OK();
                case 2:
                    request = long_link_request{
                        .seq = body.link_seq, .payload = std::move(body.body), .init_mode = body.init_mode};
                    return error::OK();
                case 3:
                    request = short_link_request{.host = {std::move(body.host), body.port},
                        .path = std::move(body.name),
                        .payload = std::move(body.body)};
                    return error::OK();
                default:
                    BRIDGE_ERROR("unknown proxied request type {}", body.sub_kind);
                    return error::INVALID_DATA();
                }
            }

            int unflatten_proxied_response(envelope_body& body, proxied_response& response)
            {
                switch (body.sub_kind)
                {
                case 0:
                    response = socket_response{std::move(body.body)};
                    return error::OK();
                case 1:
                    response = long_link_response{std::move(body.body)};
                    return error::OK();
                case 2:
                    response = short_link_response{std::move(body.body)};
                    return error::OK();
                default:
                    BRIDGE_ERROR("unknown proxied response type {}", body.sub_kind);
                    return error::INVALID_DATA();
                }
            }

            int unflatten(envelope_body& body, frame& inbound)
            {
                if (body.has_seq)
                    inbound.header.seq = body.seq;
                if (body.has_ack)
                    inbound.header.ack = body.ack;

                switch (body.kind)
                {
                case envelope_body::action_request_record:
                    inbound.payload = action_request{std::move(body.name), std::move(body.body)};
                    return error::OK();
                case envelope_body::action_response_record:
                    inbound.payload = action_response{std::move(body.name), std::move(body.body)};
                    return error::OK();
                case envelope_body::proxied_request_record:
                {
                    proxied_request request;
                    auto err = unflatten_proxied_request(body, request);
                    if (err != error::OK())
                        return err;
                    inbound.payload = std::move(request);
                    return error::OK();
                }
                case envelope_body::proxied_response_record:
                {
                    proxied_response response;
                    auto err = unflatten_proxied_response(body, response);
                    if (err != error::OK())
                        return err;
                    inbound.payload = std::move(response);
                    return error::OK();
                }
                case envelope_body::system_event_request_record:
                    inbound.payload = system_event_request{std::move(body.name), std::move(body.body)};
                    return error::OK();
                case envelope_body::system_event_response_record:
                    inbound.payload = system_event_response{};
                    return error::OK();
                default:
                    BRIDGE_ERROR("unknown envelope record type {}", body.kind);
                    return error::INVALID_DATA();
                }
            }
        }

        size_t envelope_prefix_size()
        {
            static const size_t size = []
            {
                yas::count_ostream cs;
                yas::binary_oarchive<yas::count_ostream, archive_flags> oa(cs);
                oa & envelope_prefix();
                return cs.total_size;
            }();
            return size;
        }

        int encode_frame(const frame& outbound, std::vector<char>& encoded)
        {
            envelope_body body;
            flatten(outbound, body);
            write_envelope(body, encoded);
            return error::OK();
        }

        int encode_metadata(const stream_metadata& metadata, std::vector<char>& encoded)
        {
            envelope_body body;
            body.kind = envelope_body::metadata_record;
            for (auto& [key, value] : metadata.to_pairs())
            {
                body.metadata_keys.push_back(key);
                body.metadata_values.push_back(value);
            }
            write_envelope(body, encoded);
            return error::OK();
        }

        frame_decoder::frame_decoder(size_t max_payload_size)
            : max_payload_size_(max_payload_size)
        {
        }

        int frame_decoder::update(const char* data, size_t size, std::vector<frame>& frames)
        {
            if (failed_)
                return error::INVALID_DATA();

            buffer_.insert(buffer_.end(), data, data + size);
            const auto prefix_size = envelope_prefix_size();

            while (buffer_.size() - offset_ >= prefix_size)
            {
                envelope_prefix prefix;
                auto err = from_yas_binary(buffer_.data() + offset_, prefix_size, prefix);
                if (err == error::OK() && prefix.version != envelope_version)
                {
                    BRIDGE_ERROR("unsupported envelope version {}", prefix.version);
                    err = error::INVALID_DATA();
                }
                if (err == error::OK() && prefix.payload_size > max_payload_size_)
                {
                    BRIDGE_ERROR("envelope of {} bytes exceeds the limit of {}", prefix.payload_size, max_payload_size_);
                    err = error::INVALID_DATA();
                }
                if (err != error::OK())
                {
                    failed_ = true;
                    return err;
                }

                if (buffer_.size() - offset_ - prefix_size < prefix.payload_size)
                    break;

                envelope_body body;
                err = from_yas_binary(buffer_.data() + offset_ + prefix_size, prefix.payload_size, body);
                if (err != error::OK())
                {
                    failed_ = true;
                    return err;
                }
                offset_ += prefix_size + prefix.payload_size;

                if (body.kind == envelope_body::metadata_record)
                {
                    if (body.metadata_keys.size() != body.metadata_values.size())
                    {
                        BRIDGE_ERROR("metadata record has {} keys and {} values",
                            body.metadata_keys.size(),
                            body.metadata_values.size());
                        failed_ = true;
                        return error::INVALID_DATA();
                    }
                    for (size_t i = 0; i < body.metadata_keys.size(); ++i)
                        metadata_.emplace_back(std::move(body.metadata_keys[i]), std::move(body.metadata_values[i]));
                    continue;
                }

                frame inbound;
                err = unflatten(body, inbound);
                if (err != error::OK())
                {
                    failed_ = true;
                    return err;
                }
                frames.push_back(std::move(inbound));
            }

            // compact once everything buffered has been consumed or the dead prefix dominates
            if (offset_ == buffer_.size())
            {
                buffer_.clear();
                offset_ = 0;
            }
            else if (offset_ > buffer_.size() / 2)
            {
                buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
                offset_ = 0;
            }
            return error::OK();
        }
    }
}
