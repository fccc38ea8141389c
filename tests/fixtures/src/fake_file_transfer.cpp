/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fixtures/fake_file_transfer.h>

namespace bridge_test
{
    int fake_media_probe::get_image_size(const bridge::bytes& image, bridge::file_transfer::image_size& size)
    {
        if (error_ != bridge::error::OK())
            return error_;
        size = image_size_;
        return bridge::error::OK();
    }

    int fake_media_probe::get_video_duration(const bridge::bytes& video, uint32_t& seconds)
    {
        if (error_ != bridge::error::OK())
            return error_;
        seconds = duration_;
        return bridge::error::OK();
    }

    int fake_media_probe::create_image_thumb(const bridge::bytes& image, uint32_t max_edge, bridge::bytes& thumb)
    {
        if (error_ != bridge::error::OK())
            return error_;
        thumb_edges_.push_back(max_edge);
        thumb.assign(max_edge, 0x7e);
        return bridge::error::OK();
    }

    int fake_media_probe::create_video_thumb(const bridge::bytes& video, uint32_t max_edge, bridge::bytes& thumb)
    {
        if (error_ != bridge::error::OK())
            return error_;
        thumb_edges_.push_back(max_edge);
        thumb.assign(max_edge, 0x3c);
        return bridge::error::OK();
    }

    void fake_file_response_decoder::reset()
    {
        ++reset_count_;
        received_ = 0;
        emitted_ = false;
    }

    std::vector<bridge::file_transfer::download_frame> fake_file_response_decoder::update(const bridge::bytes& chunk)
    {
        ++update_count_;
        received_ += chunk.size();
        if (emitted_ || received_ < expected_size_)
            return {};
        emitted_ = true;
        return {response_};
    }

    CORO_TASK(int) scripted_socket_client::send(const bridge::bytes& payload)
    {
        sent_ = payload;
        handler_->on_connect();
        for (auto& chunk : chunks_)
        {
            ++delivered_;
            if (handler_->on_receive(chunk))
                CO_RETURN bridge::error::OK();
        }
        // peer closed without the handler being satisfied
        CO_RETURN error_;
    }

    std::shared_ptr<bridge::file_transfer::i_socket_client> scripted_socket_client_factory::create_socket_client(
        const bridge::host_address& host,
        const std::string& trace_id,
        std::shared_ptr<bridge::file_transfer::i_socket_client_handler> handler)
    {
        hosts_.push_back(host);
        last_client_ = std::make_shared<scripted_socket_client>(std::move(handler), chunks_, error_);
        return last_client_;
    }
}
