// src/channel.cpp
// JSON message channel.

#include "channel.hpp"

#include <optional>

#include <spdlog/spdlog.h>

namespace tether {

MessageChannel::MessageChannel(Connection& connection, LengthWidth width, size_t max_frame)
    : connection_(connection), codec_(width), decoder_(width, max_frame) {
    send_buf_.reserve(256);
}

bool MessageChannel::send_message(const nlohmann::json& doc) {
    // Invalid UTF-8 in string values is replaced rather than thrown.
    std::string text = doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    send_buf_.clear();
    try {
        codec_.encode_into(send_buf_, reinterpret_cast<const uint8_t*>(text.data()), text.size());
    } catch (const TetherError& e) {
        spdlog::warn("message not sent: {}", e.what());
        return false;
    }

    spdlog::debug("send {}", text);
    size_t sent = connection_.send_bytes(send_buf_.data(), send_buf_.size());
    if (sent != send_buf_.size()) {
        spdlog::warn("only sent {} out of {} bytes", sent, send_buf_.size());
        return false;
    }
    return true;
}

bool MessageChannel::send_null() {
    auto frame = codec_.null_frame();
    size_t sent = connection_.send_bytes(frame.data(), frame.size());
    if (sent != frame.size()) {
        spdlog::warn("only sent {} out of {} bytes", sent, frame.size());
        return false;
    }
    return true;
}

size_t MessageChannel::receive_messages(const MessageHandler& on_message,
                                        const KeepaliveHandler& on_keepalive) {
    // Frames are cut out while the bytes arrive, so frames completed before
    // an EOF survive the decoder reset that the disconnect triggers.
    std::optional<TetherError> fault;
    connection_.receive_bytes([&](const uint8_t* data, size_t len) {
        if (fault) return;
        decoder_.feed(data, len);
        try {
            while (decoder_.next(frame_)) {
                pending_.push_back(std::move(frame_));
                frame_.clear();
            }
        } catch (const TetherError& e) {
            fault = e;
        }
    });

    std::vector<std::vector<uint8_t>> frames;
    frames.swap(pending_);

    size_t count = 0;
    for (const auto& payload : frames) {
        if (payload.empty()) {
            spdlog::trace("recv keepalive");
            if (on_keepalive) on_keepalive();
            continue;
        }

        auto doc = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
        if (doc.is_discarded()) {
            throw TetherError::malformed_message(
                "payload of " + std::to_string(payload.size()) + " bytes is not valid JSON");
        }
        if (!doc.is_object()) {
            throw TetherError::malformed_message("payload is not a JSON object");
        }

        spdlog::debug("recv {}", doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        count++;
        on_message(doc);
    }

    if (fault) {
        throw *fault;
    }
    return count;
}

} // namespace tether
