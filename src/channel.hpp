// src/channel.hpp
// JSON message channel: one document per frame, on top of a Connection.

#pragma once

#include "framing.hpp"
#include "transport.hpp"
#include "tether/types.hpp"
#include <cstdint>
#include <functional>
#include <vector>

#include <nlohmann/json.hpp>

namespace tether {

class MessageChannel {
public:
    using MessageHandler = std::function<void(nlohmann::json& message)>;
    using KeepaliveHandler = std::function<void()>;

    MessageChannel(Connection& connection, LengthWidth width, size_t max_frame);

    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;

    // Serialize `doc` and send it as one frame. Returns true iff the whole
    // frame was sent. An oversize document is logged and not sent.
    bool send_message(const nlohmann::json& doc);

    // Send a zero-length keepalive frame.
    bool send_null();

    // Receive what the socket has, then hand every complete message to
    // `on_message` in arrival order. Keepalive frames go to `on_keepalive`.
    // Throws TetherError (MalformedMessage or Protocol) on a payload that is
    // not a JSON object or an impossible frame length; messages decoded
    // before the bad frame have already been delivered.
    size_t receive_messages(const MessageHandler& on_message,
                            const KeepaliveHandler& on_keepalive = {});

    // Forget any partially received frame. Frames already complete are kept
    // and delivered by the running receive_messages() call.
    void reset() noexcept { decoder_.reset(); }

    const FrameCodec& codec() const noexcept { return codec_; }

private:
    Connection& connection_;
    FrameCodec codec_;
    FrameDecoder decoder_;

    // Reusable buffers
    std::vector<uint8_t> send_buf_;
    std::vector<uint8_t> frame_;
    std::vector<std::vector<uint8_t>> pending_;
};

} // namespace tether
