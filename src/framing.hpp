// src/framing.hpp
// Length-prefixed framing: [1 or 2 bytes BE length][payload].

#pragma once

#include "tether/error.hpp"
#include "tether/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace tether {

// Encodes payloads into frames. The length width is fixed per codec.
class FrameCodec {
public:
    explicit FrameCodec(LengthWidth width) : width_(width) {}

    LengthWidth width() const noexcept { return width_; }
    size_t max_payload() const noexcept { return tether::max_payload(width_); }

    // Append one frame to `out`. Throws TetherError (Oversize) when the
    // payload does not fit the length field; `out` is left untouched then.
    void encode_into(std::vector<uint8_t>& out, const uint8_t* payload, size_t len) const {
        if (len > max_payload()) {
            throw TetherError::oversize(len, max_payload());
        }
        out.reserve(out.size() + width_bytes(width_) + len);
        if (width_ == LengthWidth::Two) {
            out.push_back(static_cast<uint8_t>(len >> 8));
        }
        out.push_back(static_cast<uint8_t>(len & 0xFF));
        if (len > 0) out.insert(out.end(), payload, payload + len);
    }

    std::vector<uint8_t> encode(const uint8_t* payload, size_t len) const {
        std::vector<uint8_t> out;
        encode_into(out, payload, len);
        return out;
    }

    std::vector<uint8_t> encode(const std::string& payload) const {
        return encode(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
    }

    // Zero-length keepalive frame.
    std::vector<uint8_t> null_frame() const {
        return std::vector<uint8_t>(width_bytes(width_), 0);
    }

private:
    LengthWidth width_;
};

// Reassembles frames from a byte stream delivered in arbitrary pieces.
//
// feed() copies the bytes it is given; next() extracts one complete frame at
// a time. State persists across calls, so a frame may span any number of
// reads. A declared length above `max_frame` means the stream is out of sync
// and next() throws TetherError (Protocol); call reset() before reuse.
class FrameDecoder {
public:
    explicit FrameDecoder(LengthWidth width, size_t max_frame = 0)
        : width_(width),
          max_frame_(max_frame == 0 ? tether::max_payload(width) : max_frame) {}

    void feed(const uint8_t* data, size_t len) {
        if (len == 0) return;
        // Compact consumed bytes before growing.
        if (head_ > 0 && head_ >= buf_.size() / 2) {
            buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(head_));
            head_ = 0;
        }
        buf_.insert(buf_.end(), data, data + len);
    }

    // Extract the next complete frame into `out`. Returns false when more
    // bytes are needed.
    bool next(std::vector<uint8_t>& out) {
        size_t w = width_bytes(width_);
        size_t avail = buf_.size() - head_;
        if (avail < w) return false;

        size_t declared = buf_[head_];
        if (width_ == LengthWidth::Two) {
            declared = (declared << 8) | buf_[head_ + 1];
        }
        if (declared > max_frame_) {
            throw TetherError::protocol("declared frame length " + std::to_string(declared)
                + " exceeds limit " + std::to_string(max_frame_));
        }
        if (avail < w + declared) return false;

        auto start = buf_.begin() + static_cast<std::ptrdiff_t>(head_ + w);
        out.assign(start, start + static_cast<std::ptrdiff_t>(declared));
        head_ += w + declared;
        if (head_ == buf_.size()) {
            buf_.clear();
            head_ = 0;
        }
        return true;
    }

    // feed() + drain every complete frame.
    std::vector<std::vector<uint8_t>> decode(const uint8_t* data, size_t len) {
        feed(data, len);
        std::vector<std::vector<uint8_t>> frames;
        std::vector<uint8_t> frame;
        while (next(frame)) {
            frames.push_back(std::move(frame));
            frame.clear();
        }
        return frames;
    }

    void reset() noexcept {
        buf_.clear();
        head_ = 0;
    }

    size_t buffered() const noexcept { return buf_.size() - head_; }
    size_t max_frame() const noexcept { return max_frame_; }

private:
    LengthWidth width_;
    size_t max_frame_;
    std::vector<uint8_t> buf_;
    size_t head_ = 0;
};

} // namespace tether
