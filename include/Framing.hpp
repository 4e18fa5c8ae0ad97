#pragma once

#include <arpa/inet.h>
#include <cstdint>
#include <cstring>
#include <string>

constexpr std::size_t DEFAULT_MAX_FRAME_SIZE = 1 << 20; // 1 MB per message.

// Frames a payload with a 4-byte big-endian length prefix.
inline std::string frame_message(const std::string &payload)
{
    uint32_t len = static_cast<uint32_t>(payload.size());
    uint32_t net_len = htonl(len);
    std::string framed;
    framed.resize(sizeof(uint32_t));
    std::memcpy(framed.data(), &net_len, sizeof(uint32_t));
    framed.append(payload);
    return framed;
}

// Accumulates stream bytes and splits them into length-prefixed payloads.
class FrameDecoder
{
public:
    enum class Status
    {
        Frame,      // `payload` holds one complete frame.
        NeedMore,   // Not enough buffered bytes yet.
        BadLength   // Declared length is 0 or above the limit; stream is unusable.
    };

    explicit FrameDecoder(std::size_t maxFrameSize = DEFAULT_MAX_FRAME_SIZE)
        : max_frame_size_(maxFrameSize)
    {
    }

    void feed(const char *data, std::size_t len) { buffer_.append(data, len); }

    // Extracts the next complete frame, if any.
    Status next(std::string &payload)
    {
        if (buffer_.size() < sizeof(uint32_t))
            return Status::NeedMore;

        uint32_t net_len = 0;
        std::memcpy(&net_len, buffer_.data(), sizeof(uint32_t));
        uint32_t len = ntohl(net_len);
        last_length_ = len;
        if (len == 0 || len > max_frame_size_)
            return Status::BadLength;
        if (buffer_.size() < sizeof(uint32_t) + len)
            return Status::NeedMore;

        payload = buffer_.substr(sizeof(uint32_t), len);
        buffer_.erase(0, sizeof(uint32_t) + len);
        return Status::Frame;
    }

    // Length field of the most recently inspected header.
    uint32_t last_length() const { return last_length_; }
    std::size_t buffered() const { return buffer_.size(); }

private:
    std::size_t max_frame_size_;
    std::string buffer_;
    uint32_t last_length_ = 0;
};
