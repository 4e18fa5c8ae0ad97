#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <cstdint>
#include <cstring>

#include "Framing.hpp"

TEST(FramingTest, PrefixesNetworkByteOrderLength)
{
    // Checks the frame carries a 4-byte big-endian length prefix for the payload.
    std::string payload = R"({"action":"stats"})";
    auto framed = frame_message(payload);
    ASSERT_EQ(framed.size(), sizeof(uint32_t) + payload.size());
    uint32_t net_len = 0;
    std::memcpy(&net_len, framed.data(), sizeof(uint32_t));
    EXPECT_EQ(ntohl(net_len), payload.size());
}

TEST(FramingTest, PreservesPayloadBytes)
{
    // Ensures the request bytes follow the length without alteration.
    std::string payload = R"({"action":"buy","product_quantity":2})";
    auto framed = frame_message(payload);
    std::string recovered(framed.begin() + sizeof(uint32_t), framed.end());
    EXPECT_EQ(recovered, payload);
}

TEST(FrameDecoderTest, WaitsForSplitFrame)
{
    // A frame delivered in pieces is only released once complete.
    std::string framed = frame_message(R"({"action":"health"})");
    FrameDecoder decoder;
    std::string payload;

    decoder.feed(framed.data(), 2);
    EXPECT_EQ(decoder.next(payload), FrameDecoder::Status::NeedMore);
    decoder.feed(framed.data() + 2, 6);
    EXPECT_EQ(decoder.next(payload), FrameDecoder::Status::NeedMore);
    decoder.feed(framed.data() + 8, framed.size() - 8);
    ASSERT_EQ(decoder.next(payload), FrameDecoder::Status::Frame);
    EXPECT_EQ(payload, R"({"action":"health"})");
    EXPECT_EQ(decoder.buffered(), 0u);
}

TEST(FrameDecoderTest, SplitsBackToBackFrames)
{
    // Two frames in one read come out in order.
    std::string bytes = frame_message("first") + frame_message("second");
    FrameDecoder decoder;
    decoder.feed(bytes.data(), bytes.size());

    std::string payload;
    ASSERT_EQ(decoder.next(payload), FrameDecoder::Status::Frame);
    EXPECT_EQ(payload, "first");
    ASSERT_EQ(decoder.next(payload), FrameDecoder::Status::Frame);
    EXPECT_EQ(payload, "second");
    EXPECT_EQ(decoder.next(payload), FrameDecoder::Status::NeedMore);
}

TEST(FrameDecoderTest, RejectsZeroAndOversizedLengths)
{
    // Empty frames and frames above the limit are reported as bad lengths.
    std::string payload;
    {
        FrameDecoder decoder;
        std::string bytes(4, '\0');
        decoder.feed(bytes.data(), bytes.size());
        EXPECT_EQ(decoder.next(payload), FrameDecoder::Status::BadLength);
        EXPECT_EQ(decoder.last_length(), 0u);
    }
    {
        FrameDecoder decoder(16);
        std::string bytes = frame_message(std::string(17, 'x'));
        decoder.feed(bytes.data(), bytes.size());
        EXPECT_EQ(decoder.next(payload), FrameDecoder::Status::BadLength);
        EXPECT_EQ(decoder.last_length(), 17u);
    }
}
