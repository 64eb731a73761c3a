#include <array>
#include <cstring>

#include <gtest/gtest.h>

#include "termoracle/net/framing.hpp"

namespace tn = termoracle::net;

TEST(NetFraming, SmallUnmaskedRoundTrip) {
    tn::FrameHeader h{};
    h.opcode = tn::Opcode::Text;
    h.payload_len = 5;

    std::array<tn::u8, tn::kFrameHeaderMaxBytes> buf{};
    const tn::u32 n = tn::frame_write_header(h, {buf.data(), buf.size()});
    ASSERT_EQ(n, 2u);
    EXPECT_EQ(buf[0], 0x81);
    EXPECT_EQ(buf[1], 0x05);

    tn::FrameHeader parsed{};
    tn::u32 header_len = 0;
    ASSERT_EQ(tn::frame_read_header({buf.data(), n}, &parsed, &header_len), tn::FrameParseResult::Ok);
    EXPECT_EQ(header_len, 2u);
    EXPECT_TRUE(parsed.fin);
    EXPECT_EQ(parsed.opcode, tn::Opcode::Text);
    EXPECT_FALSE(parsed.masked);
    EXPECT_EQ(parsed.payload_len, 5u);
}

TEST(NetFraming, ExtendedLengthsAndMask) {
    tn::FrameHeader h{};
    h.opcode = tn::Opcode::Binary;
    h.masked = true;
    h.mask = {0x37, 0xfa, 0x21, 0x3d};
    h.payload_len = 300;
    EXPECT_EQ(tn::frame_header_size(h), 8u);

    std::array<tn::u8, tn::kFrameHeaderMaxBytes> buf{};
    const tn::u32 n = tn::frame_write_header(h, {buf.data(), buf.size()});
    ASSERT_EQ(n, 8u);
    EXPECT_EQ(buf[1], 0x80 | 126);
    EXPECT_EQ(buf[2], 0x01);
    EXPECT_EQ(buf[3], 0x2c);

    tn::FrameHeader parsed{};
    tn::u32 header_len = 0;
    ASSERT_EQ(tn::frame_read_header({buf.data(), n}, &parsed, &header_len), tn::FrameParseResult::Ok);
    EXPECT_EQ(parsed.payload_len, 300u);
    EXPECT_TRUE(parsed.masked);
    EXPECT_EQ(parsed.mask, h.mask);

    h.masked = false;
    h.payload_len = 70000;
    ASSERT_EQ(tn::frame_write_header(h, {buf.data(), buf.size()}), 10u);
    ASSERT_EQ(tn::frame_read_header({buf.data(), 10}, &parsed, &header_len), tn::FrameParseResult::Ok);
    EXPECT_EQ(parsed.payload_len, 70000u);
    EXPECT_EQ(header_len, 10u);
}

TEST(NetFraming, NeedMoreOnTruncatedHeader) {
    const tn::u8 partial[] = {0x82, 126, 0x01};
    tn::FrameHeader parsed{};
    tn::u32 header_len = 0;
    EXPECT_EQ(tn::frame_read_header({partial, 1}, &parsed, &header_len), tn::FrameParseResult::NeedMore);
    EXPECT_EQ(tn::frame_read_header({partial, 3}, &parsed, &header_len), tn::FrameParseResult::NeedMore);
}

TEST(NetFraming, RejectsProtocolViolations) {
    tn::FrameHeader parsed{};
    tn::u32 header_len = 0;

    const tn::u8 rsv[] = {0xC2, 0x00};
    EXPECT_EQ(tn::frame_read_header({rsv, 2}, &parsed, &header_len), tn::FrameParseResult::Invalid);

    const tn::u8 bad_opcode[] = {0x83, 0x00};
    EXPECT_EQ(tn::frame_read_header({bad_opcode, 2}, &parsed, &header_len), tn::FrameParseResult::Invalid);

    const tn::u8 non_minimal[] = {0x82, 126, 0x00, 0x10};
    EXPECT_EQ(tn::frame_read_header({non_minimal, 4}, &parsed, &header_len), tn::FrameParseResult::Invalid);

    const tn::u8 fragmented_ping[] = {0x09, 0x00};
    EXPECT_EQ(tn::frame_read_header({fragmented_ping, 2}, &parsed, &header_len), tn::FrameParseResult::Invalid);

    const tn::u8 big_close[] = {0x88, 126, 0x00, 0x80};
    EXPECT_EQ(tn::frame_read_header({big_close, 4}, &parsed, &header_len), tn::FrameParseResult::Invalid);
}

TEST(NetFraming, WriterRejectsOversizedControlFrames) {
    tn::FrameHeader h{};
    h.opcode = tn::Opcode::Ping;
    h.payload_len = 126;
    std::array<tn::u8, tn::kFrameHeaderMaxBytes> buf{};
    EXPECT_EQ(tn::frame_write_header(h, {buf.data(), buf.size()}), 0u);

    h.payload_len = 4;
    EXPECT_EQ(tn::frame_write_header(h, {buf.data(), 1}), 0u);
}

TEST(NetFraming, MaskIsInvolutionAcrossOffsets) {
    const std::array<tn::u8, 4> mask = {0x01, 0x02, 0x03, 0x04};
    char text[] = "Hello";
    tn::u8 data[5];
    std::memcpy(data, text, 5);

    tn::frame_apply_mask(mask, data, 2, 0);
    tn::frame_apply_mask(mask, data + 2, 3, 2);
    EXPECT_EQ(data[0], 'H' ^ 0x01);
    EXPECT_EQ(data[2], 'l' ^ 0x03);

    tn::frame_apply_mask(mask, data, 5, 0);
    EXPECT_EQ(std::memcmp(data, text, 5), 0);
}
