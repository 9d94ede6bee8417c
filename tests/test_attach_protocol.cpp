#include <gtest/gtest.h>
#include <core/attach_protocol.hpp>

TEST(AttachProtocol, HelloRoundTrip) {
    std::string hello = build_attach_hello(132, 43);
    EXPECT_EQ(hello, "RECON-ATTACH 132 43\n");

    int cols = 0, rows = 0;
    ASSERT_TRUE(parse_attach_hello(hello, cols, rows));
    EXPECT_EQ(cols, 132);
    EXPECT_EQ(rows, 43);
}

TEST(AttachProtocol, HelloRejectsGarbage) {
    int cols = 0, rows = 0;
    EXPECT_FALSE(parse_attach_hello("", cols, rows));
    EXPECT_FALSE(parse_attach_hello("HELLO 80 24", cols, rows));
    EXPECT_FALSE(parse_attach_hello("RECON-ATTACH 80", cols, rows));
    EXPECT_FALSE(parse_attach_hello("RECON-ATTACH 0 24", cols, rows));
    EXPECT_FALSE(parse_attach_hello("RECON-ATTACH 80 x", cols, rows));
    EXPECT_FALSE(parse_attach_hello("RECON-ATTACH 80 24 1", cols, rows));
    EXPECT_EQ(cols, 0);
}

TEST(AttachProtocol, DecodesDataAndResize) {
    std::string stream = encode_data_frames("ls\r", 3) + encode_resize_frame(100, 30);

    AttachDecoder decoder;
    decoder.feed(stream.data(), stream.size());

    AttachFrame frame;
    ASSERT_TRUE(decoder.next(frame));
    EXPECT_EQ(frame.type, AttachFrameType::Data);
    EXPECT_EQ(frame.payload, "ls\r");

    ASSERT_TRUE(decoder.next(frame));
    EXPECT_EQ(frame.type, AttachFrameType::Resize);
    EXPECT_EQ(frame.cols, 100);
    EXPECT_EQ(frame.rows, 30);

    EXPECT_FALSE(decoder.next(frame));
    EXPECT_FALSE(decoder.bad());
}

TEST(AttachProtocol, PartialFramesWaitForMoreBytes) {
    std::string stream = encode_data_frames("hello", 5);
    AttachDecoder decoder;
    AttachFrame frame;

    decoder.feed(stream.data(), 2);
    EXPECT_FALSE(decoder.next(frame));
    decoder.feed(stream.data() + 2, 4);
    EXPECT_FALSE(decoder.next(frame));
    decoder.feed(stream.data() + 6, stream.size() - 6);
    ASSERT_TRUE(decoder.next(frame));
    EXPECT_EQ(frame.payload, "hello");
    EXPECT_FALSE(decoder.bad());
}

TEST(AttachProtocol, LargeInputIsSplit) {
    std::string big(ATTACH_MAX_PAYLOAD + 10, 'x');
    std::string stream = encode_data_frames(big.data(), big.size());

    AttachDecoder decoder;
    decoder.feed(stream.data(), stream.size());

    AttachFrame first, second;
    ASSERT_TRUE(decoder.next(first));
    ASSERT_TRUE(decoder.next(second));
    EXPECT_EQ(first.payload.size(), ATTACH_MAX_PAYLOAD);
    EXPECT_EQ(second.payload.size(), 10u);
}

TEST(AttachProtocol, UnknownTypeIsCorrupt) {
    std::string stream("Z\x00\x01q", 4);
    AttachDecoder decoder;
    decoder.feed(stream.data(), stream.size());
    AttachFrame frame;
    EXPECT_FALSE(decoder.next(frame));
    EXPECT_TRUE(decoder.bad());
}

TEST(AttachProtocol, ShortResizeIsCorrupt) {
    std::string stream("R\x00\x02\x00\x50", 5);
    AttachDecoder decoder;
    decoder.feed(stream.data(), stream.size());
    AttachFrame frame;
    EXPECT_FALSE(decoder.next(frame));
    EXPECT_TRUE(decoder.bad());
}
