#include "stockade/runtime/log_demux.hpp"

#include <gtest/gtest.h>

using namespace stockade::runtime;

TEST(LogDemuxTest, EmptyBufferYieldsEmptyStreams) {
    auto output = DemuxLogStream("");
    EXPECT_EQ(output.stdout_output, "");
    EXPECT_EQ(output.stderr_output, "");
}

TEST(LogDemuxTest, SplitsStdoutAndStderrFrames) {
    auto buffer = EncodeLogFrame(StreamType::STDOUT, "hello\n") +
                  EncodeLogFrame(StreamType::STDERR, "oops\n");

    auto output = DemuxLogStream(buffer);

    EXPECT_EQ(output.stdout_output, "hello\n");
    EXPECT_EQ(output.stderr_output, "oops\n");
}

TEST(LogDemuxTest, ConcatenatesInterleavedFrames) {
    auto buffer = EncodeLogFrame(StreamType::STDOUT, "a") +
                  EncodeLogFrame(StreamType::STDERR, "x") +
                  EncodeLogFrame(StreamType::STDOUT, "b") +
                  EncodeLogFrame(StreamType::STDERR, "y");

    auto output = DemuxLogStream(buffer);

    EXPECT_EQ(output.stdout_output, "ab");
    EXPECT_EQ(output.stderr_output, "xy");
}

TEST(LogDemuxTest, HeaderLayoutIsBigEndian) {
    std::string payload(300, 'z');
    auto frame = EncodeLogFrame(StreamType::STDERR, payload);

    ASSERT_EQ(frame.size(), kFrameHeaderSize + 300);
    EXPECT_EQ(static_cast<unsigned char>(frame[0]), 2);
    EXPECT_EQ(frame[1], '\0');
    EXPECT_EQ(frame[2], '\0');
    EXPECT_EQ(frame[3], '\0');
    EXPECT_EQ(static_cast<unsigned char>(frame[4]), 0x00);
    EXPECT_EQ(static_cast<unsigned char>(frame[5]), 0x00);
    EXPECT_EQ(static_cast<unsigned char>(frame[6]), 0x01);
    EXPECT_EQ(static_cast<unsigned char>(frame[7]), 0x2C);
}

TEST(LogDemuxTest, DecodesHandWrittenFrame) {
    const char raw[] = {1, 0, 0, 0, 0, 0, 0, 3, 'a', 'b', 'c'};
    auto output = DemuxLogStream(std::string_view(raw, sizeof(raw)));
    EXPECT_EQ(output.stdout_output, "abc");
    EXPECT_EQ(output.stderr_output, "");
}

TEST(LogDemuxTest, DropsTruncatedPayload) {
    auto buffer = EncodeLogFrame(StreamType::STDOUT, "complete") +
                  EncodeLogFrame(StreamType::STDERR, "truncated");
    buffer.resize(buffer.size() - 4);

    auto output = DemuxLogStream(buffer);

    EXPECT_EQ(output.stdout_output, "complete");
    EXPECT_EQ(output.stderr_output, "");
}

TEST(LogDemuxTest, DropsTruncatedHeader) {
    auto buffer = EncodeLogFrame(StreamType::STDOUT, "done");
    buffer.append("\x02\x00\x00", 3);

    auto output = DemuxLogStream(buffer);

    EXPECT_EQ(output.stdout_output, "done");
    EXPECT_EQ(output.stderr_output, "");
}

TEST(LogDemuxTest, IgnoresUnknownStreamTags) {
    auto buffer = EncodeLogFrame(StreamType::STDIN, "input") +
                  EncodeLogFrame(static_cast<StreamType>(7), "junk") +
                  EncodeLogFrame(StreamType::STDOUT, "kept");

    auto output = DemuxLogStream(buffer);

    EXPECT_EQ(output.stdout_output, "kept");
    EXPECT_EQ(output.stderr_output, "");
}

TEST(LogDemuxTest, KeepsBinaryPayloadIntact) {
    std::string payload("a\0b\xff", 4);
    auto output = DemuxLogStream(EncodeLogFrame(StreamType::STDOUT, payload));
    EXPECT_EQ(output.stdout_output, payload);
}

TEST(LogDemuxTest, EmptyFrameIsAccepted) {
    auto buffer = EncodeLogFrame(StreamType::STDOUT, "") +
                  EncodeLogFrame(StreamType::STDERR, "e");
    auto output = DemuxLogStream(buffer);
    EXPECT_EQ(output.stdout_output, "");
    EXPECT_EQ(output.stderr_output, "e");
}
