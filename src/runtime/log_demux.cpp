/**
 * @file log_demux.cpp
 * @brief Multiplexed log stream decoding
 *
 * @date 2025
 */

#include "stockade/runtime/log_demux.hpp"

namespace stockade {
namespace runtime {

namespace {

std::uint32_t ReadBigEndian32(const unsigned char* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           static_cast<std::uint32_t>(p[3]);
}

} // anonymous namespace

LogOutput DemuxLogStream(std::string_view buffer) {
    LogOutput output;
    const auto* data = reinterpret_cast<const unsigned char*>(buffer.data());
    const std::size_t size = buffer.size();
    std::size_t offset = 0;

    while (offset + kFrameHeaderSize <= size) {
        const unsigned char stream = data[offset];
        const std::size_t frame_size = ReadBigEndian32(data + offset + 4);

        // Truncated payload: drop the partial frame
        if (frame_size > size - offset - kFrameHeaderSize) {
            break;
        }

        auto payload = buffer.substr(offset + kFrameHeaderSize, frame_size);
        if (stream == static_cast<unsigned char>(StreamType::STDOUT)) {
            output.stdout_output.append(payload);
        } else if (stream == static_cast<unsigned char>(StreamType::STDERR)) {
            output.stderr_output.append(payload);
        }

        offset += kFrameHeaderSize + frame_size;
    }

    return output;
}

std::string EncodeLogFrame(StreamType stream, std::string_view payload) {
    const auto size = static_cast<std::uint32_t>(payload.size());

    std::string frame;
    frame.reserve(kFrameHeaderSize + payload.size());
    frame.push_back(static_cast<char>(stream));
    frame.append(3, '\0');
    frame.push_back(static_cast<char>((size >> 24) & 0xFF));
    frame.push_back(static_cast<char>((size >> 16) & 0xFF));
    frame.push_back(static_cast<char>((size >> 8) & 0xFF));
    frame.push_back(static_cast<char>(size & 0xFF));
    frame.append(payload);
    return frame;
}

} // namespace runtime
} // namespace stockade
