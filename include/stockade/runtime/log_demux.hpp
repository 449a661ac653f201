/**
 * @file log_demux.hpp
 * @brief Decoder for the engine's multiplexed stdout/stderr stream
 *
 * Non-TTY containers return their output as a sequence of frames. Each frame
 * is an 8-byte header followed by the payload:
 *
 * ```
 * +--------+--------+--------+--------+--------+--------+--------+--------+
 * | stream |   0    |   0    |   0    |     payload size (big-endian)     |
 * +--------+--------+--------+--------+--------+--------+--------+--------+
 * ```
 *
 * stream: 0 = stdin, 1 = stdout, 2 = stderr.
 *
 * @date 2025
 */

#pragma once

#include "stockade/runtime/container_runtime.hpp"

#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>

namespace stockade {
namespace runtime {

/// Size of a frame header in bytes
constexpr std::size_t kFrameHeaderSize = 8;

/// Stream tags used in the frame header
enum class StreamType : std::uint8_t {
    STDIN = 0,
    STDOUT = 1,
    STDERR = 2
};

/**
 * @brief Split a multiplexed buffer into stdout and stderr
 *
 * Frames with an unknown stream tag are skipped. A trailing frame that is
 * shorter than its header or its declared payload is dropped without error.
 */
LogOutput DemuxLogStream(std::string_view buffer);

/**
 * @brief Encode one frame (header + payload)
 */
std::string EncodeLogFrame(StreamType stream, std::string_view payload);

} // namespace runtime
} // namespace stockade
