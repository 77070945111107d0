#ifndef GITPORT_FRAMING_HPP
#define GITPORT_FRAMING_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

namespace gitport {

// Every message is [4-byte big-endian payload length][payload].
constexpr std::size_t kLengthPrefixBytes = 4;
constexpr std::size_t kDefaultMaxFrameBytes = 64u * 1024u * 1024u;

std::array<unsigned char, kLengthPrefixBytes> encode_length(std::uint32_t length);
std::uint32_t decode_length(const std::array<unsigned char, kLengthPrefixBytes>& bytes);

/**
 * @brief Read a length prefix.
 *
 * @return `false` when the stream ends cleanly before the first byte.
 * @throws gitport::ProtocolError on a truncated prefix or a length above
 *         @p max_len.
 */
bool read_length(std::istream& in, std::uint32_t& length,
                 std::size_t max_len = kDefaultMaxFrameBytes);

/**
 * @brief Read exactly @p length payload bytes.
 *
 * @throws gitport::ProtocolError if the stream ends first.
 */
void read_payload(std::istream& in, std::uint32_t length, std::vector<std::uint8_t>& payload);

/**
 * @brief Read one complete frame.
 *
 * @return `false` on clean end of stream.
 */
bool read_frame(std::istream& in, std::vector<std::uint8_t>& payload,
                std::size_t max_len = kDefaultMaxFrameBytes);

/**
 * @brief Write one frame and flush.
 *
 * @throws gitport::ProtocolError if the payload does not fit the prefix or the
 *         stream fails.
 */
void write_frame(std::ostream& out, const std::vector<std::uint8_t>& payload);

} // namespace gitport

#endif // GITPORT_FRAMING_HPP
