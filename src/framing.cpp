#include "framing.hpp"
#include <limits>
#include <string>
#include "errors.hpp"

namespace gitport {

std::array<unsigned char, kLengthPrefixBytes> encode_length(std::uint32_t length) {
    return {static_cast<unsigned char>((length >> 24) & 0xFF),
            static_cast<unsigned char>((length >> 16) & 0xFF),
            static_cast<unsigned char>((length >> 8) & 0xFF),
            static_cast<unsigned char>(length & 0xFF)};
}

std::uint32_t decode_length(const std::array<unsigned char, kLengthPrefixBytes>& bytes) {
    return (static_cast<std::uint32_t>(bytes[0]) << 24) |
           (static_cast<std::uint32_t>(bytes[1]) << 16) |
           (static_cast<std::uint32_t>(bytes[2]) << 8) | static_cast<std::uint32_t>(bytes[3]);
}

bool read_length(std::istream& in, std::uint32_t& length, std::size_t max_len) {
    std::array<unsigned char, kLengthPrefixBytes> prefix{};
    in.read(reinterpret_cast<char*>(prefix.data()), prefix.size());
    std::streamsize got = in.gcount();
    if (got == 0 && in.eof())
        return false;
    if (got != static_cast<std::streamsize>(prefix.size()))
        throw ProtocolError("truncated length prefix (" + std::to_string(got) + " of 4 bytes)");
    length = decode_length(prefix);
    if (length > max_len)
        throw ProtocolError("frame length " + std::to_string(length) + " exceeds limit of " +
                            std::to_string(max_len) + " bytes");
    return true;
}

void read_payload(std::istream& in, std::uint32_t length, std::vector<std::uint8_t>& payload) {
    payload.resize(length);
    if (length == 0)
        return;
    in.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(length));
    std::streamsize got = in.gcount();
    if (got != static_cast<std::streamsize>(length))
        throw ProtocolError("truncated payload (" + std::to_string(got) + " of " +
                            std::to_string(length) + " bytes)");
}

bool read_frame(std::istream& in, std::vector<std::uint8_t>& payload, std::size_t max_len) {
    std::uint32_t length = 0;
    if (!read_length(in, length, max_len))
        return false;
    read_payload(in, length, payload);
    return true;
}

void write_frame(std::ostream& out, const std::vector<std::uint8_t>& payload) {
    if (payload.size() > std::numeric_limits<std::uint32_t>::max())
        throw ProtocolError("payload of " + std::to_string(payload.size()) +
                            " bytes does not fit a frame");
    auto prefix = encode_length(static_cast<std::uint32_t>(payload.size()));
    out.write(reinterpret_cast<const char*>(prefix.data()), prefix.size());
    if (!payload.empty())
        out.write(reinterpret_cast<const char*>(payload.data()),
                  static_cast<std::streamsize>(payload.size()));
    out.flush();
    if (!out)
        throw ProtocolError("failed to write response frame");
}

} // namespace gitport
