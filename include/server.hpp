#ifndef GITPORT_SERVER_HPP
#define GITPORT_SERVER_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <vector>
#include "framing.hpp"
#include "protocol.hpp"

namespace gitport {

struct ServerContext {
    std::size_t max_frame_size = kDefaultMaxFrameBytes;
};

/**
 * @brief Execute one request and wrap the outcome in a response.
 *
 * Operation failures become `{"err": message}`; nothing thrown by an
 * operation escapes.
 */
Response dispatch(const Request& req);

enum class LoopState { AwaitingLength, AwaitingPayload, Dispatching, WritingResponse, Closed };

enum class CloseReason {
    EndOfStream,  ///< Peer closed the input between frames
    FramingError, ///< Bad length prefix, truncated frame or undecodable request
    WriteError    ///< Output stream failed
};

/**
 * @brief Strictly sequential request/response loop over a byte stream pair.
 *
 * One frame is read, decoded, executed and answered before the next length
 * prefix is read, so responses leave in request order. Framing errors close
 * the loop without a response.
 */
class ProtocolServer {
    std::istream& in_;
    std::ostream& out_;
    ServerContext ctx_;
    LoopState state_ = LoopState::AwaitingLength;
    std::size_t handled_ = 0;

    std::uint32_t length_ = 0;
    std::vector<std::uint8_t> payload_;
    std::optional<Response> response_;

    bool await_length();
    void await_payload();
    void dispatch_current();
    bool write_response();

  public:
    ProtocolServer(std::istream& in, std::ostream& out, ServerContext ctx = {});

    /// Serve until the input ends or a framing error occurs.
    CloseReason run();

    LoopState state() const { return state_; }
    std::size_t handled() const { return handled_; }
};

/// Textual name of a @ref CloseReason for logging.
const char* close_reason_name(CloseReason reason);

} // namespace gitport

#endif // GITPORT_SERVER_HPP
