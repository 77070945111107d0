#include "server.hpp"
#include <chrono>
#include <exception>
#include <limits>
#include <string>
#include <type_traits>
#include "errors.hpp"
#include "file_utils.hpp"
#include "logger.hpp"
#include "repo_sync.hpp"
#include "time_utils.hpp"

namespace gitport {

namespace {

struct Dispatcher {
    Response operator()(const SyncRequest& r) const {
        return Response::ok(sync_repo(r.url, r.branch, r.path, r.depth));
    }
    Response operator()(const FilesRequest& r) const {
        return Response::ok(list_files(r.path, r.subpath));
    }
    Response operator()(const ReadRequest& r) const {
        return Response::ok(read_file(r.path, r.file));
    }
    Response operator()(const HeadRequest& r) const { return Response::ok(head(r.path)); }
    Response operator()(const CheckoutRequest& r) const {
        return Response::ok(checkout(r.path, r.sha));
    }
    Response operator()(const LsRemoteRequest& r) const {
        return Response::ok(ls_remote(r.url, r.branch));
    }
};

// Main argument of a request, for log lines.
std::string request_target(const Request& req) {
    return std::visit(
        [](const auto& r) -> std::string {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, SyncRequest> || std::is_same_v<T, LsRemoteRequest>)
                return r.url + "#" + r.branch;
            else
                return r.path;
        },
        req);
}

} // namespace

Response dispatch(const Request& req) {
    const char* op = op_name(req);
    auto start = std::chrono::steady_clock::now();
    try {
        Response resp = std::visit(Dispatcher{}, req);
        log_info("Request completed",
                 {{"op", op},
                  {"target", request_target(req)},
                  {"elapsed", format_elapsed(std::chrono::steady_clock::now() - start)}});
        return resp;
    } catch (const Error& e) {
        log_warning("Request failed", {{"op", op},
                                       {"target", request_target(req)},
                                       {"kind", error_kind_name(e.kind())},
                                       {"error", e.what()}});
        return Response::err(e.what());
    } catch (const std::exception& e) {
        log_error("Request failed",
                  {{"op", op}, {"target", request_target(req)}, {"error", e.what()}});
        return Response::err(e.what());
    }
}

const char* close_reason_name(CloseReason reason) {
    switch (reason) {
    case CloseReason::EndOfStream:
        return "end_of_stream";
    case CloseReason::FramingError:
        return "framing_error";
    case CloseReason::WriteError:
        return "write_error";
    }
    return "unknown";
}

ProtocolServer::ProtocolServer(std::istream& in, std::ostream& out, ServerContext ctx)
    : in_(in), out_(out), ctx_(ctx) {}

bool ProtocolServer::await_length() {
    if (!read_length(in_, length_, ctx_.max_frame_size))
        return false;
    state_ = LoopState::AwaitingPayload;
    return true;
}

void ProtocolServer::await_payload() {
    read_payload(in_, length_, payload_);
    state_ = LoopState::Dispatching;
}

void ProtocolServer::dispatch_current() {
    Request req = decode_request(payload_);
    log_debug("Request received", {{"op", op_name(req)}, {"bytes", std::to_string(length_)}});
    response_ = dispatch(req);
    state_ = LoopState::WritingResponse;
}

bool ProtocolServer::write_response() {
    std::vector<std::uint8_t> bytes = response_->encode();
    if (bytes.size() > std::numeric_limits<std::uint32_t>::max()) {
        log_error("Response too large for a frame", {{"bytes", std::to_string(bytes.size())}});
        bytes = Response::err("response too large: " + std::to_string(bytes.size()) + " bytes")
                    .encode();
    }
    try {
        write_frame(out_, bytes);
    } catch (const ProtocolError& e) {
        log_error("Failed to write response", {{"error", e.what()}});
        return false;
    }
    response_.reset();
    ++handled_;
    state_ = LoopState::AwaitingLength;
    return true;
}

CloseReason ProtocolServer::run() {
    state_ = LoopState::AwaitingLength;
    CloseReason reason = CloseReason::EndOfStream;
    try {
        while (state_ != LoopState::Closed) {
            switch (state_) {
            case LoopState::AwaitingLength:
                if (!await_length())
                    state_ = LoopState::Closed;
                break;
            case LoopState::AwaitingPayload:
                await_payload();
                break;
            case LoopState::Dispatching:
                dispatch_current();
                break;
            case LoopState::WritingResponse:
                if (!write_response()) {
                    reason = CloseReason::WriteError;
                    state_ = LoopState::Closed;
                }
                break;
            case LoopState::Closed:
                break;
            }
        }
    } catch (const ProtocolError& e) {
        log_error("Framing error", {{"error", e.what()}});
        reason = CloseReason::FramingError;
        state_ = LoopState::Closed;
    }
    log_info("Protocol loop closed",
             {{"reason", close_reason_name(reason)}, {"requests", std::to_string(handled_)}});
    return reason;
}

} // namespace gitport
