/**
 * @file gitport.cpp
 * @brief Process entry point: serves framed requests on stdin/stdout.
 *
 * stdout carries protocol frames only; everything human readable goes to
 * stderr or the configured log sinks.
 */

#include <iostream>
#include <string>

#include "gitport_app.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "server.hpp"
#include "version.hpp"

namespace gitport {

int run_app(int argc, char* argv[], std::istream& in, std::ostream& out) {
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0], out);
            return 0;
        }
        if (opts.print_version) {
            out << GITPORT_VERSION << "\n";
            return 0;
        }
        apply_logging_options(opts.logging);
        log_info("gitport started", {{"version", GITPORT_VERSION},
                                     {"max_frame_size",
                                      std::to_string(opts.protocol.max_frame_size)}});

        ServerContext ctx;
        ctx.max_frame_size = opts.protocol.max_frame_size;
        ProtocolServer server(in, out, ctx);
        CloseReason reason = server.run();
        shutdown_logger();
        return reason == CloseReason::EndOfStream ? 0 : 1;
    } catch (const std::exception& e) {
        shutdown_logger();
        std::cerr << e.what() << "\n";
        return 1;
    }
}

} // namespace gitport

/**
 * @brief Application entry point.
 *
 * Stream setup happens before anything is read, written or logged.
 */
#ifndef GITPORT_NO_MAIN
int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);
    git::GitInitGuard git_guard;
    return gitport::run_app(argc, argv, std::cin, std::cout);
}
#endif // GITPORT_NO_MAIN
