#ifndef GITPORT_APP_HPP
#define GITPORT_APP_HPP

#include <istream>
#include <ostream>

namespace gitport {

/**
 * @brief Parse options, configure logging and serve frames from @p in to
 *        @p out until the input ends.
 *
 * Help and version text go to @p out. Expects libgit2 to be initialized.
 *
 * @return 0 on clean end of input or after help/version; 1 on option,
 *         framing or write errors.
 */
int run_app(int argc, char* argv[], std::istream& in, std::ostream& out);

} // namespace gitport

#endif // GITPORT_APP_HPP
