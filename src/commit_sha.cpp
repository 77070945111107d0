#include "commit_sha.hpp"
#include <algorithm>
#include <cctype>
#include "errors.hpp"

namespace gitport {

bool CommitSha::is_valid(const std::string& text) {
    if (text.size() != kSha1HexLength && text.size() != kSha256HexLength)
        return false;
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

CommitSha CommitSha::parse(const std::string& text) {
    if (!is_valid(text))
        throw Error::invalid_argument("not a commit sha: '" + text + "'");
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return CommitSha(std::move(lower));
}

} // namespace gitport
