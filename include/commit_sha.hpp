#ifndef GITPORT_COMMIT_SHA_HPP
#define GITPORT_COMMIT_SHA_HPP

#include <cstddef>
#include <string>
#include <utility>

namespace gitport {

/**
 * @brief Validated, lowercase hexadecimal commit identifier.
 *
 * Accepts the 40 character SHA-1 form and the 64 character SHA-256 form.
 * The value is never interpreted beyond validation.
 */
class CommitSha {
    std::string value_;

    explicit CommitSha(std::string value) : value_(std::move(value)) {}

  public:
    static constexpr std::size_t kSha1HexLength = 40;
    static constexpr std::size_t kSha256HexLength = 64;
    static constexpr std::size_t kShortLength = 7;

    /**
     * @brief Parse and normalize a commit identifier.
     *
     * @param text Candidate hex string, any case.
     * @return Normalized identifier.
     * @throws gitport::Error with ErrorKind::InvalidArgument when @p text is
     *         not 40 or 64 hex characters.
     */
    static CommitSha parse(const std::string& text);

    /// `true` if @p text would be accepted by @ref parse.
    static bool is_valid(const std::string& text);

    const std::string& str() const { return value_; }

    /// First seven characters, as shown by `git log --oneline`.
    std::string short_form() const { return value_.substr(0, kShortLength); }

    bool operator==(const CommitSha& other) const { return value_ == other.value_; }
    bool operator!=(const CommitSha& other) const { return value_ != other.value_; }
};

} // namespace gitport

#endif // GITPORT_COMMIT_SHA_HPP
