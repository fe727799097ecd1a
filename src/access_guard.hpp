#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace tailf {

enum class RejectReason {
    None,
    PathOutsideWhitelist,
    PathDenylisted,
    CommandVerbNotAllowed,
    CommandHasMetacharacter,
    SizeExceeded
};

// Stable identifiers used in logs and error payloads
const char* reject_reason_name(RejectReason reason);

struct GuardResult {
    bool ok = true;
    RejectReason reason = RejectReason::None;
    std::string detail;

    explicit operator bool() const { return ok; }

    static GuardResult accept() { return {}; }
    static GuardResult reject(RejectReason reason, std::string detail) {
        return {false, reason, std::move(detail)};
    }
};

// Thrown where a rejected path or command must abort the caller (source
// creation, tailer start). Maps to the SecurityViolation error kind.
class GuardError : public std::runtime_error {
public:
    explicit GuardError(const GuardResult& result);

    RejectReason reason() const { return reason_; }

private:
    RejectReason reason_;
};

// Local paths are resolved against the filesystem (symlinks included);
// remote paths can only be normalized lexically and must be absolute.
enum class PathStyle { Local, Remote };

// All checks are side-effect free apart from the filesystem lookups
// needed to resolve symlinks for local paths.
class AccessGuard {
public:
    static GuardResult validate_path(const std::string& candidate,
                                     const std::vector<std::string>& allowed_prefixes,
                                     PathStyle style = PathStyle::Local);

    static GuardResult validate_command(const std::string& candidate,
                                        const std::vector<std::string>& allowed_verbs = default_verbs());

    static GuardResult check_file_size(std::uint64_t observed_size, std::uint64_t max_size);

    // Normalized form of a path as validate_path compares it
    static std::string normalize(const std::string& path, PathStyle style);

    // Single-quotes an argument for a remote command line
    static std::string quote_argument(const std::string& arg);

    static const std::vector<std::string>& default_verbs();
    static const std::string& metacharacters();

private:
    static bool is_denylisted(const std::string& normalized);
};

} // namespace tailf
