#include "access_guard.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace tailf {

namespace {

// Exact files and whole subtrees that are never served
const std::vector<std::string> kDeniedTrees = {
    "/etc/shadow",
    "/etc/gshadow",
    "/etc/passwd",
    "/etc/sudoers",
    "/root/.ssh",
    "/proc",
    "/sys",
    "/dev",
};

const std::vector<std::string> kDeniedExtensions = {".pem", ".key"};

bool has_parent_segment(const std::string& path) {
    for (const auto& part : fs::path(path)) {
        if (part == "..") return true;
    }
    return false;
}

bool is_within(const fs::path& path, const fs::path& prefix) {
    auto p = path.begin();
    for (auto it = prefix.begin(); it != prefix.end(); ++it) {
        if (it->empty()) continue;  // trailing separator
        if (p == path.end() || *p != *it) return false;
        ++p;
    }
    return true;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string strip_trailing_separators(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

} // namespace

const char* reject_reason_name(RejectReason reason) {
    switch (reason) {
        case RejectReason::None: return "none";
        case RejectReason::PathOutsideWhitelist: return "path-outside-whitelist";
        case RejectReason::PathDenylisted: return "path-denylisted";
        case RejectReason::CommandVerbNotAllowed: return "command-verb-not-allowed";
        case RejectReason::CommandHasMetacharacter: return "command-has-metacharacter";
        case RejectReason::SizeExceeded: return "size-exceeded";
        default: return "unknown";
    }
}

GuardError::GuardError(const GuardResult& result)
    : std::runtime_error(std::string(reject_reason_name(result.reason)) + ": " + result.detail)
    , reason_(result.reason)
{
}

const std::vector<std::string>& AccessGuard::default_verbs() {
    static const std::vector<std::string> verbs = {"tail", "cat", "head", "ls", "find"};
    return verbs;
}

const std::string& AccessGuard::metacharacters() {
    static const std::string chars = ";|&`$><\n\r";
    return chars;
}

std::string AccessGuard::normalize(const std::string& path, PathStyle style) {
    if (path.empty()) return {};

    fs::path p(path);
    if (style == PathStyle::Remote) {
        return strip_trailing_separators(p.lexically_normal().generic_string());
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(p, ec);
    if (ec) return {};

    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        resolved = absolute.lexically_normal();
    }
    return strip_trailing_separators(resolved.generic_string());
}

bool AccessGuard::is_denylisted(const std::string& normalized) {
    fs::path p(normalized);
    for (const auto& denied : kDeniedTrees) {
        if (is_within(p, fs::path(denied))) return true;
    }
    for (const auto& part : p) {
        if (part == ".ssh") return true;
    }
    std::string lower = to_lower(normalized);
    for (const auto& ext : kDeniedExtensions) {
        if (lower.size() >= ext.size() &&
            lower.compare(lower.size() - ext.size(), ext.size(), ext) == 0) {
            return true;
        }
    }
    return false;
}

GuardResult AccessGuard::validate_path(const std::string& candidate,
                                       const std::vector<std::string>& allowed_prefixes,
                                       PathStyle style) {
    if (candidate.empty()) {
        return GuardResult::reject(RejectReason::PathOutsideWhitelist, "empty path");
    }
    if (has_parent_segment(candidate)) {
        return GuardResult::reject(RejectReason::PathDenylisted,
                                   "parent directory traversal in " + candidate);
    }
    if (style == PathStyle::Remote && candidate.front() != '/') {
        return GuardResult::reject(RejectReason::PathOutsideWhitelist,
                                   "remote path must be absolute: " + candidate);
    }

    std::string normalized = normalize(candidate, style);
    if (normalized.empty()) {
        return GuardResult::reject(RejectReason::PathOutsideWhitelist,
                                   "cannot resolve " + candidate);
    }

    // Deny-list wins over the allow-list
    if (is_denylisted(normalized)) {
        return GuardResult::reject(RejectReason::PathDenylisted, normalized);
    }

    for (const auto& allowed : allowed_prefixes) {
        if (allowed.empty() || has_parent_segment(allowed)) continue;
        std::string prefix = normalize(allowed, style);
        if (prefix.empty()) continue;
        if (is_within(fs::path(normalized), fs::path(prefix))) {
            return GuardResult::accept();
        }
    }

    return GuardResult::reject(RejectReason::PathOutsideWhitelist, normalized);
}

GuardResult AccessGuard::validate_command(const std::string& candidate,
                                          const std::vector<std::string>& allowed_verbs) {
    // Commands are never run through a shell, but keep metacharacters out
    // regardless of how the transport executes them.
    auto meta = candidate.find_first_of(metacharacters());
    if (meta != std::string::npos) {
        std::string shown = candidate[meta] == '\n' ? "\\n"
                          : candidate[meta] == '\r' ? "\\r"
                          : std::string(1, candidate[meta]);
        return GuardResult::reject(RejectReason::CommandHasMetacharacter,
                                   "metacharacter '" + shown + "' in command");
    }

    auto begin = candidate.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return GuardResult::reject(RejectReason::CommandVerbNotAllowed, "empty command");
    }
    auto end = candidate.find_first_of(" \t", begin);
    std::string verb = candidate.substr(begin, end == std::string::npos ? std::string::npos : end - begin);

    if (std::find(allowed_verbs.begin(), allowed_verbs.end(), verb) == allowed_verbs.end()) {
        return GuardResult::reject(RejectReason::CommandVerbNotAllowed, "verb '" + verb + "'");
    }
    return GuardResult::accept();
}

GuardResult AccessGuard::check_file_size(std::uint64_t observed_size, std::uint64_t max_size) {
    if (observed_size > max_size) {
        return GuardResult::reject(RejectReason::SizeExceeded,
                                   std::to_string(observed_size) + " bytes (max " +
                                   std::to_string(max_size) + ")");
    }
    return GuardResult::accept();
}

std::string AccessGuard::quote_argument(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

} // namespace tailf
