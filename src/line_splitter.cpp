#include "line_splitter.hpp"
#include <algorithm>
#include <cstring>
#include <regex>

namespace tailf {

LineSplitter::LineSplitter(std::size_t max_line_length)
    : max_line_length_(std::max<std::size_t>(1, max_line_length))
{
}

void LineSplitter::feed(const char* data, std::size_t size, std::vector<SplitLine>& out) {
    std::size_t pos = 0;
    while (pos < size) {
        const char* nl = static_cast<const char*>(std::memchr(data + pos, '\n', size - pos));
        std::size_t end = nl ? static_cast<std::size_t>(nl - data) : size;

        if (discarding_) {
            if (nl) discarding_ = false;
            pos = end + 1;
            continue;
        }

        std::size_t room = max_line_length_ - partial_.size();
        std::size_t take = std::min(room, end - pos);
        partial_.append(data + pos, take);

        if (take < end - pos) {
            // Limit reached with more of the same line pending
            out.push_back({std::move(partial_), true});
            partial_.clear();
            discarding_ = (nl == nullptr);
            pos = end + 1;
            continue;
        }

        if (nl) {
            if (!partial_.empty() && partial_.back() == '\r') partial_.pop_back();
            out.push_back({std::move(partial_), false});
            partial_.clear();
        }
        pos = end + 1;
    }
}

bool LineSplitter::flush(std::vector<SplitLine>& out) {
    if (partial_.empty()) return false;
    if (partial_.back() == '\r') partial_.pop_back();
    out.push_back({std::move(partial_), false});
    partial_.clear();
    return true;
}

void LineSplitter::skip_to_next_line() {
    partial_.clear();
    discarding_ = true;
}

void LineSplitter::reset() {
    partial_.clear();
    discarding_ = false;
}

std::string strip_ansi_codes(const std::string& text) {
    if (text.find('[') == std::string::npos) return text;

    static const std::regex ansi_pattern(R"((\x1B\[[0-?]*[ -/]*[@-~]|\[[0-9;]+m))");
    return std::regex_replace(text, ansi_pattern, "");
}

} // namespace tailf
