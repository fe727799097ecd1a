#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tailf {

struct SplitLine {
    std::string text;
    bool truncated = false;
};

// Turns a byte stream into lines. A trailing partial line is held until
// the next feed; a line longer than max_line_length is emitted cut and
// flagged as soon as the limit is hit, and the rest of it is discarded.
class LineSplitter {
public:
    explicit LineSplitter(std::size_t max_line_length);

    void feed(const char* data, std::size_t size, std::vector<SplitLine>& out);

    // Emits the held partial line, if any (used when a file ends for good)
    bool flush(std::vector<SplitLine>& out);

    // Drops everything up to and including the next newline
    void skip_to_next_line();

    void reset();

    bool has_partial() const { return !partial_.empty(); }
    std::size_t max_line_length() const { return max_line_length_; }

private:
    std::size_t max_line_length_;
    std::string partial_;
    bool discarding_ = false;
};

// Removes ANSI colour/control sequences, including the bare "[0;31m" form
// some loggers write without the escape byte.
std::string strip_ansi_codes(const std::string& text);

} // namespace tailf
