#pragma once

#include <string>

namespace tailf {

// Converts raw line bytes from a source encoding to UTF-8. Undecodable
// input is replaced with U+FFFD rather than rejected.
class TextDecoder {
public:
    explicit TextDecoder(const std::string& encoding);
    ~TextDecoder();

    TextDecoder(const TextDecoder&) = delete;
    TextDecoder& operator=(const TextDecoder&) = delete;

    std::string decode(const std::string& raw);

    const std::string& encoding() const { return encoding_; }
    bool is_utf8() const { return handle_ == nullptr; }

    static bool is_utf8_name(const std::string& encoding);

    // Replaces malformed UTF-8 sequences
    static std::string sanitize_utf8(const std::string& raw);

private:
    std::string encoding_;
    void* handle_ = nullptr;   // iconv_t
};

} // namespace tailf
