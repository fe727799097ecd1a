#include "text_decoder.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <iconv.h>

namespace tailf {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD";

iconv_t as_iconv(void* handle) {
    return static_cast<iconv_t>(handle);
}

} // namespace

bool TextDecoder::is_utf8_name(const std::string& encoding) {
    std::string lower;
    for (char c : encoding) {
        if (c == '-' || c == '_') continue;
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower.empty() || lower == "utf8" || lower == "ascii" || lower == "usascii";
}

TextDecoder::TextDecoder(const std::string& encoding)
    : encoding_(encoding.empty() ? "utf-8" : encoding)
{
    if (is_utf8_name(encoding_)) return;

    iconv_t cd = iconv_open("UTF-8", encoding_.c_str());
    if (cd == reinterpret_cast<iconv_t>(-1)) {
        ServerLog::warn("Decoder", "Unsupported encoding '" + encoding_ + "', treating input as UTF-8");
        return;
    }
    handle_ = cd;
}

TextDecoder::~TextDecoder() {
    if (handle_) {
        iconv_close(as_iconv(handle_));
    }
}

std::string TextDecoder::decode(const std::string& raw) {
    if (!handle_) return sanitize_utf8(raw);

    iconv_t cd = as_iconv(handle_);
    iconv(cd, nullptr, nullptr, nullptr, nullptr);

    std::string out;
    out.reserve(raw.size() * 2);

    std::string input = raw;
    char* in = input.data();
    std::size_t in_left = input.size();
    char buffer[4096];

    while (in_left > 0) {
        char* out_ptr = buffer;
        std::size_t out_left = sizeof(buffer);
        std::size_t rc = iconv(cd, &in, &in_left, &out_ptr, &out_left);
        out.append(buffer, sizeof(buffer) - out_left);

        if (rc == static_cast<std::size_t>(-1)) {
            if (errno == E2BIG) continue;
            // EILSEQ or EINVAL: replace one byte and resynchronize
            out += kReplacement;
            ++in;
            --in_left;
            iconv(cd, nullptr, nullptr, nullptr, nullptr);
        }
    }
    return out;
}

std::string TextDecoder::sanitize_utf8(const std::string& raw) {
    auto is_cont = [](unsigned char c) { return (c & 0xC0) == 0x80; };

    std::string out;
    out.reserve(raw.size());
    std::size_t i = 0;
    const std::size_t n = raw.size();

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        std::size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;   // bounds for the second byte

        if (c < 0x80) {
            len = 1;
        } else if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        }

        bool valid = len > 0 && i + len <= n;
        if (valid && len > 1) {
            unsigned char second = static_cast<unsigned char>(raw[i + 1]);
            valid = second >= lo && second <= hi;
            for (std::size_t k = 2; valid && k < len; ++k) {
                valid = is_cont(static_cast<unsigned char>(raw[i + k]));
            }
        }

        if (valid) {
            out.append(raw, i, len);
            i += len;
        } else {
            out += kReplacement;
            ++i;
        }
    }
    return out;
}

} // namespace tailf
