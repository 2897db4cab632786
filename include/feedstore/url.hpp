#pragma once

#include <feedstore/result.hpp>
#include <string>

namespace feedstore {

// Absolute resource locator: <scheme>:<rest>
//
// Validation is structural only: the scheme must follow RFC 3986
// (ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )), the remainder must be
// non-empty, and no whitespace or control characters may appear.
// The text is kept verbatim so to_string() returns what was parsed.
class Url {
public:
    static Result<Url> from_string(const std::string& s);

    const std::string& to_string() const { return text_; }
    std::string scheme() const;

    bool operator==(const Url& other) const { return text_ == other.text_; }
    bool operator!=(const Url& other) const { return text_ != other.text_; }

private:
    explicit Url(std::string text, size_t scheme_len)
        : text_(std::move(text)), scheme_len_(scheme_len) {}

    std::string text_;
    size_t scheme_len_ = 0;
};

} // namespace feedstore
