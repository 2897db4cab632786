#include <feedstore/url.hpp>
#include <cctype>

namespace feedstore {

static bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

Result<Url> Url::from_string(const std::string& s) {
    if (s.empty()) {
        return FeedStoreError(FeedStoreError::Parse, "URL must not be empty");
    }

    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c <= 0x20 || c == 0x7F) {
            return FeedStoreError(FeedStoreError::Parse,
                "URL contains whitespace or control character: '" + s + "'",
                "Invalid char at position " + std::to_string(i));
        }
    }

    size_t colon = s.find(':');
    if (colon == std::string::npos || colon == 0) {
        return FeedStoreError(FeedStoreError::Parse,
            "URL has no scheme: '" + s + "'",
            "Expected format: <scheme>:<path>, e.g. https://example.com/image.png");
    }
    if (!std::isalpha(static_cast<unsigned char>(s[0]))) {
        return FeedStoreError(FeedStoreError::Parse,
            "URL scheme must start with a letter: '" + s + "'");
    }
    for (size_t i = 1; i < colon; ++i) {
        if (!is_scheme_char(s[i])) {
            return FeedStoreError(FeedStoreError::Parse,
                "URL scheme contains invalid character: '" + s + "'",
                "Invalid char at position " + std::to_string(i));
        }
    }
    if (colon + 1 == s.size()) {
        return FeedStoreError(FeedStoreError::Parse,
            "URL has nothing after the scheme: '" + s + "'");
    }

    return Result<Url>::ok(Url(s, colon));
}

std::string Url::scheme() const {
    std::string out = text_.substr(0, scheme_len_);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace feedstore
