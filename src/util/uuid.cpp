#include <feedstore/uuid.hpp>
#include <random>

namespace feedstore {

static constexpr size_t TEXT_LENGTH = 36;
static const char HEX_DIGITS[] = "0123456789abcdef";

static bool is_dash_position(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Seeded once per thread so callers can mint ids concurrently
static std::mt19937_64& thread_engine() {
    thread_local std::mt19937_64 engine = [] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }();
    return engine;
}

Uuid Uuid::v4() {
    Uuid u;
    auto& engine = thread_engine();
    for (size_t half = 0; half < 2; ++half) {
        uint64_t word = engine();
        for (size_t i = 0; i < 8; ++i) {
            u.bytes[half * 8 + i] = static_cast<uint8_t>(word >> (56 - 8 * i));
        }
    }
    u.bytes[6] = static_cast<uint8_t>((u.bytes[6] & 0x0F) | 0x40);
    u.bytes[8] = static_cast<uint8_t>((u.bytes[8] & 0x3F) | 0x80);
    return u;
}

std::string Uuid::to_string() const {
    std::string out(TEXT_LENGTH, '-');
    size_t pos = 0;
    for (uint8_t b : bytes) {
        if (is_dash_position(pos)) ++pos;
        out[pos++] = HEX_DIGITS[b >> 4];
        out[pos++] = HEX_DIGITS[b & 0x0F];
    }
    return out;
}

Result<Uuid> Uuid::from_string(const std::string& s) {
    if (s.size() != TEXT_LENGTH) {
        return FeedStoreError(FeedStoreError::Parse,
            "feed image id must be 36 characters: '" + s + "'",
            "expected xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    }

    Uuid u;
    size_t nibble = 0;
    for (size_t i = 0; i < TEXT_LENGTH; ++i) {
        if (is_dash_position(i)) {
            if (s[i] != '-') {
                return FeedStoreError(FeedStoreError::Parse,
                    "feed image id is missing a dash at position " + std::to_string(i)
                    + ": '" + s + "'");
            }
            continue;
        }
        int v = hex_value(s[i]);
        if (v < 0) {
            return FeedStoreError(FeedStoreError::Parse,
                "feed image id has a non-hex character at position " + std::to_string(i)
                + ": '" + s + "'");
        }
        uint8_t& b = u.bytes[nibble / 2];
        b = (nibble % 2 == 0) ? static_cast<uint8_t>(v << 4)
                              : static_cast<uint8_t>(b | v);
        ++nibble;
    }
    return Result<Uuid>::ok(u);
}

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return !(*this == other);
}

} // namespace feedstore
