#pragma once

#include <feedstore/result.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace feedstore {

// Identity of a FeedImage, persisted in the id column as canonical text
struct Uuid {
    std::array<uint8_t, 16> bytes;

    // Random id for a new feed image
    static Uuid v4();
    // Canonical lowercase form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    std::string to_string() const;
    // Accepts either case
    static Result<Uuid> from_string(const std::string& s);
    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
};

} // namespace feedstore
