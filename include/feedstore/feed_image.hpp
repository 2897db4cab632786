#pragma once

#include <feedstore/timestamp.hpp>
#include <feedstore/url.hpp>
#include <feedstore/uuid.hpp>
#include <optional>
#include <string>
#include <vector>

namespace feedstore {

struct FeedImage {
    Uuid id;
    std::optional<std::string> description;
    std::optional<std::string> location;
    Url url;

    bool operator==(const FeedImage& other) const {
        return id == other.id && description == other.description &&
               location == other.location && url == other.url;
    }
    bool operator!=(const FeedImage& other) const { return !(*this == other); }
};

struct CachedFeed {
    std::vector<FeedImage> feed;
    Timestamp timestamp;
};

} // namespace feedstore
