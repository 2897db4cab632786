#pragma once

#include <string>
#include <utility>

namespace feedstore {

struct FeedStoreError {
    enum Code {
        Open,
        Schema,
        Query,
        Parse,
        Config,
        IO,
        InvalidArg
    };

    Code code = Query;
    std::string message;
    std::string hint;
    // SQLite extended result code behind the failure, 0 when SQLite was not involved
    int sqlite_code = 0;

    FeedStoreError() = default;
    FeedStoreError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    FeedStoreError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace feedstore
