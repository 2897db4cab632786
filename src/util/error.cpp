#include <feedstore/error.hpp>
#include <sqlite3.h>

namespace feedstore {

const char* FeedStoreError::code_name(Code c) {
    switch (c) {
        case Open:       return "Open";
        case Schema:     return "Schema";
        case Query:      return "Query";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case IO:         return "IO";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string FeedStoreError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (sqlite_code != 0) {
        result += "\n  sqlite: ";
        result += sqlite3_errstr(sqlite_code);
        result += " (";
        result += std::to_string(sqlite_code);
        result += ")";
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace feedstore
