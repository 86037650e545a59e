// ARBITER - Database Implementation
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/db/database.h>

namespace arbiter {
namespace db {

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result;
    switch (code_) {
        case NOT_FOUND: result = "NotFound: "; break;
        case CORRUPTION: result = "Corruption: "; break;
        case NOT_SUPPORTED: result = "NotSupported: "; break;
        case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
        case IO_ERROR: result = "IOError: "; break;
        default: result = "Unknown: "; break;
    }
    return result + message_;
}

std::optional<uint64_t> ParseIdKey(char prefix, const Slice& key) {
    if (key.size() != 9 || key.data()[0] != prefix) {
        return std::nullopt;
    }
    uint64_t id = 0;
    for (size_t i = 1; i < 9; ++i) {
        id = (id << 8) | static_cast<uint8_t>(key.data()[i]);
    }
    return id;
}

} // namespace db
} // namespace arbiter
