#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace knotstore {

    // ===========================================
    // knotstore error codes (200+)
    // ===========================================

    constexpr dp::u32 ERR_NOT_FOUND = 200;
    constexpr dp::u32 ERR_DUPLICATE_KEY = 201;
    constexpr dp::u32 ERR_DUPLICATE_ENTRY = 202;
    constexpr dp::u32 ERR_INVARIANT_VIOLATION = 203;
    constexpr dp::u32 ERR_MISSING_INPUT = 204;
    constexpr dp::u32 ERR_INVALID_BLOCK = 205;
    constexpr dp::u32 ERR_STORAGE_UNAVAILABLE = 206;
    constexpr dp::u32 ERR_PUBLISHER_FAILURE = 207;
    constexpr dp::u32 ERR_MAILBOX_CLOSED = 208;
    constexpr dp::u32 ERR_MAILBOX_FULL = 209;
    constexpr dp::u32 ERR_INVALID_CONFIG = 210;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error not_found(const dp::String &msg = "Not found") { return dp::Error{ERR_NOT_FOUND, msg}; }

    inline dp::Error duplicate_key(const dp::String &msg = "Key already present") {
        return dp::Error{ERR_DUPLICATE_KEY, msg};
    }

    inline dp::Error duplicate_entry(const dp::String &msg = "Entry already pending") {
        return dp::Error{ERR_DUPLICATE_ENTRY, msg};
    }

    inline dp::Error invariant_violation(const dp::String &msg = "Invariant violation") {
        return dp::Error{ERR_INVARIANT_VIOLATION, msg};
    }

    inline dp::Error missing_input(const dp::String &msg = "Input not available") {
        return dp::Error{ERR_MISSING_INPUT, msg};
    }

    inline dp::Error invalid_block(const dp::String &msg = "Invalid block") {
        return dp::Error{ERR_INVALID_BLOCK, msg};
    }

    inline dp::Error storage_unavailable(const dp::String &msg = "Storage unavailable") {
        return dp::Error{ERR_STORAGE_UNAVAILABLE, msg};
    }

    inline dp::Error publisher_failure(const dp::String &msg = "Publisher failure") {
        return dp::Error{ERR_PUBLISHER_FAILURE, msg};
    }

    inline dp::Error mailbox_closed(const dp::String &msg = "Mailbox closed") {
        return dp::Error{ERR_MAILBOX_CLOSED, msg};
    }

    inline dp::Error mailbox_full(const dp::String &msg = "Mailbox full") { return dp::Error{ERR_MAILBOX_FULL, msg}; }

    inline dp::Error invalid_config(const dp::String &msg = "Invalid configuration") {
        return dp::Error{ERR_INVALID_CONFIG, msg};
    }

    /// True if the error carries the given knotstore code
    inline bool is_error(const dp::Error &err, dp::u32 code) { return err.code == code; }

    /// Error message as std::string, for logging
    inline std::string error_text(const dp::Error &err) { return std::string(err.message.c_str()); }

} // namespace knotstore
