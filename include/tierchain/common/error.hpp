#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace tierchain {

    // ===========================================
    // Tierchain error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_NOT_FOUND = 100;
    constexpr dp::u32 ERR_CONFLICT = 101;
    constexpr dp::u32 ERR_INTEGRITY_FAILURE = 102;
    constexpr dp::u32 ERR_INPUT = 103;
    constexpr dp::u32 ERR_STORAGE = 104;
    constexpr dp::u32 ERR_HASH_FAILED = 105;

    enum class ErrorKind { NotFound, Conflict, IntegrityFailure, InputError, StorageError, Internal };

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error not_found_error(const std::string &msg = "Chain not found") {
        return dp::Error{ERR_NOT_FOUND, dp::String(msg.c_str())};
    }

    inline dp::Error conflict(const std::string &msg = "Conflict") {
        return dp::Error{ERR_CONFLICT, dp::String(msg.c_str())};
    }

    /// Returned by ValidationService::require for an invalid report; mutation paths never return this
    inline dp::Error integrity_failure(const std::string &msg = "Integrity check failed") {
        return dp::Error{ERR_INTEGRITY_FAILURE, dp::String(msg.c_str())};
    }

    inline dp::Error input_error(const std::string &msg = "Malformed input") {
        return dp::Error{ERR_INPUT, dp::String(msg.c_str())};
    }

    inline dp::Error storage_error(const std::string &msg = "Storage operation failed") {
        return dp::Error{ERR_STORAGE, dp::String(msg.c_str())};
    }

    inline dp::Error hash_failed(const std::string &msg = "Hash computation failed") {
        return dp::Error{ERR_HASH_FAILED, dp::String(msg.c_str())};
    }

    inline ErrorKind errorKind(const dp::Error &err) {
        switch (err.code) {
        case ERR_NOT_FOUND:
            return ErrorKind::NotFound;
        case ERR_CONFLICT:
            return ErrorKind::Conflict;
        case ERR_INTEGRITY_FAILURE:
            return ErrorKind::IntegrityFailure;
        case ERR_INPUT:
            return ErrorKind::InputError;
        case ERR_STORAGE:
            return ErrorKind::StorageError;
        default:
            return ErrorKind::Internal;
        }
    }

    inline std::string errorKindToString(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::NotFound:
            return "not_found";
        case ErrorKind::Conflict:
            return "conflict";
        case ErrorKind::IntegrityFailure:
            return "integrity_failure";
        case ErrorKind::InputError:
            return "input_error";
        case ErrorKind::StorageError:
            return "storage_error";
        default:
            return "internal";
        }
    }

    inline std::string errorMessage(const dp::Error &err) { return std::string(err.message.c_str()); }

} // namespace tierchain
