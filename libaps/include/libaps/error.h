//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace aps {

    enum class ErrorKind {
        // Source resolution
        SourceUnavailable,
        GitOperationFailed,
        // Install decisions
        ConflictBlocked,
        UserCancelled,
        StructuralValidationFailed,
        // Filesystem
        IOFailure,
        // Collaborators (manifest, lockfile, driver)
        ManifestInvalid,
        LockfileInvalid,
        EntryNotFound
    };

    struct Error {
        ErrorKind kind;
        std::string message;
    };

    inline const char* to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::SourceUnavailable: return "source unavailable";
            case ErrorKind::GitOperationFailed: return "git operation failed";
            case ErrorKind::ConflictBlocked: return "conflict blocked";
            case ErrorKind::UserCancelled: return "cancelled by user";
            case ErrorKind::StructuralValidationFailed: return "structural validation failed";
            case ErrorKind::IOFailure: return "I/O failure";
            case ErrorKind::ManifestInvalid: return "invalid manifest";
            case ErrorKind::LockfileInvalid: return "invalid lockfile";
            case ErrorKind::EntryNotFound: return "entry not found";
        }
        return "unknown error";
    }

    // Builds an IOFailure carrying both the context and the underlying cause.
    inline Error io_error(const std::string& context, const std::error_code& ec) {
        return Error{ErrorKind::IOFailure, context + ": " + ec.message()};
    }

    // Thrown inside the materialization phase of an install and converted
    // back into an Error at the Installer boundary.
    class SyncException : public std::runtime_error {
    public:
        SyncException(ErrorKind error, const std::string& what_arg)
            : std::runtime_error(what_arg), m_error(error) {}

        ErrorKind get_error() const {
            return m_error;
        }

    private:
        ErrorKind m_error;
    };

} // namespace aps
