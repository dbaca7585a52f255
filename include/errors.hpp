/**
 * @file errors.hpp
 * @brief Exception hierarchy for macfence
 * @author macfence Development Team
 * @date 2026
 *
 * Registry and document operations report failures by throwing one of the
 * exceptions below. Each carries an ErrorCode so callers (the CLI, or any
 * request layer built on top of ParentalControlService) can map it to a
 * response class without string matching:
 *
 * - ValidationError, ConflictError: bad user input, nothing was changed
 * - NotFoundError: unknown device id
 * - PersistError: the store could not be written; the caller must not
 *   assume the mutation happened
 * - MalformedDocumentError: the remote configuration is not parseable
 */

#pragma once

#include <stdexcept>
#include <string>

namespace macfence {

enum class ErrorCode {
    InvalidMacFormat,
    InvalidName,
    DuplicateMac,
    DuplicateName,
    NotFound,
    PersistFailed,
    MalformedDocument
};

/**
 * @brief Convert an ErrorCode to its stable name
 * @param code Error code
 * @return Name such as "DuplicateMac"
 */
std::string errorCodeToString(ErrorCode code);

class MacfenceError : public std::runtime_error {
public:
    MacfenceError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/// Bad MAC address or device name
class ValidationError : public MacfenceError {
public:
    using MacfenceError::MacfenceError;
};

/// Duplicate MAC address or device name
class ConflictError : public MacfenceError {
public:
    using MacfenceError::MacfenceError;
};

class NotFoundError : public MacfenceError {
public:
    explicit NotFoundError(const std::string& message)
        : MacfenceError(ErrorCode::NotFound, message) {}
};

class PersistError : public MacfenceError {
public:
    explicit PersistError(const std::string& message)
        : MacfenceError(ErrorCode::PersistFailed, message) {}
};

class MalformedDocumentError : public MacfenceError {
public:
    explicit MalformedDocumentError(const std::string& message)
        : MacfenceError(ErrorCode::MalformedDocument, message) {}
};

} // namespace macfence
