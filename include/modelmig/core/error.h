#ifndef MODELMIG_CORE_ERROR_H_
#define MODELMIG_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace modelmig {
namespace core {

/**
 * @brief Base class for all coordinator errors
 *
 * The code identifies the category so callers can tell a definitive
 * failure (CONFLICT) from one worth a refresh-and-retry (RACE).
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        NOT_VALID = 1,
        NOT_FOUND = 2,
        ALREADY_EXISTS = 3,
        CONFLICT = 4,
        RACE = 5,
        ILLEGAL_TRANSITION = 6,
        REPORT_CONFLICT = 7,
        TXN_ABORTED = 8,
        EXCESSIVE_CONTENTION = 9,
        INTERNAL = 10
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

    /**
     * @brief Returns a copy with "<prefix>: " prepended, keeping the code
     */
    Error annotate(const std::string& prefix) const {
        return Error(prefix + ": " + what(), code_);
    }

private:
    Code code_;
};

const char* error_code_name(Error::Code code);

/**
 * @brief A malformed input field; the message names the field
 */
class NotValidError : public Error {
public:
    explicit NotValidError(const std::string& message)
        : Error(message, Code::NOT_VALID) {}
    explicit NotValidError(const char* message)
        : Error(message, Code::NOT_VALID) {}
};

/**
 * @brief Error indicating resource not found
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
    explicit NotFoundError(const char* message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Error indicating resource already exists
 */
class AlreadyExistsError : public Error {
public:
    explicit AlreadyExistsError(const std::string& message)
        : Error(message, Code::ALREADY_EXISTS) {}
    explicit AlreadyExistsError(const char* message)
        : Error(message, Code::ALREADY_EXISTS) {}
};

/**
 * @brief The request contradicts current state and will not succeed on retry
 */
class ConflictError : public Error {
public:
    explicit ConflictError(const std::string& message)
        : Error(message, Code::CONFLICT) {}
    explicit ConflictError(const char* message)
        : Error(message, Code::CONFLICT) {}
};

/**
 * @brief Another writer got there first; refresh and decide whether to retry
 */
class RaceError : public Error {
public:
    explicit RaceError(const std::string& message)
        : Error(message, Code::RACE) {}
    explicit RaceError(const char* message)
        : Error(message, Code::RACE) {}
};

class IllegalTransitionError : public Error {
public:
    explicit IllegalTransitionError(const std::string& message)
        : Error(message, Code::ILLEGAL_TRANSITION) {}
    explicit IllegalTransitionError(const char* message)
        : Error(message, Code::ILLEGAL_TRANSITION) {}
};

class ReportConflictError : public Error {
public:
    explicit ReportConflictError(const std::string& message)
        : Error(message, Code::REPORT_CONFLICT) {}
    explicit ReportConflictError(const char* message)
        : Error(message, Code::REPORT_CONFLICT) {}
};

/**
 * @brief A transaction assertion did not hold; nothing was written
 */
class TxnAbortedError : public Error {
public:
    explicit TxnAbortedError(const std::string& message)
        : Error(message, Code::TXN_ABORTED) {}
    explicit TxnAbortedError(const char* message)
        : Error(message, Code::TXN_ABORTED) {}
};

class ExcessiveContentionError : public Error {
public:
    explicit ExcessiveContentionError(const std::string& message)
        : Error(message, Code::EXCESSIVE_CONTENTION) {}
    explicit ExcessiveContentionError(const char* message)
        : Error(message, Code::EXCESSIVE_CONTENTION) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
    explicit InternalError(const char* message)
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace modelmig

#endif // MODELMIG_CORE_ERROR_H_
