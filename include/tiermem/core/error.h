#ifndef TIERMEM_CORE_ERROR_H_
#define TIERMEM_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace tiermem {
namespace core {

/**
 * @brief Base class for all tiermem errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        CHAIN_INTEGRITY = 3,
        OWNER_BUSY = 4,
        STORAGE_FAILURE = 5,
        INTERNAL = 6
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Malformed input, e.g. importance signals outside their range
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message)
        : Error(message, Code::INVALID_ARGUMENT) {}
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
 * @brief A recomputed chunk hash or a previous_hash link does not match
 */
class ChainIntegrityError : public Error {
public:
    explicit ChainIntegrityError(const std::string& message)
        : Error(message, Code::CHAIN_INTEGRITY) {}
    explicit ChainIntegrityError(const char* message)
        : Error(message, Code::CHAIN_INTEGRITY) {}
};

/**
 * @brief Another mutation for the same owner is in flight (fail-fast mode)
 */
class OwnerBusyError : public Error {
public:
    explicit OwnerBusyError(const std::string& message)
        : Error(message, Code::OWNER_BUSY) {}
    explicit OwnerBusyError(const char* message)
        : Error(message, Code::OWNER_BUSY) {}
};

/**
 * @brief Persistence layer failed after all retries
 */
class StorageError : public Error {
public:
    explicit StorageError(const std::string& message)
        : Error(message, Code::STORAGE_FAILURE) {}
    explicit StorageError(const char* message)
        : Error(message, Code::STORAGE_FAILURE) {}
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

/**
 * @brief Stable lowercase name of an error code, used in log lines
 */
const char* error_code_name(Error::Code code);

} // namespace core
} // namespace tiermem

#endif // TIERMEM_CORE_ERROR_H_
