#ifndef CRUXENCLAVE_ERRORS_HPP
#define CRUXENCLAVE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace CruxEnclave {

/**
 * @brief Base class for all CruxEnclave exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message) : msg_(message) {}
    explicit Exception(const char* message) : msg_(message) {}
    virtual ~Exception() noexcept override = default;

    virtual const char* what() const noexcept override {
        return msg_.c_str();
    }

protected:
    std::string msg_;
};

/**
 * @brief Exception for errors that occur at runtime.
 */
class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& message) : Exception(message) {}
    explicit RuntimeError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message) : Exception(message) {}
    explicit LogicError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message) {}
    explicit InvalidArgument(const char* message) : LogicError(message) {}
};

/**
 * @brief A string could not be decoded as a public or private key.
 */
class MalformedKey : public InvalidArgument {
public:
    explicit MalformedKey(const std::string& message) : InvalidArgument(message) {}
};

/**
 * @brief No configured key pair has the requested public half.
 */
class KeyNotFound : public RuntimeError {
public:
    explicit KeyNotFound(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief The sender of a store request is not one of the node's identities.
 */
class UnknownSender : public RuntimeError {
public:
    explicit UnknownSender(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief A digest (or any byte-store key) is absent.
 */
class NotFound : public RuntimeError {
public:
    explicit NotFound(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief Authentication failed while opening a recipient box or a payload.
 */
class UnsealError : public RuntimeError {
public:
    explicit UnsealError(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief Encoded bytes do not describe a valid structure.
 */
class CodecError : public RuntimeError {
public:
    explicit CodecError(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief Node configuration is missing or invalid.
 */
class ConfigError : public InvalidArgument {
public:
    explicit ConfigError(const std::string& message) : InvalidArgument(message) {}
};

} // namespace CruxEnclave

#endif // CRUXENCLAVE_ERRORS_HPP
