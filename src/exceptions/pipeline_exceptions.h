#ifndef PRISM_EXCEPTIONS_PIPELINE_EXCEPTIONS_H
#define PRISM_EXCEPTIONS_PIPELINE_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace prism {
namespace exceptions {

/**
 * @brief Exception thrown when a requested image or job is not found
 */
class NotFoundException : public std::runtime_error {
public:
    explicit NotFoundException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when a transform spec or its parameters are malformed
 *
 * Raised before anything is enqueued. Never retried.
 */
class ValidationException : public std::runtime_error {
public:
    explicit ValidationException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when the admission controller denies a request
 */
class ThrottledException : public std::runtime_error {
public:
    ThrottledException(const std::string& message, int retry_after_seconds)
        : std::runtime_error(message), retry_after_seconds_(retry_after_seconds) {}

    // Seconds the caller should wait before the next attempt can pass
    int retryAfterSeconds() const { return retry_after_seconds_; }

private:
    int retry_after_seconds_;
};

/**
 * @brief Exception thrown when a transform fails (corrupt source,
 * unsupported conversion, resource exhaustion)
 */
class ExecutionException : public std::runtime_error {
public:
    explicit ExecutionException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when a job exceeds its execution budget
 */
class TimeoutException : public std::runtime_error {
public:
    explicit TimeoutException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when the artifact cache backend cannot be reached
 */
class CacheUnavailableException : public std::runtime_error {
public:
    explicit CacheUnavailableException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown for requests without an authenticated identity
 */
class UnauthorizedException : public std::runtime_error {
public:
    explicit UnauthorizedException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when an authenticated user acts on an image they do not own
 */
class ForbiddenException : public std::runtime_error {
public:
    explicit ForbiddenException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace exceptions
} // namespace prism

#endif // PRISM_EXCEPTIONS_PIPELINE_EXCEPTIONS_H
