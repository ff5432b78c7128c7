#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace portico {
namespace http {

// The client went away while the request was in flight.
class AbortError : public std::runtime_error {
public:
    AbortError() : std::runtime_error("request aborted by client") {}
};

// A body stream was consumed twice, concurrently, or after it was exhausted.
class StreamUsageError : public std::logic_error {
public:
    explicit StreamUsageError(const std::string& what) : std::logic_error(what) {}
};

// Native request metadata that cannot form a canonical request.
class TranslationError : public std::runtime_error {
public:
    explicit TranslationError(const std::string& what) : std::runtime_error(what) {}
};

// Message of a captured exception, for logging.
inline std::string DescribeError(const std::exception_ptr& error) {
    if (!error) return "no error";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace http
} // namespace portico
