#pragma once

#include <stdexcept>
#include <string>

// Process exit codes
inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_VERIFY_FAILED = 1;
inline constexpr int EXIT_USAGE = 2;

class DotstrapException : public std::runtime_error {
public:
    explicit DotstrapException(const std::string& message)
        : std::runtime_error(message) {}
};

// Bad invocation: unknown keys, missing arguments, failed link batches.
class UsageError : public DotstrapException {
public:
    explicit UsageError(const std::string& message)
        : DotstrapException(message) {}
};
