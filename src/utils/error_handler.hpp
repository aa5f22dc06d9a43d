#pragma once

#include <cstdint>
#include <string>
#include <stdexcept>
#include <iostream>
#include <ios>

namespace ErrorHandler {

// Global flag to control error behavior
inline bool log_errors_instead_of_throw = false;

// Number of errors logged while in log mode
inline uint64_t logged_error_count = 0;

// Set the error handling mode
inline void SetLogErrorsMode(bool should_log) {
    log_errors_instead_of_throw = should_log;
}

// Get the current error handling mode
inline bool IsLogErrorsMode() {
    return log_errors_instead_of_throw;
}

inline uint64_t LoggedErrorCount() {
    return logged_error_count;
}

inline void ResetLoggedErrorCount() {
    logged_error_count = 0;
}

// Print an error without throwing; does not count towards LoggedErrorCount
inline void LogError(const std::string &message) {
    std::cerr << "[ERROR] " << message << std::endl;
}

inline void LogWarning(const std::string &message) {
    std::cerr << "[WARNING] " << message << std::endl;
}

template <typename Exception>
inline void LogOrThrow(const std::string &message) {
    if (log_errors_instead_of_throw) {
        logged_error_count++;
        LogError(message);
    } else {
        throw Exception(message);
    }
}

// Handle a runtime error - either log it or throw it
inline void HandleRuntimeError(const std::string &message) {
    LogOrThrow<std::runtime_error>(message);
}

// Handle a logic error (API misuse) - either log it or throw it
inline void HandleLogicError(const std::string &message) {
    LogOrThrow<std::logic_error>(message);
}

// Handle an invalid argument error - either log it or throw it
inline void HandleInvalidArgumentError(const std::string &message) {
    LogOrThrow<std::invalid_argument>(message);
}

// Handle an out of range error - either log it or throw it
inline void HandleOutOfRangeError(const std::string &message) {
    LogOrThrow<std::out_of_range>(message);
}

// Handle a failed read or write on a file - either log it or throw it
inline void HandleIOError(const std::string &message) {
    LogOrThrow<std::ios_base::failure>(message);
}

} // namespace ErrorHandler
