#pragma once

#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <utility>
#include <cstdint>

namespace zackathon {

enum class ErrorCode {
    OK = 0,
    INVALID_CONFIG,
    INVALID_INPUT,
    NOT_FOUND,
    NOT_ORGANIZER,
    NOT_JUDGE,
    JUDGE_CANNOT_PARTICIPATE,
    NOT_AUTHORIZED,
    ALREADY_REGISTERED,
    CAPACITY_REACHED,
    NOT_REGISTERED,
    ALREADY_SUBMITTED,
    DEADLINE_PASSED,
    TOO_EARLY,
    OUT_OF_WINDOW,
    INVALID_PROOF,
    ACCESS_NOT_GRANTED,
    ACCESS_ALREADY_GRANTED,
    NO_SUBMISSIONS,
    INVALID_SUBMISSION,
    ALREADY_SCORED,
    INVALID_PHASE,
    INCOMPLETE_SCORING,
    SCORE_COUNT_MISMATCH,
    INVALID_DECRYPTION_PROOF,
    ALREADY_FINALIZED,
    ENCRYPTION_SERVICE_ERROR,
    PERSISTENCE_ERROR,
    INTERNAL_ERROR
};

// How a caller can recover from a rejected operation.
enum class ErrorCategory {
    NONE,
    VALIDATION,
    AUTHORIZATION,
    TIMING,
    STATE,
    EXTERNAL_PROOF,
    INTERNAL
};

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct Error {
    ErrorCode code;
    ErrorSeverity severity;
    std::string message;
    std::string context;
    uint64_t timestamp;

    Error() : code(ErrorCode::OK), severity(ErrorSeverity::INFO), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg) : code(c), severity(ErrorSeverity::ERROR), message(msg), timestamp(0) {}
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    Error error_;
    bool hasValue_;
};

class ErrorHandler {
public:
    static ErrorHandler& instance();

    void setHandler(std::function<void(const Error&)> handler);
    void handle(const Error& error);
    void handle(ErrorCode code, const std::string& message);

    std::vector<Error> getRecentErrors(size_t count = 10) const;
    void clearErrors();

    uint64_t getErrorCount() const;
    uint64_t getErrorCount(ErrorCode code) const;
    uint64_t getErrorCount(ErrorCategory category) const;
    Error getLastError() const;

private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* errorToString(ErrorCode code);
const char* errorCodeName(ErrorCode code);
const char* categoryToString(ErrorCategory category);
ErrorCategory errorCategory(ErrorCode code);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);
// Error carrying the stable message for the code.
Error makeError(ErrorCode code);

#define ZACKATHON_FAIL(code) return zackathon::makeError(code)

}
