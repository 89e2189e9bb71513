#include "error_handling.h"
#include <mutex>
#include <deque>
#include <unordered_map>
#include <ctime>

namespace zackathon {

// Messages mirror the contract's revert reasons so clients can match on them.
const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_CONFIG: return "Invalid hackathon configuration";
        case ErrorCode::INVALID_INPUT: return "Invalid input";
        case ErrorCode::NOT_FOUND: return "Invalid hackathon";
        case ErrorCode::NOT_ORGANIZER: return "Only organizer";
        case ErrorCode::NOT_JUDGE: return "Only judge";
        case ErrorCode::JUDGE_CANNOT_PARTICIPATE: return "Judges cannot participate";
        case ErrorCode::NOT_AUTHORIZED: return "Not authorized";
        case ErrorCode::ALREADY_REGISTERED: return "Already registered";
        case ErrorCode::CAPACITY_REACHED: return "Max participants reached";
        case ErrorCode::NOT_REGISTERED: return "Not registered";
        case ErrorCode::ALREADY_SUBMITTED: return "Already submitted";
        case ErrorCode::DEADLINE_PASSED: return "Submission deadline passed";
        case ErrorCode::TOO_EARLY: return "Too early";
        case ErrorCode::OUT_OF_WINDOW: return "Judging deadline passed";
        case ErrorCode::INVALID_PROOF: return "Invalid input proof";
        case ErrorCode::ACCESS_NOT_GRANTED: return "Access not granted";
        case ErrorCode::ACCESS_ALREADY_GRANTED: return "Access already granted";
        case ErrorCode::NO_SUBMISSIONS: return "No submissions";
        case ErrorCode::INVALID_SUBMISSION: return "Invalid submission";
        case ErrorCode::ALREADY_SCORED: return "Already scored";
        case ErrorCode::INVALID_PHASE: return "Invalid phase";
        case ErrorCode::INCOMPLETE_SCORING: return "Not all judges scored";
        case ErrorCode::SCORE_COUNT_MISMATCH: return "Score count mismatch";
        case ErrorCode::INVALID_DECRYPTION_PROOF: return "Invalid decryption proof";
        case ErrorCode::ALREADY_FINALIZED: return "Winners already announced";
        case ErrorCode::ENCRYPTION_SERVICE_ERROR: return "Encryption service error";
        case ErrorCode::PERSISTENCE_ERROR: return "Persistence error";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_CONFIG: return "InvalidConfig";
        case ErrorCode::INVALID_INPUT: return "InvalidInput";
        case ErrorCode::NOT_FOUND: return "NotFound";
        case ErrorCode::NOT_ORGANIZER: return "NotOrganizer";
        case ErrorCode::NOT_JUDGE: return "NotJudge";
        case ErrorCode::JUDGE_CANNOT_PARTICIPATE: return "JudgeCannotParticipate";
        case ErrorCode::NOT_AUTHORIZED: return "NotAuthorized";
        case ErrorCode::ALREADY_REGISTERED: return "AlreadyRegistered";
        case ErrorCode::CAPACITY_REACHED: return "CapacityReached";
        case ErrorCode::NOT_REGISTERED: return "NotRegistered";
        case ErrorCode::ALREADY_SUBMITTED: return "AlreadySubmitted";
        case ErrorCode::DEADLINE_PASSED: return "DeadlinePassed";
        case ErrorCode::TOO_EARLY: return "TooEarly";
        case ErrorCode::OUT_OF_WINDOW: return "OutOfWindow";
        case ErrorCode::INVALID_PROOF: return "InvalidProof";
        case ErrorCode::ACCESS_NOT_GRANTED: return "AccessNotGranted";
        case ErrorCode::ACCESS_ALREADY_GRANTED: return "AccessAlreadyGranted";
        case ErrorCode::NO_SUBMISSIONS: return "NoSubmissions";
        case ErrorCode::INVALID_SUBMISSION: return "InvalidSubmission";
        case ErrorCode::ALREADY_SCORED: return "AlreadyScored";
        case ErrorCode::INVALID_PHASE: return "InvalidPhase";
        case ErrorCode::INCOMPLETE_SCORING: return "IncompleteScoring";
        case ErrorCode::SCORE_COUNT_MISMATCH: return "ScoreCountMismatch";
        case ErrorCode::INVALID_DECRYPTION_PROOF: return "InvalidDecryptionProof";
        case ErrorCode::ALREADY_FINALIZED: return "AlreadyFinalized";
        case ErrorCode::ENCRYPTION_SERVICE_ERROR: return "EncryptionServiceError";
        case ErrorCode::PERSISTENCE_ERROR: return "PersistenceError";
        case ErrorCode::INTERNAL_ERROR: return "InternalError";
        default: return "Unknown";
    }
}

const char* categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "none";
        case ErrorCategory::VALIDATION: return "validation";
        case ErrorCategory::AUTHORIZATION: return "authorization";
        case ErrorCategory::TIMING: return "timing";
        case ErrorCategory::STATE: return "state";
        case ErrorCategory::EXTERNAL_PROOF: return "external-proof";
        case ErrorCategory::INTERNAL: return "internal";
        default: return "unknown";
    }
}

ErrorCategory errorCategory(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorCategory::NONE;
        case ErrorCode::INVALID_CONFIG:
        case ErrorCode::INVALID_INPUT:
        case ErrorCode::NOT_FOUND:
        case ErrorCode::INVALID_SUBMISSION:
        case ErrorCode::SCORE_COUNT_MISMATCH:
            return ErrorCategory::VALIDATION;
        case ErrorCode::NOT_ORGANIZER:
        case ErrorCode::NOT_JUDGE:
        case ErrorCode::JUDGE_CANNOT_PARTICIPATE:
        case ErrorCode::NOT_AUTHORIZED:
            return ErrorCategory::AUTHORIZATION;
        case ErrorCode::DEADLINE_PASSED:
        case ErrorCode::TOO_EARLY:
        case ErrorCode::OUT_OF_WINDOW:
            return ErrorCategory::TIMING;
        case ErrorCode::ALREADY_REGISTERED:
        case ErrorCode::CAPACITY_REACHED:
        case ErrorCode::NOT_REGISTERED:
        case ErrorCode::ALREADY_SUBMITTED:
        case ErrorCode::ACCESS_NOT_GRANTED:
        case ErrorCode::ACCESS_ALREADY_GRANTED:
        case ErrorCode::NO_SUBMISSIONS:
        case ErrorCode::ALREADY_SCORED:
        case ErrorCode::INVALID_PHASE:
        case ErrorCode::INCOMPLETE_SCORING:
        case ErrorCode::ALREADY_FINALIZED:
            return ErrorCategory::STATE;
        case ErrorCode::INVALID_PROOF:
        case ErrorCode::INVALID_DECRYPTION_PROOF:
            return ErrorCategory::EXTERNAL_PROOF;
        default:
            return ErrorCategory::INTERNAL;
    }
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = errorCategory(code) == ErrorCategory::INTERNAL ? ErrorSeverity::CRITICAL : ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

Error makeError(ErrorCode code) {
    return makeError(code, errorToString(code));
}

struct ErrorHandler::Impl {
    std::function<void(const Error&)> handler;
    std::deque<Error> recentErrors;
    std::unordered_map<int, uint64_t> errorCounts;
    std::unordered_map<int, uint64_t> categoryCounts;
    uint64_t totalErrors = 0;
    mutable std::mutex mtx;
    static constexpr size_t MAX_RECENT_ERRORS = 100;
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::setHandler(std::function<void(const Error&)> handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->handler = std::move(handler);
}

void ErrorHandler::handle(const Error& error) {
    std::function<void(const Error&)> handler;
    Error err = error;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        if (err.timestamp == 0) err.timestamp = static_cast<uint64_t>(std::time(nullptr));

        impl_->recentErrors.push_back(err);
        if (impl_->recentErrors.size() > Impl::MAX_RECENT_ERRORS) {
            impl_->recentErrors.pop_front();
        }
        impl_->totalErrors++;
        impl_->errorCounts[static_cast<int>(err.code)]++;
        impl_->categoryCounts[static_cast<int>(errorCategory(err.code))]++;
        handler = impl_->handler;
    }
    if (handler) handler(err);
}

void ErrorHandler::handle(ErrorCode code, const std::string& message) {
    handle(makeError(code, message));
}

std::vector<Error> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<Error> result;
    size_t start = impl_->recentErrors.size() > count ?
                   impl_->recentErrors.size() - count : 0;
    for (size_t i = impl_->recentErrors.size(); i > start; i--) {
        result.push_back(impl_->recentErrors[i - 1]);
    }
    return result;
}

void ErrorHandler::clearErrors() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->recentErrors.clear();
    impl_->errorCounts.clear();
    impl_->categoryCounts.clear();
    impl_->totalErrors = 0;
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->totalErrors;
}

uint64_t ErrorHandler::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->errorCounts.find(static_cast<int>(code));
    return it != impl_->errorCounts.end() ? it->second : 0;
}

uint64_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->categoryCounts.find(static_cast<int>(category));
    return it != impl_->categoryCounts.end() ? it->second : 0;
}

Error ErrorHandler::getLastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->recentErrors.empty()) return Error{};
    return impl_->recentErrors.back();
}

}
