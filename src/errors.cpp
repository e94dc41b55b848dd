#include "asyncq/errors.hpp"
#include <fmt/format.h>

namespace asyncq {

namespace {

std::string_view Describe(ErrorCode code) {
    switch (code) {
        case ErrorCode::Closed:
            return "queue is closed";
        case ErrorCode::EmptyQueue:
            return "queue is empty";
        case ErrorCode::Cancelled:
            return "queue was cleared";
        case ErrorCode::TimedOut:
            return "operation timed out";
    }
    return "unknown queue error";
}

}  // namespace

std::string_view ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Closed:
            return "Closed";
        case ErrorCode::EmptyQueue:
            return "EmptyQueue";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::TimedOut:
            return "TimedOut";
    }
    return "Unknown";
}

QueueError::QueueError(ErrorCode code, const std::string &operation)
    : std::runtime_error(fmt::format("{}: {}", operation, Describe(code))), code_(code) {}

QueueClosedError::QueueClosedError(const std::string &operation) : QueueError(ErrorCode::Closed, operation) {}

EmptyQueueError::EmptyQueueError(const std::string &operation) : QueueError(ErrorCode::EmptyQueue, operation) {}

QueueCancelledError::QueueCancelledError(const std::string &operation) : QueueError(ErrorCode::Cancelled, operation) {}

QueueTimeoutError::QueueTimeoutError(const std::string &operation) : QueueError(ErrorCode::TimedOut, operation) {}

}  // namespace asyncq
