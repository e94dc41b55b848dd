#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace asyncq {

enum class ErrorCode {
    Closed,      // Очередь закрыта
    EmptyQueue,  // peek() на пустой очереди
    Cancelled,   // Ожидание прервано clear()
    TimedOut     // Истёк таймаут ожидания
};

std::string_view ToString(ErrorCode code);

class QueueError : public std::runtime_error {
private:
    ErrorCode code_;

public:
    QueueError(ErrorCode code, const std::string &operation);

    ErrorCode code() const noexcept { return code_; }
};

class QueueClosedError : public QueueError {
public:
    explicit QueueClosedError(const std::string &operation);
};

class EmptyQueueError : public QueueError {
public:
    explicit EmptyQueueError(const std::string &operation);
};

class QueueCancelledError : public QueueError {
public:
    explicit QueueCancelledError(const std::string &operation);
};

class QueueTimeoutError : public QueueError {
public:
    explicit QueueTimeoutError(const std::string &operation);
};

}  // namespace asyncq
