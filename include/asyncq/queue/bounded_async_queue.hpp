#pragma once

#include "asyncq/errors.hpp"
#include "asyncq/log/log.hpp"
#include "asyncq/types.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <future>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace asyncq::queue {

// FIFO-очередь между потоками-производителями и потребителями.
//
// add() блокируется, пока очередь заполнена, take() - пока пуста. Ожидающие
// производители и потребители обслуживаются строго в порядке FIFO. clear()
// отменяет все ожидания, close() дополнительно запрещает дальнейшие операции.
// Хуки on_add/on_remove вызываются под мьютексом очереди и не должны
// обращаться к ней самой.
//
// Деструктор вызывает close(), но не ждёт ожидающие потоки: все потоки,
// вызывающие add/take/wait, должны быть завершены до разрушения очереди.
template <typename T>
class BoundedAsyncQueue {
public:
    using Hook = typename QueueOptions<T>::Hook;

private:
    enum class HandleState { Pending, Fulfilled, Cancelled, Closed };

    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    // Потребитель, ожидающий элемент
    struct ConsumerHandle {
        std::condition_variable cv;
        HandleState state = HandleState::Pending;
        std::optional<T> item;
    };

    // Производитель, ожидающий свободное место
    struct ProducerHandle {
        std::condition_variable cv;
        HandleState state = HandleState::Pending;
    };

    mutable std::mutex mutex_;  // Защита всего состояния ниже
    std::deque<T> items_;
    std::deque<std::shared_ptr<ConsumerHandle>> consumers_;
    std::deque<std::shared_ptr<ProducerHandle>> producers_;
    std::optional<std::promise<void>> drain_promise_;
    std::shared_future<void> drain_future_;
    std::size_t reserved_ = 0;  // Места, выданные производителям, которые ещё не вставили элемент
    bool closed_ = false;

    const std::optional<int> capacity_;
    const std::string name_;
    Hook on_add_;
    Hook on_remove_;

    bool HasRoom() const {
        return !capacity_.has_value() || items_.size() + reserved_ < static_cast<std::size_t>(capacity_.value());
    }

    void ThrowIfClosed(const char *operation) const {
        if (closed_) {
            throw QueueClosedError(operation);
        }
    }

    static void ThrowIfFailed(HandleState state, const char *operation) {
        if (state == HandleState::Cancelled) {
            throw QueueCancelledError(operation);
        }
        if (state == HandleState::Closed) {
            throw QueueClosedError(operation);
        }
    }

    template <typename Rep, typename Period>
    static Deadline DeadlineAfter(const std::chrono::duration<Rep, Period> &timeout) {
        return std::chrono::steady_clock::now() +
               std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout);
    }

    // Возвращает false, если дедлайн наступил раньше, чем handle был разрешён
    template <typename Handle>
    static bool Await(std::unique_lock<std::mutex> &lock, Handle &handle, const Deadline &deadline) {
        auto settled = [&handle] { return handle.state != HandleState::Pending; };
        if (!deadline.has_value()) {
            handle.cv.wait(lock, settled);
            return true;
        }
        return handle.cv.wait_until(lock, deadline.value(), settled);
    }

    template <typename Handle>
    static void Unregister(std::deque<std::shared_ptr<Handle>> &registry, const std::shared_ptr<Handle> &handle) {
        auto it = std::find(registry.begin(), registry.end(), handle);
        if (it != registry.end()) {
            registry.erase(it);
        }
    }

    void InvokeHook(const Hook &hook, const T &item, const char *hook_name) const {
        if (!hook) {
            return;
        }
        try {
            hook(item);
        } catch (const std::exception &ex) {
            log::Write(log::Level::Error, "[{}] {} hook threw: {}", name_, hook_name, ex.what());
        }
    }

    // Хуки вызываются после того, как состояние очереди согласовано,
    // поэтому исключение из хука не теряет элемент и не оставляет висящих ожиданий
    void Enqueue(T item) {
        items_.push_back(std::move(item));
        auto consumer = HandOff();
        if (consumer) {
            // Потребитель не проснётся, пока мьютекс занят, элемент ещё на месте
            InvokeHook(on_add_, *consumer->item, "on_add");
            InvokeHook(on_remove_, *consumer->item, "on_remove");
        } else {
            InvokeHook(on_add_, items_.back(), "on_add");
        }
    }

    // Передаём элемент напрямую ожидающему потребителю.
    // Потребители ждут только на пустой очереди, поэтому передача не больше одной.
    std::shared_ptr<ConsumerHandle> HandOff() {
        if (consumers_.empty() || items_.empty()) {
            return nullptr;
        }
        auto consumer = std::move(consumers_.front());
        consumers_.pop_front();

        consumer->item.emplace(std::move(items_.front()));
        items_.pop_front();
        consumer->state = HandleState::Fulfilled;
        consumer->cv.notify_one();

        ReleaseProducers();
        CheckDrained();
        return consumer;
    }

    // Одно освободившееся место - один производитель, в порядке очереди
    void ReleaseProducers() {
        while (!producers_.empty() && HasRoom()) {
            auto producer = std::move(producers_.front());
            producers_.pop_front();
            ++reserved_;  // Место закреплено за этим производителем
            producer->state = HandleState::Fulfilled;
            producer->cv.notify_one();
        }
    }

    T Dequeue() {
        T item = std::move(items_.front());
        items_.pop_front();
        ReleaseProducers();
        CheckDrained();
        InvokeHook(on_remove_, item, "on_remove");
        return item;
    }

    void CheckDrained() {
        if (!items_.empty() || !drain_promise_.has_value()) {
            return;
        }
        drain_promise_->set_value();
        drain_promise_.reset();
        drain_future_ = {};
    }

    void LogCreated() const {
        if (capacity_.has_value()) {
            log::Write(log::Level::Debug, "[{}] created, capacity {}", name_, capacity_.value());
        } else {
            log::Write(log::Level::Debug, "[{}] created, unbounded", name_);
        }
    }

    // Завершает все ожидающие операции с ошибкой
    void FailPending(HandleState state) {
        log::Write(log::Level::Debug, "[{}] failing {} consumer(s), {} producer(s), drain waiter: {}", name_,
                   consumers_.size(), producers_.size(), drain_promise_.has_value());

        for (auto &consumer : consumers_) {
            consumer->state = state;
            consumer->cv.notify_one();
        }
        consumers_.clear();

        for (auto &producer : producers_) {
            producer->state = state;
            producer->cv.notify_one();
        }
        producers_.clear();

        if (drain_promise_.has_value()) {
            if (state == HandleState::Closed) {
                drain_promise_->set_exception(std::make_exception_ptr(QueueClosedError("wait")));
            } else {
                drain_promise_->set_exception(std::make_exception_ptr(QueueCancelledError("wait")));
            }
            drain_promise_.reset();
            drain_future_ = {};
        }
    }

    void AddUntil(T item, const Deadline &deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        ThrowIfClosed("add");

        if (!HasRoom()) {
            auto handle = std::make_shared<ProducerHandle>();
            producers_.push_back(handle);

            if (!Await(lock, *handle, deadline)) {
                Unregister(producers_, handle);
                log::Write(log::Level::Debug, "[{}] add timed out", name_);
                throw QueueTimeoutError("add");
            }
            ThrowIfFailed(handle->state, "add");

            --reserved_;
            // Место получено, но очередь успели закрыть
            if (closed_) {
                throw QueueClosedError("add");
            }
        }

        Enqueue(std::move(item));
    }

    T TakeUntil(const Deadline &deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        ThrowIfClosed("take");

        if (!items_.empty()) {
            return Dequeue();
        }

        auto handle = std::make_shared<ConsumerHandle>();
        consumers_.push_back(handle);

        if (!Await(lock, *handle, deadline)) {
            Unregister(consumers_, handle);
            log::Write(log::Level::Debug, "[{}] take timed out", name_);
            throw QueueTimeoutError("take");
        }
        ThrowIfFailed(handle->state, "take");

        return std::move(handle->item.value());
    }

public:
    explicit BoundedAsyncQueue(std::optional<int> capacity = std::nullopt)
        : capacity_(ValidateCapacity(capacity)), name_("queue") {
        LogCreated();
    }

    explicit BoundedAsyncQueue(QueueOptions<T> options)
        : capacity_(ValidateCapacity(options.capacity)), name_(std::move(options.name)),
          on_add_(std::move(options.on_add)), on_remove_(std::move(options.on_remove)) {
        LogCreated();
    }

    BoundedAsyncQueue(const BoundedAsyncQueue &) = delete;
    BoundedAsyncQueue &operator=(const BoundedAsyncQueue &) = delete;

    // Блокируется, пока в очереди нет места. Бросает QueueClosedError,
    // QueueCancelledError или QueueTimeoutError; при ошибке элемент не вставлен.
    void add(T item) { AddUntil(std::move(item), std::nullopt); }

    template <typename Rep, typename Period>
    void add(T item, const std::chrono::duration<Rep, Period> &timeout) {
        AddUntil(std::move(item), DeadlineAfter(timeout));
    }

    // Не транзакционно: при ошибке уже добавленные элементы остаются в очереди.
    // Элементы rvalue-диапазона перемещаются, lvalue-диапазона копируются.
    template <typename Range>
    void add_all(Range &&items) {
        for (auto &&item : items) {
            if constexpr (std::is_rvalue_reference_v<Range &&>) {
                add(std::move(item));
            } else {
                add(item);
            }
        }
    }

    void add_all(std::initializer_list<T> items) {
        for (const auto &item : items) {
            add(item);
        }
    }

    // Не блокируется: false, если места нет
    bool try_add(T &&item) {
        std::lock_guard<std::mutex> lock(mutex_);
        ThrowIfClosed("try_add");
        if (!HasRoom()) {
            return false;
        }
        Enqueue(std::move(item));
        return true;
    }

    bool try_add(const T &item) { return try_add(T(item)); }

    // Блокируется, пока очередь пуста
    T take() { return TakeUntil(std::nullopt); }

    template <typename Rep, typename Period>
    T take(const std::chrono::duration<Rep, Period> &timeout) {
        return TakeUntil(DeadlineAfter(timeout));
    }

    std::optional<T> try_take() {
        std::lock_guard<std::mutex> lock(mutex_);
        ThrowIfClosed("try_take");
        if (items_.empty()) {
            return std::nullopt;
        }
        return Dequeue();
    }

    T peek() const {
        std::lock_guard<std::mutex> lock(mutex_);
        ThrowIfClosed("peek");
        if (items_.empty()) {
            throw EmptyQueueError("peek");
        }
        return items_.front();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        log::Write(log::Level::Debug, "[{}] clear, dropping {} item(s)", name_, items_.size());
        items_.clear();
        FailPending(HandleState::Cancelled);
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        log::Write(log::Level::Debug, "[{}] close, {} item(s) left", name_, items_.size());
        FailPending(HandleState::Closed);
    }

    // Future, который завершится, когда очередь опустеет.
    // Все одновременные вызовы получают один и тот же future.
    std::shared_future<void> drained() {
        std::lock_guard<std::mutex> lock(mutex_);
        ThrowIfClosed("wait");

        if (items_.empty()) {
            std::promise<void> ready;
            ready.set_value();
            return ready.get_future().share();
        }

        if (!drain_promise_.has_value()) {
            drain_promise_.emplace();
            drain_future_ = drain_promise_->get_future().share();
        }
        return drain_future_;
    }

    void wait() { drained().get(); }

    void set_on_add(Hook hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_add_ = std::move(hook);
    }

    void set_on_remove(Hook hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_remove_ = std::move(hook);
    }

    std::optional<int> capacity() const { return capacity_; }

    const std::string &name() const { return name_; }

    std::size_t length() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool is_full() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return capacity_.has_value() && items_.size() >= static_cast<std::size_t>(capacity_.value());
    }

    bool is_empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    // Освобождает всех ожидающих; потоки пользователя должны быть завершены до разрушения
    ~BoundedAsyncQueue() { close(); }
};

}  // namespace asyncq::queue
