#pragma once

#include <functional>
#include <optional>
#include <string>

namespace asyncq::queue {

// Параметры создания BoundedAsyncQueue
template <typename T>
struct QueueOptions {
    using Hook = std::function<void(const T &)>;

    std::optional<int> capacity;  // nullopt - очередь без ограничения
    Hook on_add;                  // Вызывается после вставки элемента
    Hook on_remove;               // Вызывается после извлечения элемента
    std::string name = "queue";   // Имя для логов
};

// Бросает std::invalid_argument, если ёмкость задана и не положительна
std::optional<int> ValidateCapacity(std::optional<int> capacity);

}  // namespace asyncq::queue
