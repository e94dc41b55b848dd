#pragma once

#include <fmt/format.h>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

namespace asyncq::log {

enum class Level { Trace, Debug, Info, Warn, Error, Off };

using Sink = std::function<void(Level, std::string_view)>;

// Начальный уровень берётся из ASYNCQ_LOG_LEVEL, по умолчанию Warn
void SetLevel(Level level);
Level GetLevel();
bool Enabled(Level level);

// Пустой sink возвращает вывод в stderr
void SetSink(Sink sink);

std::string_view ToString(Level level);
std::optional<Level> ParseLevel(std::string_view text);

void Emit(Level level, std::string_view message);

template <typename... Args>
void Write(Level level, fmt::format_string<Args...> format, Args &&...args) {
    if (!Enabled(level)) {
        return;
    }
    Emit(level, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace asyncq::log
