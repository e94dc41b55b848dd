#include "asyncq/log/log.hpp"
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>

namespace asyncq::log {

namespace {

Level InitialLevel() {
    const char *env = std::getenv("ASYNCQ_LOG_LEVEL");
    if (env != nullptr) {
        if (auto parsed = ParseLevel(env)) {
            return parsed.value();
        }
    }
    return Level::Warn;
}

std::atomic<Level> &CurrentLevel() {
    static std::atomic<Level> level{InitialLevel()};
    return level;
}

struct SinkState {
    std::mutex mutex;  // Сериализует запись в sink
    Sink sink;
};

SinkState &GetSinkState() {
    static SinkState state;
    return state;
}

}  // namespace

void SetLevel(Level level) { CurrentLevel().store(level, std::memory_order_relaxed); }

Level GetLevel() { return CurrentLevel().load(std::memory_order_relaxed); }

bool Enabled(Level level) { return level != Level::Off && level >= GetLevel(); }

void SetSink(Sink sink) {
    auto &state = GetSinkState();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.sink = std::move(sink);
}

std::string_view ToString(Level level) {
    switch (level) {
        case Level::Trace:
            return "trace";
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warn:
            return "warn";
        case Level::Error:
            return "error";
        case Level::Off:
            return "off";
    }
    return "unknown";
}

std::optional<Level> ParseLevel(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    for (Level level : {Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error, Level::Off}) {
        if (lowered == ToString(level)) {
            return level;
        }
    }
    if (lowered == "warning") {
        return Level::Warn;
    }
    return std::nullopt;
}

void Emit(Level level, std::string_view message) {
    auto &state = GetSinkState();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.sink) {
        state.sink(level, message);
        return;
    }
    fmt::print(stderr, "[asyncq] [{}] {}\n", ToString(level), message);
}

}  // namespace asyncq::log
