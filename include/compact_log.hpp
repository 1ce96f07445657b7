#pragma once

#include <unistd.h>
#include <array>
#include <atomic>
#include <charconv>
#include <concepts>
#include <cstdlib>
#include <mutex>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace reqlite::log {

enum class Level { Error = 0, Warn, Info, Debug, Trace };

inline std::string_view level_name(Level level) {
    switch (level) {
        case Level::Error: return "error";
        case Level::Warn: return "warn";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "?";
}

inline bool parse_level(std::string_view text, Level& out) {
    for (auto level : {Level::Error, Level::Warn, Level::Info, Level::Debug, Level::Trace}) {
        if (text == level_name(level)) {
            out = level;
            return true;
        }
    }
    return false;
}

// Fixed-size line assembled on the stack; overflow is truncated with "...".
class Line {
public:
    void append(std::string_view s) {
        size_t room = data_.size() - len_;
        if (s.size() > room) {
            s = s.substr(0, room);
            truncated_ = true;
        }
        s.copy(data_.data() + len_, s.size());
        len_ += s.size();
    }

    void append(const char* s) { append(std::string_view(s ? s : "(null)")); }
    void append(char c) { append(std::string_view(&c, 1)); }
    void append(bool b) { append(b ? std::string_view("true") : std::string_view("false")); }

    template<std::integral T>
    void append(T val) {
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), val);
        if (ec == std::errc()) append(std::string_view(buf, ptr - buf));
    }

    template<typename E>
        requires std::is_enum_v<E>
    void append(E val) {
        append(static_cast<std::underlying_type_t<E>>(val));
    }

    std::string_view finish() {
        if (truncated_ && len_ >= 4) {
            std::string_view("...\n").copy(data_.data() + len_ - 4, 4);
        } else if (len_ < data_.size()) {
            data_[len_++] = '\n';
        } else {
            data_[len_ - 1] = '\n';
        }
        return {data_.data(), len_};
    }

private:
    std::array<char, 512> data_{};
    size_t len_ = 0;
    bool truncated_ = false;
};

// Lightweight stderr writer; no iostreams, no allocation.
class Writer {
public:
    static void error(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        ::write(STDERR_FILENO, s.data(), s.size());
    }

    static Level threshold() {
        return state().load(std::memory_order_relaxed);
    }

    static void set_threshold(Level level) {
        state().store(level, std::memory_order_relaxed);
    }

private:
    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }

    // REQLITE_LOG is read once, on first use.
    static std::atomic<Level>& state() {
        static std::atomic<Level> level = [] {
            Level parsed = Level::Warn;
            if (const char* env = std::getenv("REQLITE_LOG")) parse_level(env, parsed);
            return parsed;
        }();
        return level;
    }
};

inline void set_level(Level level) { Writer::set_threshold(level); }
inline bool enabled(Level level) { return level <= Writer::threshold(); }

template<typename... Args>
void write(Level level, const Args&... args) {
    if (!enabled(level)) return;
    Line line;
    line.append("[reqlite ");
    line.append(level_name(level));
    line.append("] ");
    (line.append(args), ...);
    Writer::error(line.finish());
}

template<typename... Args> void error(const Args&... args) { write(Level::Error, args...); }
template<typename... Args> void warn(const Args&... args) { write(Level::Warn, args...); }
template<typename... Args> void info(const Args&... args) { write(Level::Info, args...); }
template<typename... Args> void debug(const Args&... args) { write(Level::Debug, args...); }
template<typename... Args> void trace(const Args&... args) { write(Level::Trace, args...); }

} // namespace reqlite::log
