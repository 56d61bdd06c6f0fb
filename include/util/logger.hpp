#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace wdi {

/**
 * @brief Thread-safe console logger shared by the reader, the workers and the flusher.
 *
 * Debug messages are only emitted when verbose output is enabled.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void log(Level level, const std::string& message) {
        if (level == Level::Debug && !verbose_flag().load()) {
            return;
        }

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* prefix = "";
        switch (level) {
            case Level::Debug:   prefix = "[debug] "; break;
            case Level::Info:    prefix = "=== ";     break;
            case Level::Step:    prefix = ">>> ";     break;
            case Level::Success: prefix = "[ok] ";    break;
            case Level::Warning: prefix = "[warn] ";  break;
            case Level::Error:   prefix = "[error] "; break;
        }

        std::ostream& out = (level == Level::Warning || level == Level::Error) ? std::cerr : std::cout;
        out << prefix << message << std::endl;
    }

    static void set_verbose(bool verbose) { verbose_flag().store(verbose); }
    static bool verbose() { return verbose_flag().load(); }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<bool>& verbose_flag() {
        static std::atomic<bool> flag{false};
        return flag;
    }
};

} // namespace wdi
