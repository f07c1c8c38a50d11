#pragma once

#include <fstream>
#include <mutex>
#include <string>

// Thread-safe logging class
class Logger {
public:
    enum class Level {
        Info,
        Warning,
        Error
    };

    // An empty filename disables the log file
    Logger(const std::string& filename, bool console = true);
    ~Logger();

    void log(Level level, const std::string& message);

    void info(const std::string& message) { log(Level::Info, message); }
    void warning(const std::string& message) { log(Level::Warning, message); }
    void error(const std::string& message) { log(Level::Error, message); }

    void set_console_output(bool value) { console_output = value; }

private:
    std::mutex log_mutex;
    std::ofstream log_file;
    bool console_output;

    static const char* level_name(Level level);
};
