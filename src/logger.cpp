#include "logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

Logger::Logger(const std::string& filename, bool console) : console_output(console) {
    if (!filename.empty()) {
        log_file.open(filename, std::ios::app);
    }
}

Logger::~Logger() {
    if (log_file.is_open()) {
        log_file.close();
    }
}

const char* Logger::level_name(Level level) {
    switch (level) {
    case Level::Warning: return "WARNING";
    case Level::Error: return "ERROR";
    default: return "INFO";
    }
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);

    // Get current time
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::stringstream timestamp;
    timestamp << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S");

    std::string formatted_message = timestamp.str() + " - " + level_name(level) + " - " + message;

    if (log_file.is_open()) {
        log_file << formatted_message << std::endl;
    }

    if (console_output) {
        // Warnings and errors go to stderr so they survive a redirected stdout
        std::ostream& out = (level == Level::Info) ? std::cout : std::cerr;
        out << formatted_message << std::endl;
    }
}
