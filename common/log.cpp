#include "log.hpp"
#include <iostream>
#include <mutex>

namespace {
    std::mutex logMutex;
    std::ostream* logStream = &std::cerr;

    void writeLine(const std::string& tag, const char* level, const std::string& message) {
        std::lock_guard<std::mutex> lock(logMutex);
        *logStream << "[" << tag << "] " << level << message << "\n";
    }
}

namespace Log {

void info(const std::string& tag, const std::string& message) {
    writeLine(tag, "", message);
}

void warn(const std::string& tag, const std::string& message) {
    writeLine(tag, "warn: ", message);
}

void error(const std::string& tag, const std::string& message) {
    writeLine(tag, "error: ", message);
}

void setStream(std::ostream& out) {
    std::lock_guard<std::mutex> lock(logMutex);
    logStream = &out;
}

void resetStream() {
    std::lock_guard<std::mutex> lock(logMutex);
    logStream = &std::cerr;
}

}
