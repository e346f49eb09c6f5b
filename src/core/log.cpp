#include "core/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace {

std::atomic<bool> verbose_{false};
std::mutex out_mutex_;

void write(std::ostream& os, const std::string& component, const char* level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    os << "[" << component << "] [" << level << "] " << msg << std::endl;
}

}

void setLogVerbose(bool verbose) { verbose_.store(verbose); }

void logDebug(const std::string& component, const std::string& msg) {
    if (!verbose_.load()) return;
    write(std::cout, component, "DEBUG", msg);
}

void logInfo(const std::string& component, const std::string& msg) {
    write(std::cout, component, "INFO", msg);
}

void logWarn(const std::string& component, const std::string& msg) {
    write(std::cerr, component, "WARN", msg);
}

void logError(const std::string& component, const std::string& msg) {
    write(std::cerr, component, "ERROR", msg);
}
