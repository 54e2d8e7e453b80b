#include "codeowners/logging.hpp"

#include <ctime>
#include <iostream>
#include <mutex>

namespace codeowners {

namespace {

std::mutex log_mutex;

std::string timestamp_now() {
    char buf[64];
    std::time_t t = std::time(nullptr);
    std::tm tmv;
    localtime_r(&t, &tmv);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return std::string(buf);
}

void log_common(const char* level, const std::string& msg, std::ostream& os) {
    std::lock_guard<std::mutex> guard(log_mutex);
    os << "[" << timestamp_now() << "][" << level << "] " << msg << std::endl;
}

} // namespace

void log_info(const std::string& msg) {
    log_common("INFO", msg, std::cout);
}

void log_warn(const std::string& msg) {
    log_common("WARN", msg, std::cout);
}

void log_error(const std::string& msg) {
    log_common("ERROR", msg, std::cerr);
}

} // namespace codeowners
