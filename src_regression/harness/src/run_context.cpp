#include "calregress/run_context.hpp"

namespace calregress {

ConsoleLog::ConsoleLog(std::ostream& out, std::ostream& err) : out_{out}, err_{err} {}

void ConsoleLog::info(const std::string& message) {
    if (quiet_.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << message << '\n' << std::flush;
}

void ConsoleLog::warn(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    err_ << "WARNING: " << message << '\n' << std::flush;
}

void ConsoleLog::error(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    err_ << "ERROR: " << message << '\n' << std::flush;
}

RunContext::RunContext(std::ostream& out, std::ostream& err) : log_{out, err} {}

}  // namespace calregress
