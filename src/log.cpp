#include <fmt/core.h>
#include "sample_sweep/log.hpp"

namespace sample_sweep {

    Logger::Logger(std::ostream& out, bool debug_enabled)
        : out_(out), debug_enabled_(debug_enabled) {}

    void Logger::detail(const std::string& message) {
        emit("DETAIL", message);
    }

    void Logger::info(const std::string& message) {
        emit("INFO", message);
    }

    void Logger::warning(const std::string& message) {
        emit("WARNING", message);
    }

    void Logger::error(const std::string& message) {
        emit("ERROR", message);
    }

    void Logger::debug(const std::string& message) {
        if (debug_enabled_) {
            emit("DEBUG", message);
        }
    }

    void Logger::emit(const char* level, const std::string& message) {
        // NZBGet reads the log line by line; keep multi-line messages prefixed.
        std::string::size_type start = 0;
        while (true) {
            const auto end = message.find('\n', start);
            out_ << fmt::format("[{}] {}\n", level, message.substr(start, end - start));
            if (end == std::string::npos) {
                break;
            }
            start = end + 1;
        }
        out_.flush();
    }
}
