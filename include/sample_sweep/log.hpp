#pragma once
#include <string>
#include <ostream>

namespace sample_sweep {
    // Writes NZBGet post-processing log lines: "[LEVEL] message", one per line.
    class Logger {
    public:
        explicit Logger(std::ostream& out, bool debug_enabled = false);

        void detail(const std::string& message);
        void info(const std::string& message);
        void warning(const std::string& message);
        void error(const std::string& message);
        void debug(const std::string& message);

        bool debug_enabled() const { return debug_enabled_; }
        void set_debug_enabled(bool enabled) { debug_enabled_ = enabled; }

    private:
        void emit(const char* level, const std::string& message);

        std::ostream& out_;
        bool debug_enabled_;
    };
}
