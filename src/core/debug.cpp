#include "core2d/core/debug.hpp"

namespace Diagnostics {

const char *levelName(Level level) {
    switch (level) {
        case Level::Debug:   return "Debug";
        case Level::Warning: return "Warning";
        case Level::Error:   return "Error";
    }
    return "Unknown";
}

Sink consoleSink() {
    return [](Level level, const std::string &message) {
        std::ostream &out = (level == Level::Debug) ? std::cout : std::cerr;
        out << "[core2d] " << levelName(level) << ": " << message << std::endl;
    };
}

Sink nullSink() {
    return [](Level, const std::string &) {};
}

void emit(const Sink &sink, Level level, const std::string &message) {
    if (sink) {
        sink(level, message);
        return;
    }
    consoleSink()(level, message);
}

} // namespace Diagnostics
