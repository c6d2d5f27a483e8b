#include "log.h"
#include "errors.h"

#include <atomic>
#include <iostream>
#include <streambuf>

namespace rulegraph {

namespace {
    std::atomic<log_level> threshold{log_level::warning};

    struct null_buffer : std::streambuf {
        int overflow(int c) override { return c; }
    };

    std::ostream& null_stream() {
        static null_buffer buffer;
        static std::ostream stream(&buffer);
        return stream;
    }
}

void set_log_level(log_level level) {
    threshold.store(level);
}

log_level get_log_level() {
    return threshold.load();
}

log_level parse_log_level(const std::string& name) {
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warning" || name == "warn") return log_level::warning;
    if (name == "error") return log_level::error;
    if (name == "off") return log_level::off;
    throw config_error("unknown log level '" + name + "'");
}

std::ostream& log(log_level level) {
    if (level == log_level::off || level < threshold.load()) return null_stream();
    if (level >= log_level::warning) return std::cerr;
    return std::cout;
}

} // namespace rulegraph
