#pragma once

#include <ostream>
#include <string>

namespace rulegraph {

enum class log_level { debug, info, warning, error, off };

void set_log_level(log_level level);
log_level get_log_level();

// "debug", "info", "warning", "error", "off"; throws config_error otherwise
log_level parse_log_level(const std::string& name);

// std::cout for debug/info, std::cerr for warning/error, a discarding stream below the threshold
std::ostream& log(log_level level);

} // namespace rulegraph
