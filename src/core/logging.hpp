#pragma once
#include <string>

namespace core {
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);
// Only printed when verbose logging is enabled (--verbose or LWT_DEBUG).
void log_debug(const std::string& msg);

void set_verbose(bool on);
bool is_verbose();
}
