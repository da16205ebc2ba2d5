#pragma once

#include <string>

namespace wordclip {

// Debug lines are dropped unless verbose mode is on
void set_verbose(bool verbose);
bool is_verbose();

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

} // namespace wordclip
