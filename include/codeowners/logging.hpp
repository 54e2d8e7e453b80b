#pragma once

#include <string>

namespace codeowners {

void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

} // namespace codeowners
