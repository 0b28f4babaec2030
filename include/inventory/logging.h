#pragma once
#include <string>

namespace inventory
{

// Initialize logger; empty path => console only
void init_logger(const std::string &path = "");

// Echo log lines to stderr (on by default)
void set_log_console(bool enabled);

// Log a plain text message (INFO)
void log_message(const std::string &msg);

void log_warning(const std::string &msg);

void log_error(const std::string &msg);

} // namespace inventory
