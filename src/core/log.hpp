#pragma once

#include <string>

// Debug log shared by the coordinator and reaper threads.
// Default path: <temp_dir>/hubwarden_debug.log

// Path currently written to by hubwarden_log().
std::string hubwarden_log_path();

// Redirect the debug log. An empty path restores the default.
void set_hubwarden_log_path(const std::string& path);

// Append a "[HH:MM:SS.mmm] msg" line to the debug log.
void hubwarden_log(const std::string& msg);
