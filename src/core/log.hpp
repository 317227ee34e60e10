#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Debug log file.  Defaults to $TMPDIR/cscope_debug.log; the config's
// log_file key overrides it before any probe runs.
std::string cscope_log_path();
void set_cscope_log_path(const std::string& path);

// Append a timestamped line.  Safe to call from probe worker threads.
void cscope_log(const std::string& msg);

// Log an external command together with its outcome.
void cscope_log_cmd(const std::string& label, const std::vector<std::string>& argv,
                    const CommandResult& r);
