#pragma once

#include <string>
#include <vector>

#include "Errors.hpp"

//quotes a single argument for /bin/sh
std::string shell_quote(const std::string& arg);

//the argument vector as one shell command line
std::string build_command_line(const std::vector<std::string>& args);

/**
 * @brief runs an external tool and blocks until it finished
 * @details stdout and stderr are appended to logFile (if not empty). A non-zero exit throws ExternalToolError,
 * the call is never retried.
**/
void run_command(const std::vector<std::string>& args, const std::string& logFile);
