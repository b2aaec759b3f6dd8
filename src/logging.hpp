#pragma once
/*
 * Logging
 *
 * Purpose: install the process default spdlog logger from AppConfig.
 * Note: stdout is the screen, so logs go to a file or nowhere.
 */
#include <string>
#include "config.hpp"

#define CELLTERM_LOGGER_NAME "cellterm"

// Returns false (and installs a null logger) when log_file cannot be opened.
bool init_logging(const AppConfig& cfg, std::string* error = nullptr);
