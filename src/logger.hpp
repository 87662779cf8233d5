#pragma once

#include <string>

// --- Constants ---
#define DEFAULT_LOGS_PATH "logs/"
#define LOG_FILE_NAME "lapsebot.log"

// Sets the directory for the backup log file. Empty disables the file copy.
void set_log_dir(const std::string& dir);

void set_debug_logging(bool enabled);

// Writes "[timestamp] message" to stdout and the backup log file.
// Severity goes in the message itself ("ERROR: ...", "Warning: ...").
void log_status(const std::string& message);

// Only emitted when debug logging is enabled
void log_debug(const std::string& message);
