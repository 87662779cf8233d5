#pragma once

#include <string>
#include <vector>
#include <utility>

// Creates a directory and any missing parents. Returns true if successful or if it already exists.
bool create_dir(const std::string& path);

bool dir_exists(const std::string& path);

bool file_exists(const std::string& path);

// Regular files directly inside dir, sorted by name. Returns false if dir can't be opened.
bool list_files(const std::string& dir, std::vector<std::string>& files);

// Subdirectory names directly inside dir, sorted.
std::vector<std::string> list_dirs(const std::string& dir);

// Removes every file inside dir, then dir itself
bool remove_dir(const std::string& path);

bool copy_file(const std::string& from, const std::string& to);

// Changes seconds into HH:MM:SS format
std::string format_duration(double seconds);

// Reads CPU temp and returns a formatted string
std::string get_cpu_temp();

// Local time as YYYYmmdd_HHMMSS
std::string get_timestamp();

long get_epoch_seconds();

std::string trim(const std::string& value);

std::vector<std::string> split(const std::string& value, char separator);

// Replaces every "{key}" in templ with its value
std::string fill_template(const std::string& templ,
                          const std::vector<std::pair<std::string, std::string>>& values);

// Runs a shell command. Returns true only if it ran and exited with 0.
bool run_command(const std::string& command);
