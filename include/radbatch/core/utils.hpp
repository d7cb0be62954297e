#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace radbatch::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_files(const fs::path& dir, const std::string& pattern);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
void safe_hardlink_or_copy(const fs::path& src, const fs::path& dst);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::vector<std::string> split_whitespace(const std::string& str);

// Glob pattern matching (case-insensitive, '*' and '?'; ';' separates alternatives)
bool glob_match(const std::string& pattern, const std::string& str);

// Clamps a requested worker count to [1, min(cpu cores, task count)].
int compute_worker_count(int requested, size_t task_count);

} // namespace radbatch::core
