#pragma once

#include <cstdint>
#include <string>
#include <sys/types.h>

bool convert_string_to_positive_integer_safe(std::string line, int& value);
bool read_uint64_from_string(const std::string& line, uint64_t& value);

bool is_cidr_subnet(std::string subnet);
bool file_exists(std::string path);
bool file_is_appendable(std::string path);

bool read_file_to_string(const std::string& file_path, std::string& file_content);

// Replaces file content and sets specified permissions for it
bool write_string_to_file(const std::string& file_path, const std::string& file_content, mode_t file_mode, std::string& error_text);
