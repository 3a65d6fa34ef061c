#include "bgpbattle_library.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

#include <boost/regex.hpp>

boost::regex regular_expression_cidr_pattern("^\\d+\\.\\d+\\.\\d+\\.\\d+\\/\\d+$");

// Safe way to convert string to positive integer.
// We accept only positive numbers here
bool convert_string_to_positive_integer_safe(std::string line, int& value) {
    int temp_value = 0;

    try {
        temp_value = std::stoi(line);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }

    if (temp_value < 0) {
        // We do not expect negative values here
        return false;
    }

    value = temp_value;
    return true;
}

bool read_uint64_from_string(const std::string& line, uint64_t& value) {
    // stoull accepts leading minus and wraps value around
    if (line.empty() || line.find('-') != std::string::npos) {
        return false;
    }

    try {
        value = std::stoull(line);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }

    return true;
}

bool is_cidr_subnet(std::string subnet) {
    boost::cmatch what;

    if (!regex_match(subnet.c_str(), what, regular_expression_cidr_pattern)) {
        return false;
    }

    int prefix_length = 0;

    if (!convert_string_to_positive_integer_safe(subnet.substr(subnet.find('/') + 1), prefix_length)) {
        return false;
    }

    return prefix_length <= 32;
}

// check file existence
bool file_exists(std::string path) {
    FILE* check_file = fopen(path.c_str(), "r");
    if (check_file) {
        fclose(check_file);
        return true;
    } else {
        return false;
    }
}

bool file_is_appendable(std::string path) {
    std::ofstream check_appendable_file;

    check_appendable_file.open(path.c_str(), std::ios::app);

    if (check_appendable_file.is_open()) {
        check_appendable_file.close();

        return true;
    } else {
        return false;
    }
}

bool read_file_to_string(const std::string& file_path, std::string& file_content) {
    std::ifstream file_stream(file_path.c_str(), std::ios::binary);

    if (!file_stream.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file_stream.rdbuf();

    if (file_stream.bad()) {
        return false;
    }

    file_content = buffer.str();
    return true;
}

bool write_string_to_file(const std::string& file_path, const std::string& file_content, mode_t file_mode, std::string& error_text) {
    std::ofstream file_stream(file_path.c_str(), std::ios::trunc | std::ios::binary);

    if (!file_stream.is_open()) {
        error_text = "Can't open file " + file_path + " for writing: " + strerror(errno);
        return false;
    }

    file_stream << file_content;
    file_stream.close();

    if (file_stream.fail()) {
        error_text = "Can't write data to file " + file_path;
        return false;
    }

    if (chmod(file_path.c_str(), file_mode) != 0) {
        error_text = "Can't set permissions for file " + file_path + ": " + strerror(errno);
        return false;
    }

    return true;
}
