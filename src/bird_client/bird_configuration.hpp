#pragma once

#include <cstdint>
#include <string>

// BIRD configuration is produced from template where placeholder is replaced by filter statements

// Permissions of configuration file we write for BIRD
const unsigned int bird_configuration_file_mode = 0640;

// Statements which add both game communities to announce
std::string build_community_statements(uint16_t community_asn, uint16_t counter_community, uint16_t position_community);

// Replaces first occurrence of placeholder. Template without placeholder is an error
bool render_bird_configuration(const std::string& template_content,
                               const std::string& placeholder,
                               const std::string& substitution,
                               std::string& configuration,
                               std::string& error_text);

// Reads template from disk, renders it and replaces BIRD configuration file
bool update_bird_configuration_file(const std::string& template_path,
                                    const std::string& configuration_path,
                                    const std::string& placeholder,
                                    const std::string& substitution,
                                    std::string& error_text);
