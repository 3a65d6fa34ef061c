#pragma once

#include <string>

#include "bgpbattle_configuration_scheme.hpp"
#include "bgpbattle_types.hpp"

// Reads key = value pairs, lines started from # are comments
bool load_configuration_file(const std::string& configuration_file_path, configuration_map_t& configuration_map);

// Overrides defaults in bgpbattle_configuration with values from map
bool read_bgpbattle_configuration(const configuration_map_t& configuration_map, bgpbattle_configuration_t& bgpbattle_configuration);

bool validate_bgpbattle_configuration(const bgpbattle_configuration_t& bgpbattle_configuration);
