#include "bgpbattle_configuration.hpp"

#include <fstream>

#include <boost/algorithm/string.hpp>

#include "all_logcpp_libraries.hpp"
#include "bgpbattle_library.hpp"

extern log4cpp::Category& logger;

bool load_configuration_file(const std::string& configuration_file_path, configuration_map_t& configuration_map) {
    std::ifstream config_file(configuration_file_path.c_str());
    std::string line;

    if (!config_file.is_open()) {
        logger << log4cpp::Priority::ERROR << "Can't open config file " << configuration_file_path;
        return false;
    }

    bool parse_errors = false;

    while (getline(config_file, line)) {
        boost::algorithm::trim(line);

        if (line.find("#") == 0 or line.empty()) {
            // Ignore comments line
            continue;
        }

        // Only first = separates key, value may contain = too
        size_t separator_position = line.find('=');

        if (separator_position == std::string::npos) {
            logger << log4cpp::Priority::ERROR << "Can't parse config line: '" << line << "'";
            parse_errors = true;
            continue;
        }

        std::string key   = boost::algorithm::trim_copy(line.substr(0, separator_position));
        std::string value = boost::algorithm::trim_copy(line.substr(separator_position + 1));

        if (key.empty()) {
            logger << log4cpp::Priority::ERROR << "Config line without key: '" << line << "'";
            parse_errors = true;
            continue;
        }

        configuration_map[key] = value;
    }

    return !parse_errors;
}

bool read_bgpbattle_configuration(const configuration_map_t& configuration_map, bgpbattle_configuration_t& bgpbattle_configuration) {
    if (configuration_map.count("community_asn") != 0) {
        int community_asn = 0;

        if (!convert_string_to_positive_integer_safe(configuration_map.at("community_asn"), community_asn) ||
            community_asn > UINT16_MAX) {
            logger << log4cpp::Priority::ERROR << "community_asn should be number from 0 to " << UINT16_MAX;
            return false;
        }

        bgpbattle_configuration.community_asn = community_asn;
    }

    if (configuration_map.count("peer_prefix") != 0) {
        bgpbattle_configuration.peer_prefix = configuration_map.at("peer_prefix");
    }

    if (configuration_map.count("bird_template_file") != 0) {
        bgpbattle_configuration.bird_template_path = configuration_map.at("bird_template_file");
    }

    if (configuration_map.count("bird_configuration_file") != 0) {
        bgpbattle_configuration.bird_configuration_path = configuration_map.at("bird_configuration_file");
    }

    if (configuration_map.count("bird_control_socket") != 0) {
        bgpbattle_configuration.bird_control_socket_path = configuration_map.at("bird_control_socket");
    }

    if (configuration_map.count("bird_template_placeholder") != 0) {
        bgpbattle_configuration.bird_template_placeholder = configuration_map.at("bird_template_placeholder");
    }

    if (configuration_map.count("poll_interval") != 0) {
        int poll_interval = 0;

        if (!convert_string_to_positive_integer_safe(configuration_map.at("poll_interval"), poll_interval)) {
            logger << log4cpp::Priority::ERROR << "Can't parse poll_interval: " << configuration_map.at("poll_interval");
            return false;
        }

        bgpbattle_configuration.poll_interval = poll_interval;
    }

    if (configuration_map.count("poll_attempts") != 0) {
        int poll_attempts = 0;

        if (!convert_string_to_positive_integer_safe(configuration_map.at("poll_attempts"), poll_attempts)) {
            logger << log4cpp::Priority::ERROR << "Can't parse poll_attempts: " << configuration_map.at("poll_attempts");
            return false;
        }

        bgpbattle_configuration.poll_attempts = poll_attempts;
    }

    if (configuration_map.count("logging_level") != 0) {
        bgpbattle_configuration.logging_level = configuration_map.at("logging_level");
    }

    return validate_bgpbattle_configuration(bgpbattle_configuration);
}

bool validate_bgpbattle_configuration(const bgpbattle_configuration_t& bgpbattle_configuration) {
    if (!is_cidr_subnet(bgpbattle_configuration.peer_prefix)) {
        logger << log4cpp::Priority::ERROR << "Peer prefix " << bgpbattle_configuration.peer_prefix << " is not IPv4 subnet in CIDR form";
        return false;
    }

    if (bgpbattle_configuration.poll_interval == 0) {
        logger << log4cpp::Priority::ERROR << "poll_interval should be at least 1 second";
        return false;
    }

    if (bgpbattle_configuration.bird_template_placeholder.empty()) {
        logger << log4cpp::Priority::ERROR << "bird_template_placeholder can't be blank";
        return false;
    }

    if (bgpbattle_configuration.bird_template_path.empty() || bgpbattle_configuration.bird_configuration_path.empty() ||
        bgpbattle_configuration.bird_control_socket_path.empty()) {
        logger << log4cpp::Priority::ERROR << "Paths to BIRD files can't be blank";
        return false;
    }

    if (bgpbattle_configuration.logging_level != "info" && bgpbattle_configuration.logging_level != "debug") {
        logger << log4cpp::Priority::ERROR << "Unknown logging level: " << bgpbattle_configuration.logging_level;
        return false;
    }

    return true;
}
