#include "bird_configuration.hpp"

#include <sstream>

#include <boost/algorithm/string/replace.hpp>

#include "../all_logcpp_libraries.hpp"
#include "../bgp_protocol.hpp"
#include "../bgpbattle_library.hpp"

std::string build_community_statements(uint16_t community_asn, uint16_t counter_community, uint16_t position_community) {
    bgp_community_attribute_element_t position_element(community_asn, position_community);
    bgp_community_attribute_element_t counter_element(community_asn, counter_community);

    std::stringstream buffer;

    buffer << "\n"
           << "bgp_community.add(" << position_element.print() << ");\n"
           << "bgp_community.add(" << counter_element.print() << ");\n";

    return buffer.str();
}

bool render_bird_configuration(const std::string& template_content,
                               const std::string& placeholder,
                               const std::string& substitution,
                               std::string& configuration,
                               std::string& error_text) {
    if (placeholder.empty()) {
        error_text = "Placeholder for BIRD template is blank";
        return false;
    }

    if (template_content.find(placeholder) == std::string::npos) {
        error_text = "BIRD template has no placeholder " + placeholder;
        return false;
    }

    configuration = boost::algorithm::replace_first_copy(template_content, placeholder, substitution);
    return true;
}

bool update_bird_configuration_file(const std::string& template_path,
                                    const std::string& configuration_path,
                                    const std::string& placeholder,
                                    const std::string& substitution,
                                    std::string& error_text) {
    std::string template_content;

    if (!read_file_to_string(template_path, template_content)) {
        error_text = "Can't read BIRD template " + template_path;
        return false;
    }

    std::string configuration;

    if (!render_bird_configuration(template_content, placeholder, substitution, configuration, error_text)) {
        return false;
    }

    if (!write_string_to_file(configuration_path, configuration, bird_configuration_file_mode, error_text)) {
        return false;
    }

    logger << log4cpp::Priority::DEBUG << "Wrote " << configuration.size() << " bytes of BIRD configuration to " << configuration_path;

    return true;
}
