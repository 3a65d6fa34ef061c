#include "bird_advertisement_gateway.hpp"

#include "bird_client/bird_client.hpp"
#include "bird_client/bird_configuration.hpp"

bird_advertisement_gateway_t::bird_advertisement_gateway_t(const bgpbattle_configuration_t& bgpbattle_configuration)
: bgpbattle_configuration(bgpbattle_configuration) {
}

bool bird_advertisement_gateway_t::fetch_communities(const std::string& prefix, bgp_community_list_t& communities, std::string& error_text) {
    bird_control_connection_t bird_connection(bgpbattle_configuration.bird_control_socket_path);

    if (!bird_connection.connect(error_text)) {
        return false;
    }

    bird_reply_t reply;

    if (!bird_connection.execute_command("show route all " + prefix, reply, error_text)) {
        // Peer did not announce prefix yet, so it has no communities for us
        if (reply.get_final_code() == BIRD_REPLY_CODE_NETWORK_NOT_FOUND) {
            logger << log4cpp::Priority::DEBUG << "BIRD has no routes for " << prefix;

            communities.clear();
            error_text.clear();
            return true;
        }

        return false;
    }

    if (!extract_communities_from_bird_output(reply.get_text(), communities)) {
        error_text = "Can't extract communities from BIRD output";
        return false;
    }

    logger << log4cpp::Priority::DEBUG << "Communities for " << prefix << ": " << print_bgp_community_list(communities);

    return true;
}

bool bird_advertisement_gateway_t::publish(uint16_t community_asn, uint16_t counter_community, uint16_t position_community, std::string& error_text) {
    std::string statements = build_community_statements(community_asn, counter_community, position_community);

    logger << log4cpp::Priority::INFO << "Announce communities (" << community_asn << "," << counter_community << ") ("
           << community_asn << "," << position_community << ")";

    return apply_configuration(statements, error_text);
}

bool bird_advertisement_gateway_t::reset(std::string& error_text) {
    logger << log4cpp::Priority::INFO << "Remove game communities from announce";

    return apply_configuration("", error_text);
}

bool bird_advertisement_gateway_t::apply_configuration(const std::string& substitution, std::string& error_text) {
    if (!update_bird_configuration_file(bgpbattle_configuration.bird_template_path, bgpbattle_configuration.bird_configuration_path,
                                        bgpbattle_configuration.bird_template_placeholder, substitution, error_text)) {
        return false;
    }

    return reload_configuration(error_text);
}

bool bird_advertisement_gateway_t::reload_configuration(std::string& error_text) {
    bird_control_connection_t bird_connection(bgpbattle_configuration.bird_control_socket_path);

    if (!bird_connection.connect(error_text)) {
        return false;
    }

    bird_reply_t reply;

    if (!bird_connection.execute_command("configure", reply, error_text)) {
        return false;
    }

    logger << log4cpp::Priority::INFO << "BIRD reloaded configuration: " << reply.get_text();

    return true;
}
