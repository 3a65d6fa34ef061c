#pragma once

#include "advertisement_gateway.hpp"
#include "bgpbattle_configuration_scheme.hpp"

// Talks to local BIRD: reads routes over control socket and changes announce by rewriting configuration from template
class bird_advertisement_gateway_t : public advertisement_gateway_t {
    public:
    explicit bird_advertisement_gateway_t(const bgpbattle_configuration_t& bgpbattle_configuration);

    bool fetch_communities(const std::string& prefix, bgp_community_list_t& communities, std::string& error_text) override;
    bool publish(uint16_t community_asn, uint16_t counter_community, uint16_t position_community, std::string& error_text) override;
    bool reset(std::string& error_text) override;

    private:
    bool apply_configuration(const std::string& substitution, std::string& error_text);
    bool reload_configuration(std::string& error_text);

    bgpbattle_configuration_t bgpbattle_configuration;
};
