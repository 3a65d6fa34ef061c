#pragma once

#include <cstdint>
#include <string>

#include "bgp_protocol.hpp"

// Transport which carries game communities between peers
// All calls block until routing daemon replies. Nothing is retried here
class advertisement_gateway_t {
    public:
    virtual ~advertisement_gateway_t() {
    }

    // Returns all communities attached to routes for prefix in order of appearance
    virtual bool fetch_communities(const std::string& prefix, bgp_community_list_t& communities, std::string& error_text) = 0;

    // Announces our prefix with both game communities tagged with community_asn
    virtual bool publish(uint16_t community_asn, uint16_t counter_community, uint16_t position_community, std::string& error_text) = 0;

    // Removes game communities from announce
    virtual bool reset(std::string& error_text) = 0;
};
