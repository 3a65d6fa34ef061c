#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "all_logcpp_libraries.hpp"

// Get log4cpp logger from main programme
extern log4cpp::Category& logger;

// This is class for storing old style BGP communities which support only 16
// bit AS numbers
class bgp_community_attribute_element_t {
    public:
    bgp_community_attribute_element_t() {
    }

    bgp_community_attribute_element_t(uint16_t asn_number, uint16_t community_number)
    : asn_number(asn_number), community_number(community_number) {
    }

    uint16_t asn_number       = 0;
    uint16_t community_number = 0;

    bool operator==(const bgp_community_attribute_element_t& rhs) const {
        return asn_number == rhs.asn_number && community_number == rhs.community_number;
    }

    // BIRD notation: (asn,value)
    std::string print() const {
        std::stringstream buffer;
        buffer << "(" << asn_number << "," << community_number << ")";

        return buffer.str();
    }
};

typedef std::vector<bgp_community_attribute_element_t> bgp_community_list_t;

bool read_bgp_community_from_string(std::string community_as_string, bgp_community_attribute_element_t& bgp_community_attribute_element);
bool is_bgp_community_valid(std::string community_as_string);

// Extracts all standard communities from "show route all" output in order we met them
bool extract_communities_from_bird_output(const std::string& bird_output, bgp_community_list_t& communities);

// Keeps only communities tagged with specified ASN
bgp_community_list_t filter_communities_by_asn(const bgp_community_list_t& communities, uint16_t asn_number);

std::string print_bgp_community_list(const bgp_community_list_t& communities);
