#include "bgp_protocol.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/regex.hpp>

#include "bgpbattle_library.hpp"

// BIRD prints standard communities as (65000,100)
boost::regex bird_community_pattern("\\((\\d+),(\\d+)\\)");

// Wrapper function which just checks correctness of bgp community
bool is_bgp_community_valid(std::string community_as_string) {
    bgp_community_attribute_element_t bgp_community_attribute_element;

    return read_bgp_community_from_string(community_as_string, bgp_community_attribute_element);
}

// We accept both 65000:100 and BIRD's (65000,100) notation
bool read_bgp_community_from_string(std::string community_as_string, bgp_community_attribute_element_t& bgp_community_attribute_element) {
    std::vector<std::string> community_as_vector;

    boost::algorithm::trim(community_as_string);

    if (community_as_string.size() > 2 && community_as_string.front() == '(' && community_as_string.back() == ')') {
        community_as_string = community_as_string.substr(1, community_as_string.size() - 2);
    }

    split(community_as_vector, community_as_string, boost::is_any_of(":,"), boost::token_compress_on);

    if (community_as_vector.size() != 2) {
        logger << log4cpp::Priority::WARN << "Could not parse community: " << community_as_string;
        return false;
    }

    int asn_as_integer = 0;

    if (!convert_string_to_positive_integer_safe(community_as_vector[0], asn_as_integer)) {
        logger << log4cpp::Priority::WARN << "Could not parse ASN from raw format: " << community_as_vector[0];
        return false;
    }

    int community_number_as_integer = 0;

    if (!convert_string_to_positive_integer_safe(community_as_vector[1], community_number_as_integer)) {
        logger << log4cpp::Priority::WARN << "Could not parse community from raw format: " << community_as_vector[1];
        return false;
    }

    if (asn_as_integer > UINT16_MAX) {
        logger << log4cpp::Priority::ERROR << "Your ASN value exceeds maximum allowed value " << UINT16_MAX;
        return false;
    }

    if (community_number_as_integer > UINT16_MAX) {
        logger << log4cpp::Priority::ERROR << "Your community value exceeds maximum allowed value " << UINT16_MAX;
        return false;
    }

    bgp_community_attribute_element.asn_number       = asn_as_integer;
    bgp_community_attribute_element.community_number = community_number_as_integer;

    return true;
}

bool extract_communities_from_bird_output(const std::string& bird_output, bgp_community_list_t& communities) {
    communities.clear();

    boost::sregex_iterator end;

    for (boost::sregex_iterator itr(bird_output.begin(), bird_output.end(), bird_community_pattern); itr != end; ++itr) {
        const boost::smatch& match = *itr;

        uint64_t asn_number       = 0;
        uint64_t community_number = 0;

        if (!read_uint64_from_string(match[1], asn_number) || !read_uint64_from_string(match[2], community_number)) {
            logger << log4cpp::Priority::WARN << "Could not parse community " << match[0] << " from BIRD output";
            continue;
        }

        // Standard community has only 16 bit for each part
        if (asn_number > UINT16_MAX || community_number > UINT16_MAX) {
            logger << log4cpp::Priority::DEBUG << "Skip community " << match[0] << " as it does not fit 16 bit fields";
            continue;
        }

        communities.push_back(bgp_community_attribute_element_t(asn_number, community_number));
    }

    return true;
}

bgp_community_list_t filter_communities_by_asn(const bgp_community_list_t& communities, uint16_t asn_number) {
    bgp_community_list_t filtered_communities;

    for (const auto& community : communities) {
        if (community.asn_number == asn_number) {
            filtered_communities.push_back(community);
        }
    }

    return filtered_communities;
}

std::string print_bgp_community_list(const bgp_community_list_t& communities) {
    std::vector<std::string> communities_as_strings;

    for (const auto& community : communities) {
        communities_as_strings.push_back(community.print());
    }

    return boost::algorithm::join(communities_as_strings, " ");
}
