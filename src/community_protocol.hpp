#pragma once

#include <cstdint>

#include "bgp_protocol.hpp"
#include "bgpbattle_types.hpp"

/*
   We split game state into two communities tagged with shared ASN

   Type 1: move counter, incremented on each move so peer could notice new move

   T = Type
   Z = Counter number

   +-------------------------------+
   |T|T|Z|Z|Z|Z|Z|Z|Z|Z|Z|Z|Z|Z|Z|Z|
   +-------------------------------+

   Type 2: position of last attack

   T = Type
   X = X coordinate
   Y = Y coordinate
   S = Hit or miss on previous move

   +-------------------------------+
   |T|T|X|X|X|X|-|-|Y|Y|Y|Y|S|S|-|-|
   +-------------------------------+
*/

enum COMMUNITY_FRAGMENT_TYPES : uint8_t {
    COMMUNITY_FRAGMENT_COUNTER  = 1,
    COMMUNITY_FRAGMENT_POSITION = 2,
};

const unsigned int community_fragment_type_width = 2;
const unsigned int community_position_pad_width  = 2;

// Decodes state announced by peer. Communities with other ASNs are ignored
game_state_code_t decode_game_state(const bgp_community_list_t& communities, uint16_t marker_asn, game_state_t& game_state);

// Never fails. Values which do not fit their fields are truncated
void encode_game_state(const game_state_t& game_state, uint16_t& counter_community, uint16_t& position_community);

// Checks that all fields fit their widths in communities
game_state_code_t validate_game_state(const game_state_t& game_state);

std::string get_community_fragment_type_name(uint32_t fragment_type);
