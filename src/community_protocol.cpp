#include "community_protocol.hpp"

#include "bit_codec.hpp"

#include <vector>

std::string game_state_code_to_string(game_state_code_t code) {
    if (code == game_state_code_t::success) {
        return "success";
    } else if (code == game_state_code_t::duplicate_fragment) {
        return "duplicate_fragment";
    } else if (code == game_state_code_t::invalid_type) {
        return "invalid_type";
    } else if (code == game_state_code_t::incomplete_state) {
        return "incomplete_state";
    } else if (code == game_state_code_t::transport_error) {
        return "transport_error";
    } else if (code == game_state_code_t::field_out_of_range) {
        return "field_out_of_range";
    } else {
        return "unknown";
    }
}

bool is_retryable_game_state_code(game_state_code_t code) {
    return code == game_state_code_t::incomplete_state || code == game_state_code_t::transport_error;
}

std::string game_outcome_to_string(uint32_t outcome) {
    switch (outcome) {
    case GAME_OUTCOME_UNKNOWN:
        return "unknown";
    case GAME_OUTCOME_MISS:
        return "miss";
    case GAME_OUTCOME_HIT:
        return "hit";
    case GAME_OUTCOME_RESERVED:
        return "reserved";
    default:
        return "invalid";
    }
}

std::string get_community_fragment_type_name(uint32_t fragment_type) {
    switch (fragment_type) {
    case COMMUNITY_FRAGMENT_COUNTER:
        return "COMMUNITY_FRAGMENT_COUNTER";
    case COMMUNITY_FRAGMENT_POSITION:
        return "COMMUNITY_FRAGMENT_POSITION";
    default:
        return "UNKNOWN";
    }
}

// Field layouts of both fragments, type goes first
const std::vector<unsigned int> counter_fragment_layout  = { community_fragment_type_width, game_state_move_counter_width };
const std::vector<unsigned int> position_fragment_layout = { community_fragment_type_width, game_state_coordinate_width,
                                                             community_position_pad_width,  game_state_coordinate_width,
                                                             game_state_outcome_width,      community_position_pad_width };

game_state_code_t decode_game_state(const bgp_community_list_t& communities, uint16_t marker_asn, game_state_t& game_state) {
    bool counter_captured  = false;
    bool position_captured = false;

    game_state_t decoded_game_state;

    for (const auto& community : filter_communities_by_asn(communities, marker_asn)) {
        // Any layout works to read type as it's always in first two bits
        std::vector<uint32_t> fields;

        if (!unpack_bit_fields(community.community_number, counter_fragment_layout, fields)) {
            return game_state_code_t::invalid_type;
        }

        uint32_t fragment_type = fields[0];

        logger << log4cpp::Priority::DEBUG << "Community " << community.print() << " carries "
               << get_community_fragment_type_name(fragment_type) << " " << print_uint16_as_binary(community.community_number);

        if (fragment_type == COMMUNITY_FRAGMENT_COUNTER) {
            if (counter_captured) {
                logger << log4cpp::Priority::WARN << "Second counter fragment in same announce: " << community.print();
                return game_state_code_t::duplicate_fragment;
            }

            decoded_game_state.move_counter = fields[1];
            counter_captured                = true;
        } else if (fragment_type == COMMUNITY_FRAGMENT_POSITION) {
            if (position_captured) {
                logger << log4cpp::Priority::WARN << "Second position fragment in same announce: " << community.print();
                return game_state_code_t::duplicate_fragment;
            }

            if (!unpack_bit_fields(community.community_number, position_fragment_layout, fields)) {
                return game_state_code_t::invalid_type;
            }

            // fields[2] and fields[5] are padding
            decoded_game_state.x       = fields[1];
            decoded_game_state.y       = fields[3];
            decoded_game_state.outcome = fields[4];
            position_captured          = true;
        } else {
            logger << log4cpp::Priority::WARN << "Unknown fragment type " << fragment_type << " in community " << community.print();
            return game_state_code_t::invalid_type;
        }
    }

    if (!counter_captured || !position_captured) {
        logger << log4cpp::Priority::DEBUG << "Not enough data to make move. Counter: " << counter_captured
               << " position: " << position_captured;
        return game_state_code_t::incomplete_state;
    }

    game_state = decoded_game_state;
    return game_state_code_t::success;
}

void encode_game_state(const game_state_t& game_state, uint16_t& counter_community, uint16_t& position_community) {
    std::vector<bit_field_t> counter_fields = { bit_field_t(COMMUNITY_FRAGMENT_COUNTER, community_fragment_type_width),
                                                bit_field_t(game_state.move_counter, game_state_move_counter_width) };

    std::vector<bit_field_t> position_fields = { bit_field_t(COMMUNITY_FRAGMENT_POSITION, community_fragment_type_width),
                                                 bit_field_t(game_state.x, game_state_coordinate_width),
                                                 bit_field_t(0, community_position_pad_width),
                                                 bit_field_t(game_state.y, game_state_coordinate_width),
                                                 bit_field_t(game_state.outcome, game_state_outcome_width),
                                                 bit_field_t(0, community_position_pad_width) };

    counter_community  = 0;
    position_community = 0;

    // Both layouts are fixed and cover exactly 16 bits
    if (!pack_bit_fields(counter_fields, counter_community)) {
        logger << log4cpp::Priority::ERROR << "Can't pack counter fragment";
    }

    if (!pack_bit_fields(position_fields, position_community)) {
        logger << log4cpp::Priority::ERROR << "Can't pack position fragment";
    }

    logger << log4cpp::Priority::DEBUG << "Encoded " << game_state.print() << " as " << print_uint16_as_binary(counter_community)
           << " " << print_uint16_as_binary(position_community);
}

game_state_code_t validate_game_state(const game_state_t& game_state) {
    if (truncate_to_bit_width(game_state.move_counter, game_state_move_counter_width) != game_state.move_counter) {
        logger << log4cpp::Priority::WARN << "Move counter " << game_state.move_counter << " does not fit "
               << game_state_move_counter_width << " bits";
        return game_state_code_t::field_out_of_range;
    }

    if (truncate_to_bit_width(game_state.x, game_state_coordinate_width) != game_state.x ||
        truncate_to_bit_width(game_state.y, game_state_coordinate_width) != game_state.y) {
        logger << log4cpp::Priority::WARN << "Coordinates " << game_state.x << ":" << game_state.y << " do not fit "
               << game_state_coordinate_width << " bits";
        return game_state_code_t::field_out_of_range;
    }

    if (truncate_to_bit_width(game_state.outcome, game_state_outcome_width) != game_state.outcome) {
        logger << log4cpp::Priority::WARN << "Outcome " << game_state.outcome << " does not fit " << game_state_outcome_width << " bits";
        return game_state_code_t::field_out_of_range;
    }

    return game_state_code_t::success;
}
