#include "game_channel.hpp"

#include <boost/thread.hpp>

#include "community_protocol.hpp"

game_state_code_t read_game_state(advertisement_gateway_t& gateway, const bgpbattle_configuration_t& bgpbattle_configuration, game_state_t& game_state) {
    bgp_community_list_t communities;
    std::string error_text;

    if (!gateway.fetch_communities(bgpbattle_configuration.peer_prefix, communities, error_text)) {
        logger << log4cpp::Priority::ERROR << "Can't fetch communities for " << bgpbattle_configuration.peer_prefix << ": " << error_text;
        return game_state_code_t::transport_error;
    }

    return decode_game_state(communities, bgpbattle_configuration.community_asn, game_state);
}

game_state_code_t
publish_game_state(advertisement_gateway_t& gateway, const bgpbattle_configuration_t& bgpbattle_configuration, const game_state_t& game_state) {
    game_state_code_t validation_result = validate_game_state(game_state);

    if (validation_result != game_state_code_t::success) {
        return validation_result;
    }

    uint16_t counter_community  = 0;
    uint16_t position_community = 0;

    encode_game_state(game_state, counter_community, position_community);

    std::string error_text;

    if (!gateway.publish(bgpbattle_configuration.community_asn, counter_community, position_community, error_text)) {
        logger << log4cpp::Priority::ERROR << "Can't publish game state: " << error_text;
        return game_state_code_t::transport_error;
    }

    return game_state_code_t::success;
}

game_state_code_t reset_game_state(advertisement_gateway_t& gateway) {
    std::string error_text;

    if (!gateway.reset(error_text)) {
        logger << log4cpp::Priority::ERROR << "Can't reset announce: " << error_text;
        return game_state_code_t::transport_error;
    }

    return game_state_code_t::success;
}

game_state_code_t wait_for_next_move(advertisement_gateway_t& gateway,
                                     const bgpbattle_configuration_t& bgpbattle_configuration,
                                     uint32_t last_move_counter,
                                     game_state_t& game_state) {
    game_state_code_t result = game_state_code_t::incomplete_state;

    for (unsigned int attempt = 1; bgpbattle_configuration.poll_attempts == 0 || attempt <= bgpbattle_configuration.poll_attempts; attempt++) {
        if (attempt > 1) {
            boost::this_thread::sleep(boost::posix_time::seconds(bgpbattle_configuration.poll_interval));
        }

        game_state_t peer_game_state;
        result = read_game_state(gateway, bgpbattle_configuration, peer_game_state);

        if (result == game_state_code_t::success) {
            if (peer_game_state.move_counter != last_move_counter) {
                game_state = peer_game_state;
                return result;
            }

            logger << log4cpp::Priority::DEBUG << "Peer still has move counter " << last_move_counter;

            // Peer did not move yet
            result = game_state_code_t::incomplete_state;
            continue;
        }

        if (!is_retryable_game_state_code(result)) {
            logger << log4cpp::Priority::ERROR << "Stop waiting for peer: " << game_state_code_to_string(result);
            return result;
        }

        logger << log4cpp::Priority::DEBUG << "Attempt " << attempt << " to read peer state: " << game_state_code_to_string(result);
    }

    return result;
}
