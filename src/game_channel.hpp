#pragma once

#include "advertisement_gateway.hpp"
#include "bgpbattle_configuration_scheme.hpp"
#include "bgpbattle_types.hpp"

// Reads state announced by peer for configured prefix
game_state_code_t read_game_state(advertisement_gateway_t& gateway, const bgpbattle_configuration_t& bgpbattle_configuration, game_state_t& game_state);

// Announces our state. Values which do not fit their fields are rejected
game_state_code_t
publish_game_state(advertisement_gateway_t& gateway, const bgpbattle_configuration_t& bgpbattle_configuration, const game_state_t& game_state);

game_state_code_t reset_game_state(advertisement_gateway_t& gateway);

// Polls peer until it announces state with counter different from last_move_counter.
// incomplete_state and transport_error are retried, other errors stop polling
game_state_code_t wait_for_next_move(advertisement_gateway_t& gateway,
                                     const bgpbattle_configuration_t& bgpbattle_configuration,
                                     uint32_t last_move_counter,
                                     game_state_t& game_state);
