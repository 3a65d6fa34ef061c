#pragma once

#include <cstdint>
#include <map>
#include <sstream>
#include <string>

typedef std::map<std::string, std::string> configuration_map_t;

// Result of every read or write of game state over BGP communities
enum class game_state_code_t {
    success,
    duplicate_fragment,
    invalid_type,
    incomplete_state,
    transport_error,
    field_out_of_range,
};

// Outcome of previous move as announced by peer
enum game_outcome_t : uint8_t { GAME_OUTCOME_UNKNOWN = 0, GAME_OUTCOME_MISS = 1, GAME_OUTCOME_HIT = 2, GAME_OUTCOME_RESERVED = 3 };

// Width of each field in bits as it's encoded in communities
const unsigned int game_state_move_counter_width = 14;
const unsigned int game_state_coordinate_width   = 4;
const unsigned int game_state_outcome_width      = 2;

class game_state_t {
    public:
    // Incremented by announcing peer on every move
    uint32_t move_counter = 0;

    // Coordinates of last move
    uint32_t x = 0;
    uint32_t y = 0;

    // Result of previous move, one of game_outcome_t
    uint32_t outcome = GAME_OUTCOME_UNKNOWN;

    bool operator==(const game_state_t& rhs) const {
        return move_counter == rhs.move_counter && x == rhs.x && y == rhs.y && outcome == rhs.outcome;
    }

    bool operator!=(const game_state_t& rhs) const {
        return !(*this == rhs);
    }

    std::string print() const {
        std::stringstream buffer;

        buffer << "move_counter: " << move_counter << " "
               << "x: " << x << " "
               << "y: " << y << " "
               << "outcome: " << outcome;

        return buffer.str();
    }
};

std::string game_state_code_to_string(game_state_code_t code);
std::string game_outcome_to_string(uint32_t outcome);

// Tells caller that it makes sense to repeat same operation later
bool is_retryable_game_state_code(game_state_code_t code);
