#pragma once

#include <cstdint>
#include <string>
#include <vector>

// All routines here treat 16 bit value as sequence of bits where first field occupies most significant bits
// Reader and writer work on two bytes in network byte order so bit order matches byte order on the wire

const unsigned int bit_codec_value_width = 16;

// Most significant byte goes first
void write_uint16_network_byte_order(uint16_t value, uint8_t* buffer);
uint16_t read_uint16_network_byte_order(const uint8_t* buffer);

class bit_field_t {
    public:
    bit_field_t() {
    }

    bit_field_t(uint32_t value, unsigned int width) : value(value), width(width) {
    }

    uint32_t value     = 0;
    unsigned int width = 0;
};

// Reads fields from 16 bit value starting from most significant bit
class bit_reader_t {
    public:
    explicit bit_reader_t(uint16_t value) {
        write_uint16_network_byte_order(value, buffer);
    }

    // Returns false when we have no enough bits left
    bool read(unsigned int width, uint32_t& field_value);
    bool skip(unsigned int width);

    unsigned int get_remaining_bits() const {
        return bit_codec_value_width - position;
    }

    private:
    uint8_t buffer[2]     = { 0, 0 };
    unsigned int position = 0;
};

// Appends fields to 16 bit value starting from most significant bit
// Values which do not fit into their width are truncated to low bits
class bit_writer_t {
    public:
    bool write(uint32_t field_value, unsigned int width);

    uint16_t get_value() const {
        return read_uint16_network_byte_order(buffer);
    }

    unsigned int get_used_bits() const {
        return position;
    }

    private:
    uint8_t buffer[2]     = { 0, 0 };
    unsigned int position = 0;
};

uint32_t truncate_to_bit_width(uint32_t value, unsigned int width);

bool pack_bit_fields(const std::vector<bit_field_t>& fields, uint16_t& packed_value);
bool unpack_bit_fields(uint16_t packed_value, const std::vector<unsigned int>& widths, std::vector<uint32_t>& values);

std::string print_uint16_as_binary(uint16_t value);
