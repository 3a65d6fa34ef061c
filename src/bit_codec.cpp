#include "bit_codec.hpp"

#include <arpa/inet.h>
#include <cstring>

#include "all_logcpp_libraries.hpp"

extern log4cpp::Category& logger;

// Keeps only low bits of value which fit into specified width
uint32_t truncate_to_bit_width(uint32_t value, unsigned int width) {
    if (width >= 32) {
        return value;
    }

    return value & ((uint32_t(1) << width) - 1);
}

bool bit_reader_t::read(unsigned int width, uint32_t& field_value) {
    if (width > get_remaining_bits()) {
        return false;
    }

    field_value = 0;

    for (unsigned int i = 0; i < width; i++) {
        uint8_t current_bit = (buffer[position / 8] >> (7 - position % 8)) & 1;

        field_value = (field_value << 1) | current_bit;
        position++;
    }

    return true;
}

bool bit_reader_t::skip(unsigned int width) {
    if (width > get_remaining_bits()) {
        return false;
    }

    position += width;
    return true;
}

bool bit_writer_t::write(uint32_t field_value, unsigned int width) {
    if (width > bit_codec_value_width - position) {
        return false;
    }

    uint32_t truncated_value = truncate_to_bit_width(field_value, width);

    for (unsigned int i = 0; i < width; i++) {
        if ((truncated_value >> (width - 1 - i)) & 1) {
            buffer[position / 8] |= uint8_t(1 << (7 - position % 8));
        }

        position++;
    }

    return true;
}

// Fields should cover all 16 bits
bool pack_bit_fields(const std::vector<bit_field_t>& fields, uint16_t& packed_value) {
    bit_writer_t bit_writer;

    for (const auto& field : fields) {
        if (!bit_writer.write(field.value, field.width)) {
            logger << log4cpp::Priority::WARN << "Bit fields exceed " << bit_codec_value_width << " bits";
            return false;
        }
    }

    if (bit_writer.get_used_bits() != bit_codec_value_width) {
        logger << log4cpp::Priority::WARN << "Bit fields cover only " << bit_writer.get_used_bits() << " bits of "
               << bit_codec_value_width;
        return false;
    }

    packed_value = bit_writer.get_value();
    return true;
}

bool unpack_bit_fields(uint16_t packed_value, const std::vector<unsigned int>& widths, std::vector<uint32_t>& values) {
    unsigned int total_width = 0;

    for (auto width : widths) {
        total_width += width;
    }

    if (total_width != bit_codec_value_width) {
        logger << log4cpp::Priority::WARN << "Bit field widths sum to " << total_width << " instead of " << bit_codec_value_width;
        return false;
    }

    bit_reader_t bit_reader(packed_value);

    values.clear();
    values.reserve(widths.size());

    for (auto width : widths) {
        uint32_t field_value = 0;

        if (!bit_reader.read(width, field_value)) {
            return false;
        }

        values.push_back(field_value);
    }

    return true;
}

void write_uint16_network_byte_order(uint16_t value, uint8_t* buffer) {
    uint16_t value_network_byte_order = htons(value);
    memcpy(buffer, &value_network_byte_order, sizeof(value_network_byte_order));
}

uint16_t read_uint16_network_byte_order(const uint8_t* buffer) {
    uint16_t value_network_byte_order = 0;
    memcpy(&value_network_byte_order, buffer, sizeof(value_network_byte_order));

    return ntohs(value_network_byte_order);
}

std::string print_uint16_as_binary(uint16_t value) {
    std::string result;
    result.reserve(bit_codec_value_width);

    for (int bit = bit_codec_value_width - 1; bit >= 0; bit--) {
        result += (value >> bit) & 1 ? '1' : '0';
    }

    return result;
}
