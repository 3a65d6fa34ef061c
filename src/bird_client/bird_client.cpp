#include "bird_client.hpp"

#include <cctype>
#include <istream>

#include "../all_logcpp_libraries.hpp"

extern log4cpp::Category& logger;

unsigned int bird_reply_t::get_final_code() const {
    if (lines.empty()) {
        return 0;
    }

    return lines.back().code;
}

bool bird_reply_t::is_error() const {
    for (const auto& line : lines) {
        if (line.code >= BIRD_REPLY_CODE_FIRST_ERROR) {
            return true;
        }
    }

    return false;
}

std::string bird_reply_t::get_text() const {
    std::string text;

    for (const auto& line : lines) {
        if (!text.empty()) {
            text += "\n";
        }

        text += line.text;
    }

    return text;
}

bool bird_reply_parser_t::feed_line(const std::string& line, std::string& error_text) {
    if (complete) {
        error_text = "Reply is already complete";
        return false;
    }

    if (line.empty()) {
        error_text = "Blank line in BIRD reply";
        return false;
    }

    if (line[0] == '+') {
        logger << log4cpp::Priority::DEBUG << "Asynchronous message from BIRD: " << line;
        return true;
    }

    if (line[0] == ' ') {
        if (reply.lines.empty()) {
            error_text = "BIRD reply starts from continuation line";
            return false;
        }

        bird_reply_line_t reply_line;
        reply_line.code = last_code;
        reply_line.text = line.substr(1);

        reply.lines.push_back(reply_line);
        return true;
    }

    bool code_is_numeric = line.size() >= 5;

    for (size_t i = 0; code_is_numeric && i < 4; i++) {
        // isdigit has undefined behaviour for negative values of char
        code_is_numeric = isdigit(static_cast<unsigned char>(line[i])) != 0;
    }

    if (!code_is_numeric || (line[4] != ' ' && line[4] != '-')) {
        error_text = "Malformed line in BIRD reply: " + line;
        return false;
    }

    bird_reply_line_t reply_line;
    reply_line.code = std::stoul(line.substr(0, 4));
    reply_line.text = line.substr(5);

    last_code = reply_line.code;
    reply.lines.push_back(reply_line);

    if (line[4] == ' ') {
        complete = true;
    }

    return true;
}

bird_control_connection_t::bird_control_connection_t(const std::string& socket_path)
: socket_path(socket_path), socket(io_context) {
}

bird_control_connection_t::~bird_control_connection_t() {
    if (!socket.is_open()) {
        return;
    }

    boost::system::error_code ec;
    socket.close(ec);

    if (ec) {
        logger << log4cpp::Priority::WARN << "Can't close BIRD control socket " << socket_path << ": " << ec.message();
    }
}

bool bird_control_connection_t::connect(std::string& error_text) {
    boost::system::error_code ec;

    socket.connect(boost::asio::local::stream_protocol::endpoint(socket_path), ec);

    if (ec) {
        error_text = "Unable to connect to BIRD socket " + socket_path + ": " + ec.message();
        return false;
    }

    bird_reply_t welcome_reply;

    if (!read_reply(welcome_reply, error_text)) {
        return false;
    }

    if (welcome_reply.get_final_code() != BIRD_REPLY_CODE_WELCOME) {
        error_text = "Unexpected greeting from BIRD: " + welcome_reply.get_text();
        return false;
    }

    logger << log4cpp::Priority::DEBUG << "Connected to BIRD: " << welcome_reply.get_text();

    return true;
}

bool bird_control_connection_t::execute_command(const std::string& command, bird_reply_t& reply, std::string& error_text) {
    if (!socket.is_open()) {
        error_text = "BIRD control socket is not connected";
        return false;
    }

    logger << log4cpp::Priority::DEBUG << "Send command to BIRD: " << command;

    boost::system::error_code ec;
    boost::asio::write(socket, boost::asio::buffer(command + "\n"), ec);

    if (ec) {
        error_text = "Unable to send command to BIRD: " + ec.message();
        return false;
    }

    if (!read_reply(reply, error_text)) {
        return false;
    }

    if (reply.is_error()) {
        error_text = "BIRD rejected command '" + command + "': " + reply.get_text();
        return false;
    }

    return true;
}

bool bird_control_connection_t::read_reply(bird_reply_t& reply, std::string& error_text) {
    bird_reply_parser_t reply_parser;

    while (!reply_parser.is_complete()) {
        boost::system::error_code ec;
        boost::asio::read_until(socket, read_buffer, '\n', ec);

        if (ec) {
            error_text = "Unable to read from BIRD: " + ec.message();
            return false;
        }

        std::istream read_stream(&read_buffer);
        std::string line;
        std::getline(read_stream, line);

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        logger << log4cpp::Priority::DEBUG << "BIRD: " << line;

        if (!reply_parser.feed_line(line, error_text)) {
            return false;
        }
    }

    reply = reply_parser.get_reply();
    return true;
}
