#pragma once

#include <string>
#include <vector>

#include <boost/asio.hpp>

// BIRD control socket protocol:
//
// Each reply line starts from 4 digit code followed by minus when reply continues or by space for last line
// Lines which start from space continue previous line with same code
// Lines which start from + are asynchronous messages and do not belong to reply
//
// https://bird.network.cz/?get_doc&v=20&f=prog-2.html#ss2.5

// Code of greeting which BIRD sends right after connection
const unsigned int BIRD_REPLY_CODE_WELCOME = 1;

// 8xxx run-time errors, 9xxx parse errors
const unsigned int BIRD_REPLY_CODE_FIRST_ERROR = 8000;

// Reply to "show route" for prefix which has no routes in table
const unsigned int BIRD_REPLY_CODE_NETWORK_NOT_FOUND = 8001;

class bird_reply_line_t {
    public:
    unsigned int code = 0;
    std::string text;
};

class bird_reply_t {
    public:
    std::vector<bird_reply_line_t> lines;

    // Code of last line which completes reply
    unsigned int get_final_code() const;
    bool is_error() const;

    // All lines joined by new line
    std::string get_text() const;
};

// Assembles reply from lines read from socket
class bird_reply_parser_t {
    public:
    // Line should be passed without trailing new line
    bool feed_line(const std::string& line, std::string& error_text);

    bool is_complete() const {
        return complete;
    }

    const bird_reply_t& get_reply() const {
        return reply;
    }

    private:
    bird_reply_t reply;
    unsigned int last_code = 0;
    bool complete          = false;
};

// Single session with BIRD over UNIX socket, socket closes on destruction
class bird_control_connection_t {
    public:
    explicit bird_control_connection_t(const std::string& socket_path);
    ~bird_control_connection_t();

    bird_control_connection_t(const bird_control_connection_t&) = delete;
    bird_control_connection_t& operator=(const bird_control_connection_t&) = delete;

    // Connects and reads greeting
    bool connect(std::string& error_text);

    // Sends command and reads whole reply. Error replies from BIRD are reported as failures
    bool execute_command(const std::string& command, bird_reply_t& reply, std::string& error_text);

    private:
    bool read_reply(bird_reply_t& reply, std::string& error_text);

    std::string socket_path;
    boost::asio::io_context io_context;
    boost::asio::local::stream_protocol::socket socket;
    boost::asio::streambuf read_buffer;
};
