#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

#include "all_logcpp_libraries.hpp"

#include "bgpbattle_configuration.hpp"
#include "bgpbattle_library.hpp"
#include "bird_advertisement_gateway.hpp"
#include "community_protocol.hpp"
#include "game_channel.hpp"

log4cpp::Category& logger = log4cpp::Category::getRoot();

std::string global_config_path = "/etc/bgpbattle.conf";

void init_logging(bool log_to_console, const std::string& log_file_path) {
    logger.setPriority(log4cpp::Priority::INFO);

    // In this case we log everything to console
    if (log_to_console) {
        log4cpp::PatternLayout* layout = new log4cpp::PatternLayout();
        layout->setConversionPattern("[%p] %m%n");

        // We duplicate stdout because it will be closed by log4cpp on object termination and we do not need it
        log4cpp::Appender* console_appender = new log4cpp::FileAppender("stdout", ::dup(fileno(stdout)));
        console_appender->setLayout(layout);
        logger.addAppender(console_appender);
    } else {
        log4cpp::PatternLayout* layout = new log4cpp::PatternLayout();
        layout->setConversionPattern("%d [%p] %m%n");

        log4cpp::Appender* appender = new log4cpp::FileAppender("default", log_file_path);
        appender->setLayout(layout);
        logger.addAppender(appender);
    }

    logger << log4cpp::Priority::INFO << "Logger initialized";
}

void reconfigure_logging_level(const std::string& logging_level) {
    log4cpp::Priority::Value priority = log4cpp::Priority::INFO;

    if (logging_level == "debug") {
        priority = log4cpp::Priority::DEBUG;
    } else if (logging_level == "info" || logging_level == "") {
        priority = log4cpp::Priority::INFO;
    } else {
        logger << log4cpp::Priority::ERROR << "Unknown logging level: " << logging_level;
    }

    logger.setPriority(priority);
}

// Encodes and decodes all positions of 10x10 board
bool run_self_test(const bgpbattle_configuration_t& bgpbattle_configuration) {
    unsigned int failed_checks = 0;

    for (uint32_t x = 0; x < 10; x++) {
        for (uint32_t y = 0; y < 10; y++) {
            game_state_t game_state;
            game_state.move_counter = 1;
            game_state.x            = x;
            game_state.y            = y;

            uint16_t counter_community  = 0;
            uint16_t position_community = 0;

            encode_game_state(game_state, counter_community, position_community);

            bgp_community_list_t communities = {
                bgp_community_attribute_element_t(bgpbattle_configuration.community_asn, counter_community),
                bgp_community_attribute_element_t(bgpbattle_configuration.community_asn, position_community),
            };

            game_state_t decoded_game_state;
            game_state_code_t result = decode_game_state(communities, bgpbattle_configuration.community_asn, decoded_game_state);

            if (result != game_state_code_t::success || decoded_game_state != game_state) {
                logger << log4cpp::Priority::ERROR << "Logic error for " << game_state.print() << ": "
                       << game_state_code_to_string(result) << " " << decoded_game_state.print();
                failed_checks++;
            }
        }
    }

    return failed_checks == 0;
}

// Parses space separated list of communities in AS:DATA or (AS,DATA) form
bool read_communities_from_string(const std::string& communities_as_string, bgp_community_list_t& communities) {
    std::vector<std::string> communities_as_vector;
    std::string trimmed_communities = boost::algorithm::trim_copy(communities_as_string);

    boost::split(communities_as_vector, trimmed_communities, boost::is_any_of(" "), boost::token_compress_on);

    for (const auto& community_as_string : communities_as_vector) {
        bgp_community_attribute_element_t community;

        if (!read_bgp_community_from_string(community_as_string, community)) {
            logger << log4cpp::Priority::ERROR << "Can't parse community " << community_as_string;
            return false;
        }

        communities.push_back(community);
    }

    return true;
}

void print_game_state(const game_state_t& game_state) {
    std::cout << "move_counter: " << game_state.move_counter << std::endl
              << "x: " << game_state.x << std::endl
              << "y: " << game_state.y << std::endl
              << "outcome: " << game_outcome_to_string(game_state.outcome) << std::endl;
}

int main(int argc, char** argv) {
    namespace po = boost::program_options;

    bool log_to_console = false;
    bool custom_config  = false;

    bgpbattle_configuration_t bgpbattle_configuration;
    po::variables_map vm;

    try {
        // clang-format off
        po::options_description desc("Allowed options");
        desc.add_options()
        ("help", "produce help message")
        ("read", "read state announced by peer")
        ("write", "announce our state, requires --counter, --x, --y and --outcome")
        ("reset", "remove game communities from our announce")
        ("wait", "wait until peer makes next move, requires --last_counter")
        ("self_test", "check encoding and decoding of all board positions")
        ("counter", po::value<unsigned int>(), "move counter to announce")
        ("x", po::value<unsigned int>(), "x coordinate to announce")
        ("y", po::value<unsigned int>(), "y coordinate to announce")
        ("outcome", po::value<unsigned int>(), "result of previous move: 0 unknown, 1 miss, 2 hit")
        ("last_counter", po::value<unsigned int>(), "move counter we have seen from peer last time")
        ("communities", po::value<std::string>(), "decode these communities for --read instead of asking BIRD, i.e. \"23456:16385 23456:35952\"")
        ("configuration_file", po::value<std::string>(), "set path to custom configuration file")
        ("log_file", po::value<std::string>(), "set path to custom log file")
        ("log_to_console", "switches all logging to console")
        ("peer_prefix", po::value<std::string>(), "the prefix of the other side")
        ("community_asn", po::value<unsigned int>(), "the shared community ASN used to communicate on")
        ("template_file", po::value<std::string>(), "where to find BIRD configuration template")
        ("bird_configuration_file", po::value<std::string>(), "where to write BIRD configuration")
        ("control_socket", po::value<std::string>(), "path to BIRD control socket");
        // clang-format on

        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }

        if (vm.count("configuration_file")) {
            global_config_path = vm["configuration_file"].as<std::string>();
            custom_config      = true;
        }

        if (vm.count("log_file")) {
            bgpbattle_configuration.log_file_path = vm["log_file"].as<std::string>();
        }

        if (vm.count("log_to_console")) {
            log_to_console = true;
        }
    } catch (po::error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
        return EXIT_FAILURE;
    }

    // So log4cpp will never notify you if it could not write to log file due to permissions issues
    if (!log_to_console && !file_is_appendable(bgpbattle_configuration.log_file_path)) {
        std::cerr << "Can't open log file " << bgpbattle_configuration.log_file_path
                  << " for writing! Please check file and folder permissions" << std::endl;
        return EXIT_FAILURE;
    }

    init_logging(log_to_console, bgpbattle_configuration.log_file_path);

    // Default configuration file is optional
    if (custom_config || file_exists(global_config_path)) {
        configuration_map_t configuration_map;

        if (!load_configuration_file(global_config_path, configuration_map)) {
            std::cerr << "Can't load configuration file " << global_config_path << std::endl;
            return EXIT_FAILURE;
        }

        if (!read_bgpbattle_configuration(configuration_map, bgpbattle_configuration)) {
            std::cerr << "Configuration file " << global_config_path << " has errors, please check log" << std::endl;
            return EXIT_FAILURE;
        }
    }

    if (vm.count("peer_prefix")) {
        bgpbattle_configuration.peer_prefix = vm["peer_prefix"].as<std::string>();
    }

    if (vm.count("community_asn")) {
        unsigned int community_asn = vm["community_asn"].as<unsigned int>();

        if (community_asn > UINT16_MAX) {
            std::cerr << "community_asn should not exceed " << UINT16_MAX << std::endl;
            return EXIT_FAILURE;
        }

        bgpbattle_configuration.community_asn = community_asn;
    }

    if (vm.count("template_file")) {
        bgpbattle_configuration.bird_template_path = vm["template_file"].as<std::string>();
    }

    if (vm.count("bird_configuration_file")) {
        bgpbattle_configuration.bird_configuration_path = vm["bird_configuration_file"].as<std::string>();
    }

    if (vm.count("control_socket")) {
        bgpbattle_configuration.bird_control_socket_path = vm["control_socket"].as<std::string>();
    }

    if (!validate_bgpbattle_configuration(bgpbattle_configuration)) {
        std::cerr << "Configuration is not valid, please check log" << std::endl;
        return EXIT_FAILURE;
    }

    reconfigure_logging_level(bgpbattle_configuration.logging_level);

    if (vm.count("self_test")) {
        if (!run_self_test(bgpbattle_configuration)) {
            std::cerr << "Self test failed" << std::endl;
            return EXIT_FAILURE;
        }

        std::cout << "Self test passed" << std::endl;
        return EXIT_SUCCESS;
    }

    bird_advertisement_gateway_t gateway(bgpbattle_configuration);
    game_state_code_t result = game_state_code_t::success;

    if (vm.count("read")) {
        game_state_t game_state;

        if (vm.count("communities")) {
            bgp_community_list_t communities;

            if (!read_communities_from_string(vm["communities"].as<std::string>(), communities)) {
                std::cerr << "Please specify communities as AS:DATA separated by spaces" << std::endl;
                return EXIT_FAILURE;
            }

            result = decode_game_state(communities, bgpbattle_configuration.community_asn, game_state);
        } else {
            result = read_game_state(gateway, bgpbattle_configuration, game_state);
        }

        if (result == game_state_code_t::success) {
            print_game_state(game_state);
        }
    } else if (vm.count("write")) {
        if (!vm.count("counter") || !vm.count("x") || !vm.count("y") || !vm.count("outcome")) {
            std::cerr << "Please specify --counter, --x, --y and --outcome" << std::endl;
            return EXIT_FAILURE;
        }

        game_state_t game_state;
        game_state.move_counter = vm["counter"].as<unsigned int>();
        game_state.x            = vm["x"].as<unsigned int>();
        game_state.y            = vm["y"].as<unsigned int>();
        game_state.outcome      = vm["outcome"].as<unsigned int>();

        result = publish_game_state(gateway, bgpbattle_configuration, game_state);
    } else if (vm.count("reset")) {
        result = reset_game_state(gateway);
    } else if (vm.count("wait")) {
        if (!vm.count("last_counter")) {
            std::cerr << "Please specify --last_counter" << std::endl;
            return EXIT_FAILURE;
        }

        game_state_t game_state;
        result = wait_for_next_move(gateway, bgpbattle_configuration, vm["last_counter"].as<unsigned int>(), game_state);

        if (result == game_state_code_t::success) {
            print_game_state(game_state);
        }
    } else {
        std::cerr << "Please specify one of --read, --write, --reset, --wait or --self_test" << std::endl;
        return EXIT_FAILURE;
    }

    if (result != game_state_code_t::success) {
        std::cerr << "Operation failed: " << game_state_code_to_string(result) << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
