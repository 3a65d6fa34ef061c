#pragma once

#include <cstdint>
#include <string>

class bgpbattle_configuration_t {
    public:
    // Shared ASN which both peers use to tag game communities
    uint16_t community_asn{ 23456 };

    // Prefix announced by other side
    std::string peer_prefix{ "1.1.1.0/24" };

    // BIRD
    std::string bird_template_path{ "/etc/bird/conf.orig" };
    std::string bird_configuration_path{ "/etc/bird/bird.conf" };
    std::string bird_control_socket_path{ "/run/bird/bird.ctl" };
    std::string bird_template_placeholder{ "###COMMUNITY###" };

    // Waiting for next move of peer
    unsigned int poll_interval{ 5 };
    // 0 means that we wait forever
    unsigned int poll_attempts{ 0 };

    // Logging
    std::string logging_level{ "info" };
    std::string log_file_path{ "/var/log/bgpbattle.log" };
};
