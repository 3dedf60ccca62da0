#include "machine.hpp"

#include <array>
#include <arpa/inet.h>
#include <cstdio>

namespace model {

    std::optional<std::string> Machine::hexAddress() const {
        in_addr addr{};
        if(inet_pton(AF_INET, address.c_str(), &addr) != 1) {
            return {};
        }
        const auto *octets = reinterpret_cast<const unsigned char *>(&addr.s_addr); // NOLINT
        std::array<char, 9> buffer{};
        std::snprintf(
            buffer.data(),
            buffer.size(),
            "%02X%02X%02X%02X",
            octets[0],
            octets[1],
            octets[2],
            octets[3]);
        return std::string{buffer.data()};
    }

    std::string Machine::shortName() const {
        return name.substr(0, name.find('.'));
    }

} // namespace model
