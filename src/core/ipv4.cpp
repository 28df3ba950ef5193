#include "core/ipv4.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

namespace aprelay
{
    namespace core
    {

        std::optional<Ipv4Address> Ipv4Address::parse(const std::string &text)
        {
            in_addr raw{};
            if (text.empty() || inet_pton(AF_INET, text.c_str(), &raw) != 1)
            {
                return std::nullopt;
            }
            return Ipv4Address{ntohl(raw.s_addr)};
        }

        std::string Ipv4Address::to_string() const
        {
            in_addr raw{};
            raw.s_addr = htonl(value);
            char buffer[INET_ADDRSTRLEN] = {};
            if (!inet_ntop(AF_INET, &raw, buffer, sizeof(buffer)))
            {
                return "";
            }
            return buffer;
        }

        std::optional<Ipv4Interface> Ipv4Interface::parse(const std::string &cidr)
        {
            auto slash = cidr.find('/');
            if (slash == std::string::npos)
            {
                return std::nullopt;
            }

            auto address = Ipv4Address::parse(cidr.substr(0, slash));
            if (!address)
            {
                return std::nullopt;
            }

            std::string prefix_text = cidr.substr(slash + 1);
            if (prefix_text.empty() || prefix_text.size() > 2 ||
                prefix_text.find_first_not_of("0123456789") != std::string::npos)
            {
                return std::nullopt;
            }

            int prefix = std::stoi(prefix_text);
            if (prefix < 0 || prefix > 32)
            {
                return std::nullopt;
            }

            return Ipv4Interface{*address, prefix};
        }

        std::string Ipv4Interface::to_string() const
        {
            return address.to_string() + "/" + std::to_string(prefix);
        }

        uint32_t Ipv4Interface::netmask() const
        {
            if (prefix <= 0)
            {
                return 0;
            }
            return ~uint32_t{0} << (32 - prefix);
        }

        std::string Ipv4Interface::netmask_string() const
        {
            return Ipv4Address{netmask()}.to_string();
        }

        Ipv4Address Ipv4Interface::network() const
        {
            return Ipv4Address{address.value & netmask()};
        }

        Ipv4Address Ipv4Interface::broadcast() const
        {
            return Ipv4Address{network().value | ~netmask()};
        }

        bool Ipv4Interface::contains(const Ipv4Address &other) const
        {
            return (other.value & netmask()) == network().value;
        }

        bool Ipv4Interface::is_host_address(const Ipv4Address &other) const
        {
            if (!contains(other))
            {
                return false;
            }
            if (prefix >= 31)
            {
                return true;
            }
            return other != network() && other != broadcast();
        }

    } // namespace core
} // namespace aprelay
