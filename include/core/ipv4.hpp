#ifndef APRELAY_CORE_IPV4_HPP
#define APRELAY_CORE_IPV4_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace aprelay
{
    namespace core
    {

        /**
         * IPv4 address in host byte order
         */
        struct Ipv4Address
        {
            uint32_t value = 0;

            static std::optional<Ipv4Address> parse(const std::string &text);
            std::string to_string() const;

            bool operator==(const Ipv4Address &other) const { return value == other.value; }
            bool operator!=(const Ipv4Address &other) const { return value != other.value; }
            bool operator<(const Ipv4Address &other) const { return value < other.value; }
            bool operator<=(const Ipv4Address &other) const { return value <= other.value; }
        };

        /**
         * Address assigned to an interface together with its prefix length,
         * written as a.b.c.d/p
         */
        struct Ipv4Interface
        {
            Ipv4Address address;
            int prefix = 32;

            static std::optional<Ipv4Interface> parse(const std::string &cidr);
            std::string to_string() const;

            uint32_t netmask() const;
            std::string netmask_string() const;
            Ipv4Address network() const;
            Ipv4Address broadcast() const;

            // True when the address lies inside this interface's subnet
            bool contains(const Ipv4Address &other) const;

            // False for the network and broadcast addresses of prefixes up to /30
            bool is_host_address(const Ipv4Address &other) const;
        };

    } // namespace core
} // namespace aprelay

#endif // APRELAY_CORE_IPV4_HPP
