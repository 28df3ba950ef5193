#ifndef APRELAY_INFRASTRUCTURE_LINK_MANAGER_HPP
#define APRELAY_INFRASTRUCTURE_LINK_MANAGER_HPP

#include <memory>
#include <string>
#include <vector>

namespace aprelay
{
    namespace core
    {
        class Logger;
    }
    namespace infrastructure
    {
        class CommandRunner;
    }
}

namespace aprelay
{
    namespace infrastructure
    {

        /**
         * Link Manager
         * Queries and configures network interfaces through ip(8), iw(8) and sysctl(8)
         */
        class LinkManager
        {
        public:
            explicit LinkManager(CommandRunner &runner);

            // Interface queries
            bool interface_exists(const std::string &interface) const;
            std::vector<std::string> ipv4_addresses(const std::string &interface) const;
            bool has_address(const std::string &interface, const std::string &host) const;
            bool is_access_point_mode(const std::string &interface) const;

            // First `lines` lines of `ip addr show`, for status reports
            std::string address_summary(const std::string &interface, int lines) const;

            // Interface configuration
            bool add_address(const std::string &interface, const std::string &cidr);
            bool remove_address(const std::string &interface, const std::string &cidr);
            bool set_link_up(const std::string &interface);

            // Kernel settings
            bool enable_ip_forwarding();

        private:
            CommandRunner &runner_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace aprelay

#endif // APRELAY_INFRASTRUCTURE_LINK_MANAGER_HPP
