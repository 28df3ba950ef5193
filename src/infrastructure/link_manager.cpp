#include "infrastructure/link_manager.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <sstream>

namespace aprelay
{
    namespace infrastructure
    {

        LinkManager::LinkManager(CommandRunner &runner)
            : runner_(runner), logger_(core::get_logger("LinkManager"))
        {
        }

        bool LinkManager::interface_exists(const std::string &interface) const
        {
            if (interface.empty())
            {
                return false;
            }
            return runner_.run({"ip", "link", "show", "dev", interface}).ok();
        }

        std::vector<std::string> LinkManager::ipv4_addresses(const std::string &interface) const
        {
            std::vector<std::string> addresses;

            // One line per address: "3: wlan0    inet 192.168.50.1/24 brd ... scope global wlan0 ..."
            auto result = runner_.run({"ip", "-o", "-4", "addr", "show", "dev", interface});
            if (!result.ok())
            {
                return addresses;
            }

            std::istringstream stream(result.output);
            std::string line;
            while (std::getline(stream, line))
            {
                std::istringstream words(line);
                std::string word;
                while (words >> word)
                {
                    if (word == "inet" && words >> word)
                    {
                        addresses.push_back(word);
                        break;
                    }
                }
            }
            return addresses;
        }

        bool LinkManager::has_address(const std::string &interface, const std::string &host) const
        {
            for (const auto &cidr : ipv4_addresses(interface))
            {
                if (cidr.substr(0, cidr.find('/')) == host)
                {
                    return true;
                }
            }
            return false;
        }

        bool LinkManager::is_access_point_mode(const std::string &interface) const
        {
            auto result = runner_.run({"iw", "dev", interface, "info"});
            if (!result.ok())
            {
                return false;
            }

            std::istringstream stream(result.output);
            std::string line;
            while (std::getline(stream, line))
            {
                std::istringstream words(line);
                std::string key, value;
                if (words >> key >> value && key == "type")
                {
                    return value == "AP";
                }
            }
            return false;
        }

        std::string LinkManager::address_summary(const std::string &interface, int lines) const
        {
            auto result = runner_.run({"ip", "addr", "show", interface});
            if (!result.ok())
            {
                return "Interface " + interface + " not available\n";
            }

            std::istringstream stream(result.output);
            std::ostringstream summary;
            std::string line;
            for (int i = 0; i < lines && std::getline(stream, line); ++i)
            {
                summary << line << "\n";
            }
            return summary.str();
        }

        bool LinkManager::add_address(const std::string &interface, const std::string &cidr)
        {
            logger_->debug("Adding address", core::LogContext().add("interface", interface).add("address", cidr));
            return runner_.run({"ip", "addr", "add", cidr, "dev", interface}).ok();
        }

        bool LinkManager::remove_address(const std::string &interface, const std::string &cidr)
        {
            logger_->debug("Removing address", core::LogContext().add("interface", interface).add("address", cidr));
            return runner_.run({"ip", "addr", "del", cidr, "dev", interface}).ok();
        }

        bool LinkManager::set_link_up(const std::string &interface)
        {
            return runner_.run({"ip", "link", "set", interface, "up"}).ok();
        }

        bool LinkManager::enable_ip_forwarding()
        {
            return runner_.run({"sysctl", "-w", "net.ipv4.ip_forward=1"}).ok();
        }

    } // namespace infrastructure
} // namespace aprelay
