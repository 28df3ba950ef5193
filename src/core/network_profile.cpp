#include "core/network_profile.hpp"
#include "core/ipv4.hpp"

#include <filesystem>
#include <fstream>
#include <utility>
#include <unistd.h>

namespace aprelay
{
    namespace core
    {

        void NetworkProfile::from_json(const nlohmann::json &j)
        {
            if (j.contains("internet_interface"))
                j["internet_interface"].get_to(internet_interface);
            if (j.contains("wireless_interface"))
                j["wireless_interface"].get_to(wireless_interface);
            if (j.contains("ssid"))
                j["ssid"].get_to(ssid);
            if (j.contains("passphrase"))
                j["passphrase"].get_to(passphrase);
            if (j.contains("ap_address"))
                j["ap_address"].get_to(ap_address);
            if (j.contains("dhcp_range_start"))
                j["dhcp_range_start"].get_to(dhcp_range_start);
            if (j.contains("dhcp_range_end"))
                j["dhcp_range_end"].get_to(dhcp_range_end);
            if (j.contains("forward_policy_overridden"))
                j["forward_policy_overridden"].get_to(forward_policy_overridden);
        }

        nlohmann::json NetworkProfile::to_json() const
        {
            return nlohmann::json{
                {"internet_interface", internet_interface},
                {"wireless_interface", wireless_interface},
                {"ssid", ssid},
                {"passphrase", passphrase},
                {"ap_address", ap_address},
                {"dhcp_range_start", dhcp_range_start},
                {"dhcp_range_end", dhcp_range_end},
                {"forward_policy_overridden", forward_policy_overridden}};
        }

        bool NetworkProfile::is_configured() const
        {
            return !internet_interface.empty() && !wireless_interface.empty();
        }

        std::string NetworkProfile::ap_host() const
        {
            return ap_address.substr(0, ap_address.find('/'));
        }

        void NetworkProfile::apply_defaults()
        {
            if (ssid.empty())
                ssid = DEFAULT_SSID;
            if (passphrase.empty())
                passphrase = DEFAULT_PASSPHRASE;
            if (ap_address.empty())
                ap_address = std::string(DEFAULT_AP_HOST) + "/" + std::to_string(DEFAULT_AP_PREFIX);
            if (dhcp_range_start.empty())
                dhcp_range_start = DEFAULT_DHCP_START;
            if (dhcp_range_end.empty())
                dhcp_range_end = DEFAULT_DHCP_END;
        }

        std::vector<std::string> NetworkProfile::validate() const
        {
            std::vector<std::string> errors;

            if (internet_interface.empty())
            {
                errors.emplace_back("internet_interface is required");
            }
            if (wireless_interface.empty())
            {
                errors.emplace_back("wireless_interface is required");
            }
            if (!internet_interface.empty() && internet_interface == wireless_interface)
            {
                errors.emplace_back("internet_interface and wireless_interface must differ");
            }
            if (ssid.empty() || ssid.size() > 32)
            {
                errors.emplace_back("ssid must be 1 to 32 characters");
            }

            auto passphrase_errors = validate_passphrase();
            errors.insert(errors.end(), passphrase_errors.begin(), passphrase_errors.end());

            auto addressing_errors = validate_addressing();
            errors.insert(errors.end(), addressing_errors.begin(), addressing_errors.end());

            return errors;
        }

        std::vector<std::string> NetworkProfile::validate_passphrase() const
        {
            // WPA2-PSK passphrases are 8..63 printable ASCII characters
            if (passphrase.size() < 8 || passphrase.size() > 63)
            {
                return {"passphrase must be 8 to 63 characters"};
            }
            for (unsigned char c : passphrase)
            {
                if (c < 0x20 || c > 0x7e)
                {
                    return {"passphrase must contain printable ASCII characters only"};
                }
            }
            return {};
        }

        std::vector<std::string> NetworkProfile::validate_addressing() const
        {
            std::vector<std::string> errors;

            auto ap = Ipv4Interface::parse(ap_address);
            if (!ap || ap->prefix < 1 || ap->prefix > 30 || !ap->is_host_address(ap->address))
            {
                errors.emplace_back("ap_address must be an IPv4 host address with prefix, e.g. 192.168.50.1/24");
                return errors;
            }

            auto start = Ipv4Address::parse(dhcp_range_start);
            auto end = Ipv4Address::parse(dhcp_range_end);
            if (!start)
            {
                errors.emplace_back("dhcp_range_start is not an IPv4 address");
            }
            if (!end)
            {
                errors.emplace_back("dhcp_range_end is not an IPv4 address");
            }
            if (!start || !end)
            {
                return errors;
            }

            if (!ap->is_host_address(*start) || !ap->is_host_address(*end))
            {
                errors.emplace_back("DHCP range must lie inside " + ap->network().to_string() + "/" +
                                    std::to_string(ap->prefix));
            }
            if (!(*start <= *end))
            {
                errors.emplace_back("dhcp_range_start must not be greater than dhcp_range_end");
            }
            if (*start <= ap->address && ap->address <= *end)
            {
                errors.emplace_back("DHCP range must not include the access point address");
            }

            return errors;
        }

        ProfileStore::ProfileStore(std::string path)
            : path_(std::move(path))
        {
        }

        std::optional<NetworkProfile> ProfileStore::load() const
        {
            std::error_code ec;
            if (!std::filesystem::exists(path_, ec))
            {
                return std::nullopt;
            }

            std::ifstream file(path_);
            if (!file.is_open())
            {
                throw ProfileError("Cannot read profile file: " + path_);
            }

            NetworkProfile profile;
            try
            {
                nlohmann::json j;
                file >> j;
                if (!j.is_object())
                {
                    throw ProfileError("Profile file is not a JSON object: " + path_);
                }
                profile.from_json(j);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ProfileError("Invalid profile file " + path_ + ": " + e.what());
            }
            return profile;
        }

        void ProfileStore::save(const NetworkProfile &profile) const
        {
            namespace fs = std::filesystem;

            fs::path target(path_);
            if (target.has_parent_path())
            {
                fs::create_directories(target.parent_path());
            }

            fs::path temp = target;
            temp += ".tmp." + std::to_string(getpid());

            try
            {
                {
                    std::ofstream file(temp, std::ios::trunc);
                    if (!file.is_open())
                    {
                        throw ProfileError("Cannot open profile file for writing: " + temp.string());
                    }
                    fs::permissions(temp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
                    file << profile.to_json().dump(4) << "\n";
                    file.flush();
                    if (!file)
                    {
                        throw ProfileError("Failed to write profile file: " + temp.string());
                    }
                }

                fs::rename(temp, target);
            }
            catch (const std::exception &)
            {
                // The temporary copy holds the passphrase
                std::error_code ec;
                fs::remove(temp, ec);
                throw;
            }
        }

    } // namespace core
} // namespace aprelay
