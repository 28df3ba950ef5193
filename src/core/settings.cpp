#include "core/settings.hpp"
#include <filesystem>
#include <fstream>

namespace aprelay
{
    namespace core
    {

        // PathSettings implementation
        void PathSettings::from_json(const nlohmann::json &j)
        {
            if (j.contains("profile_file"))
                j["profile_file"].get_to(profile_file);
            if (j.contains("hostapd_conf"))
                j["hostapd_conf"].get_to(hostapd_conf);
            if (j.contains("hostapd_defaults"))
                j["hostapd_defaults"].get_to(hostapd_defaults);
            if (j.contains("dnsmasq_conf"))
                j["dnsmasq_conf"].get_to(dnsmasq_conf);
        }

        nlohmann::json PathSettings::to_json() const
        {
            return nlohmann::json{
                {"profile_file", profile_file},
                {"hostapd_conf", hostapd_conf},
                {"hostapd_defaults", hostapd_defaults},
                {"dnsmasq_conf", dnsmasq_conf}};
        }

        // AccessPointSettings implementation
        void AccessPointSettings::from_json(const nlohmann::json &j)
        {
            if (j.contains("driver"))
                j["driver"].get_to(driver);
            if (j.contains("hw_mode"))
                j["hw_mode"].get_to(hw_mode);
            if (j.contains("channel"))
                j["channel"].get_to(channel);
            if (j.contains("country_code") && !j["country_code"].is_null())
                j["country_code"].get_to(country_code);
            if (j.contains("hide_ssid"))
                j["hide_ssid"].get_to(hide_ssid);
        }

        nlohmann::json AccessPointSettings::to_json() const
        {
            nlohmann::json j{
                {"driver", driver},
                {"hw_mode", hw_mode},
                {"channel", channel},
                {"hide_ssid", hide_ssid}};
            if (!country_code.empty())
            {
                j["country_code"] = country_code;
            }
            return j;
        }

        // DhcpSettings implementation
        void DhcpSettings::from_json(const nlohmann::json &j)
        {
            if (j.contains("lease_time"))
                j["lease_time"].get_to(lease_time);
            if (j.contains("dns_servers"))
                dns_servers = j["dns_servers"].get<std::vector<std::string>>();
        }

        nlohmann::json DhcpSettings::to_json() const
        {
            return nlohmann::json{
                {"lease_time", lease_time},
                {"dns_servers", dns_servers}};
        }

        // ServiceSettings implementation
        void ServiceSettings::from_json(const nlohmann::json &j)
        {
            if (j.contains("hostapd_unit"))
                j["hostapd_unit"].get_to(hostapd_unit);
            if (j.contains("dnsmasq_unit"))
                j["dnsmasq_unit"].get_to(dnsmasq_unit);
            if (j.contains("hostapd_binary"))
                j["hostapd_binary"].get_to(hostapd_binary);
            if (j.contains("dnsmasq_binary"))
                j["dnsmasq_binary"].get_to(dnsmasq_binary);
            if (j.contains("persistence_helper"))
                j["persistence_helper"].get_to(persistence_helper);
            if (j.contains("iptables_binary"))
                j["iptables_binary"].get_to(iptables_binary);
            if (j.contains("hostapd_settle_ms"))
                j["hostapd_settle_ms"].get_to(hostapd_settle_ms);
            if (j.contains("dnsmasq_settle_ms"))
                j["dnsmasq_settle_ms"].get_to(dnsmasq_settle_ms);
        }

        nlohmann::json ServiceSettings::to_json() const
        {
            return nlohmann::json{
                {"hostapd_unit", hostapd_unit},
                {"dnsmasq_unit", dnsmasq_unit},
                {"hostapd_binary", hostapd_binary},
                {"dnsmasq_binary", dnsmasq_binary},
                {"persistence_helper", persistence_helper},
                {"iptables_binary", iptables_binary},
                {"hostapd_settle_ms", hostapd_settle_ms},
                {"dnsmasq_settle_ms", dnsmasq_settle_ms}};
        }

        // ReadinessSettings implementation
        void ReadinessSettings::from_json(const nlohmann::json &j)
        {
            if (j.contains("timeout_ms"))
                j["timeout_ms"].get_to(timeout_ms);
            if (j.contains("initial_interval_ms"))
                j["initial_interval_ms"].get_to(initial_interval_ms);
            if (j.contains("backoff_factor"))
                j["backoff_factor"].get_to(backoff_factor);
            if (j.contains("max_interval_ms"))
                j["max_interval_ms"].get_to(max_interval_ms);
        }

        nlohmann::json ReadinessSettings::to_json() const
        {
            return nlohmann::json{
                {"timeout_ms", timeout_ms},
                {"initial_interval_ms", initial_interval_ms},
                {"backoff_factor", backoff_factor},
                {"max_interval_ms", max_interval_ms}};
        }

        // FirewallSettings implementation
        void FirewallSettings::from_json(const nlohmann::json &j)
        {
            if (j.contains("restore_forward_policy_on_stop"))
                j["restore_forward_policy_on_stop"].get_to(restore_forward_policy_on_stop);
        }

        nlohmann::json FirewallSettings::to_json() const
        {
            return nlohmann::json{
                {"restore_forward_policy_on_stop", restore_forward_policy_on_stop}};
        }

        // StatusSettings implementation
        void StatusSettings::from_json(const nlohmann::json &j)
        {
            if (j.contains("address_lines"))
                j["address_lines"].get_to(address_lines);
        }

        nlohmann::json StatusSettings::to_json() const
        {
            return nlohmann::json{{"address_lines", address_lines}};
        }

        // LoggingSettings implementation
        void LoggingSettings::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                j["log_level"].get_to(log_level);
            if (j.contains("log_file") && !j["log_file"].is_null())
                j["log_file"].get_to(log_file);
        }

        nlohmann::json LoggingSettings::to_json() const
        {
            nlohmann::json j{{"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        // ToolSettings implementation
        ToolSettings ToolSettings::from_file(const std::string &settings_path)
        {
            std::ifstream file(settings_path);
            if (!file.is_open())
            {
                throw SettingsError("Settings file not found: " + settings_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw SettingsError("Invalid JSON in settings file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        ToolSettings ToolSettings::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw SettingsError("Settings must be a JSON object");
            }

            ToolSettings settings;
            try
            {
                if (j.contains("paths"))
                    settings.paths.from_json(j["paths"]);
                if (j.contains("access_point"))
                    settings.access_point.from_json(j["access_point"]);
                if (j.contains("dhcp"))
                    settings.dhcp.from_json(j["dhcp"]);
                if (j.contains("services"))
                    settings.services.from_json(j["services"]);
                if (j.contains("readiness"))
                    settings.readiness.from_json(j["readiness"]);
                if (j.contains("firewall"))
                    settings.firewall.from_json(j["firewall"]);
                if (j.contains("status"))
                    settings.status.from_json(j["status"]);
                if (j.contains("logging"))
                    settings.logging.from_json(j["logging"]);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw SettingsError("Invalid value in settings: " + std::string(e.what()));
            }
            return settings;
        }

        ToolSettings ToolSettings::load(const std::string &settings_path, bool required)
        {
            std::error_code ec;
            if (!required && !std::filesystem::exists(settings_path, ec))
            {
                return ToolSettings{};
            }
            return from_file(settings_path);
        }

        nlohmann::json ToolSettings::to_json() const
        {
            return nlohmann::json{
                {"paths", paths.to_json()},
                {"access_point", access_point.to_json()},
                {"dhcp", dhcp.to_json()},
                {"services", services.to_json()},
                {"readiness", readiness.to_json()},
                {"firewall", firewall.to_json()},
                {"status", status.to_json()},
                {"logging", logging.to_json()}};
        }

        std::vector<std::string> ToolSettings::validate() const
        {
            std::vector<std::string> errors;

            if (paths.profile_file.empty() || paths.hostapd_conf.empty() ||
                paths.hostapd_defaults.empty() || paths.dnsmasq_conf.empty())
            {
                errors.emplace_back("paths must not be empty");
            }

            if (access_point.channel < 1 || access_point.channel > 196)
            {
                errors.emplace_back("access_point.channel must be between 1 and 196");
            }

            if (dhcp.lease_time.empty())
            {
                errors.emplace_back("dhcp.lease_time must not be empty");
            }

            if (services.hostapd_settle_ms < 0 || services.dnsmasq_settle_ms < 0)
            {
                errors.emplace_back("services settle times must not be negative");
            }

            if (readiness.timeout_ms <= 0 || readiness.initial_interval_ms <= 0 ||
                readiness.max_interval_ms <= 0)
            {
                errors.emplace_back("readiness timeouts must be positive");
            }

            if (readiness.backoff_factor < 1.0)
            {
                errors.emplace_back("readiness.backoff_factor must be at least 1");
            }

            if (status.address_lines < 0)
            {
                errors.emplace_back("status.address_lines must not be negative");
            }

            return errors;
        }

    } // namespace core
} // namespace aprelay
