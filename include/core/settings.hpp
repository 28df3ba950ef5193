#ifndef APRELAY_CORE_SETTINGS_HPP
#define APRELAY_CORE_SETTINGS_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace aprelay
{
    namespace core
    {

        /**
         * Raised when the tool settings file cannot be read or parsed
         */
        class SettingsError : public std::runtime_error
        {
        public:
            using std::runtime_error::runtime_error;
        };

        /**
         * Locations of the files the tool reads and writes
         */
        struct PathSettings
        {
            std::string profile_file = "/etc/aprelay/profile.json";
            std::string hostapd_conf = "/etc/hostapd/hostapd.conf";
            std::string hostapd_defaults = "/etc/default/hostapd";
            std::string dnsmasq_conf = "/etc/dnsmasq.d/router.conf";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Radio parameters written to the access point daemon config
         */
        struct AccessPointSettings
        {
            std::string driver = "nl80211";
            std::string hw_mode = "g";
            int channel = 6;
            std::string country_code; // Empty means not written
            bool hide_ssid = false;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Lease parameters written to the DHCP daemon config
         */
        struct DhcpSettings
        {
            std::string lease_time = "24h";
            std::vector<std::string> dns_servers = {"8.8.8.8", "8.8.4.4"};

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Service unit names, daemon binaries and helper programs
         */
        struct ServiceSettings
        {
            std::string hostapd_unit = "hostapd";
            std::string dnsmasq_unit = "dnsmasq";
            std::string hostapd_binary = "hostapd";
            std::string dnsmasq_binary = "dnsmasq";
            std::string persistence_helper = "netfilter-persistent";
            std::string iptables_binary = "iptables";
            int hostapd_settle_ms = 2000;
            int dnsmasq_settle_ms = 1000;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Polling policy used while waiting for the interface to enter AP mode
         */
        struct ReadinessSettings
        {
            int timeout_ms = 8000;
            int initial_interval_ms = 500;
            double backoff_factor = 1.5;
            int max_interval_ms = 2000;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        struct FirewallSettings
        {
            bool restore_forward_policy_on_stop = false;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        struct StatusSettings
        {
            int address_lines = 4;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        struct LoggingSettings
        {
            std::string log_level = "INFO";
            std::string log_file; // Empty means console output

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete tool configuration
         */
        class ToolSettings
        {
        public:
            PathSettings paths;
            AccessPointSettings access_point;
            DhcpSettings dhcp;
            ServiceSettings services;
            ReadinessSettings readiness;
            FirewallSettings firewall;
            StatusSettings status;
            LoggingSettings logging;

        public:
            static constexpr const char *DEFAULT_PATH = "/etc/aprelay/aprelay.json";

            // Factory methods
            static ToolSettings from_file(const std::string &settings_path);
            static ToolSettings from_json(const nlohmann::json &j);

            // Reads settings_path if it exists. A missing file is an error only when required.
            static ToolSettings load(const std::string &settings_path, bool required);

            nlohmann::json to_json() const;

            // Returns one message per invalid field, empty when usable
            std::vector<std::string> validate() const;
        };

    } // namespace core
} // namespace aprelay

#endif // APRELAY_CORE_SETTINGS_HPP
