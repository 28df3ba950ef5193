#ifndef APRELAY_CORE_NETWORK_PROFILE_HPP
#define APRELAY_CORE_NETWORK_PROFILE_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace aprelay
{
    namespace core
    {

        /**
         * Raised when a stored profile exists but cannot be read back
         */
        class ProfileError : public std::runtime_error
        {
        public:
            using std::runtime_error::runtime_error;
        };

        /**
         * Network parameters chosen by the operator and reused by every action
         */
        struct NetworkProfile
        {
            static constexpr const char *DEFAULT_SSID = "MonWifi";
            static constexpr const char *DEFAULT_PASSPHRASE = "ChangeMe1234";
            static constexpr const char *DEFAULT_AP_HOST = "192.168.50.1";
            static constexpr int DEFAULT_AP_PREFIX = 24;
            static constexpr const char *DEFAULT_DHCP_START = "192.168.50.10";
            static constexpr const char *DEFAULT_DHCP_END = "192.168.50.50";

            std::string internet_interface;
            std::string wireless_interface;
            std::string ssid;
            std::string passphrase;
            std::string ap_address; // a.b.c.d/prefix
            std::string dhcp_range_start;
            std::string dhcp_range_end;

            // Set when start switched the FORWARD policy from DROP to ACCEPT
            bool forward_policy_overridden = false;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;

            // Interface names are known
            bool is_configured() const;

            // Host part of ap_address, or ap_address itself when it has no prefix
            std::string ap_host() const;

            // Fills every optional field that is still empty with its default
            void apply_defaults();

            // Returns one message per invalid field, empty when usable
            std::vector<std::string> validate() const;
            std::vector<std::string> validate_passphrase() const;
            std::vector<std::string> validate_addressing() const;
        };

        /**
         * Reads and writes the profile file
         */
        class ProfileStore
        {
        public:
            explicit ProfileStore(std::string path);

            // Empty when no profile has been saved yet
            std::optional<NetworkProfile> load() const;

            // Writes atomically with owner-only permissions
            void save(const NetworkProfile &profile) const;

            const std::string &path() const { return path_; }

        private:
            std::string path_;
        };

    } // namespace core
} // namespace aprelay

#endif // APRELAY_CORE_NETWORK_PROFILE_HPP
