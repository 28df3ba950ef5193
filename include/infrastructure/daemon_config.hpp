#ifndef APRELAY_INFRASTRUCTURE_DAEMON_CONFIG_HPP
#define APRELAY_INFRASTRUCTURE_DAEMON_CONFIG_HPP

#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace aprelay
{
    namespace core
    {
        struct NetworkProfile;
        class ToolSettings;
        class Logger;
    }
}

namespace aprelay
{
    namespace infrastructure
    {

        /**
         * Daemon Config Writer
         * Generates the hostapd and dnsmasq configuration files, keeping a
         * timestamped copy of whatever was there before
         */
        class DaemonConfigWriter
        {
        public:
            explicit DaemonConfigWriter(const core::ToolSettings &settings);

            // Config rendering
            std::string render_hostapd_config(const core::NetworkProfile &profile) const;
            std::string render_dnsmasq_config(const core::NetworkProfile &profile) const;

            // Config files; false when the file could not be written
            bool write_hostapd_config(const core::NetworkProfile &profile) const;
            bool write_dnsmasq_config(const core::NetworkProfile &profile) const;

            // Points DAEMON_CONF in the hostapd defaults file at the generated config
            bool point_hostapd_defaults() const;

        private:
            bool write_with_backup(const std::filesystem::path &path, const std::string &content, bool owner_only) const;

            const core::ToolSettings &settings_;
            std::shared_ptr<core::Logger> logger_;
        };

        // Copies path to <path>.bak.<timestamp>, adding .N when that name is taken.
        // Returns the backup path, or nothing when path does not exist.
        std::optional<std::filesystem::path> backup_file(const std::filesystem::path &path,
                                                         std::time_t timestamp = std::time(nullptr));

    } // namespace infrastructure
} // namespace aprelay

#endif // APRELAY_INFRASTRUCTURE_DAEMON_CONFIG_HPP
