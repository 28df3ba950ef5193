/**
 * Daemon Config Writer Implementation
 * Renders hostapd and dnsmasq configuration for the relay's access point
 */

#include "infrastructure/daemon_config.hpp"
#include "core/ipv4.hpp"
#include "core/logger.hpp"
#include "core/network_profile.hpp"
#include "core/settings.hpp"

#include <fstream>
#include <sstream>
#include <vector>

namespace aprelay
{
    namespace infrastructure
    {

        namespace fs = std::filesystem;

        std::optional<fs::path> backup_file(const fs::path &path, std::time_t timestamp)
        {
            std::error_code ec;
            if (!fs::exists(path, ec))
            {
                return std::nullopt;
            }

            fs::path backup = path;
            backup += ".bak." + std::to_string(timestamp);
            for (int n = 1; fs::exists(backup, ec); ++n)
            {
                backup = path;
                backup += ".bak." + std::to_string(timestamp) + "." + std::to_string(n);
            }

            fs::copy_file(path, backup, fs::copy_options::none);
            return backup;
        }

        DaemonConfigWriter::DaemonConfigWriter(const core::ToolSettings &settings)
            : settings_(settings), logger_(core::get_logger("DaemonConfigWriter"))
        {
        }

        std::string DaemonConfigWriter::render_hostapd_config(const core::NetworkProfile &profile) const
        {
            const auto &ap = settings_.access_point;

            std::ostringstream config;
            config << "interface=" << profile.wireless_interface << "\n";
            config << "driver=" << ap.driver << "\n";
            config << "ssid=" << profile.ssid << "\n";
            if (!ap.country_code.empty())
            {
                config << "country_code=" << ap.country_code << "\n";
            }
            config << "hw_mode=" << ap.hw_mode << "\n";
            config << "channel=" << ap.channel << "\n";
            config << "wmm_enabled=1\n";
            config << "macaddr_acl=0\n";
            config << "auth_algs=1\n";
            config << "ignore_broadcast_ssid=" << (ap.hide_ssid ? 1 : 0) << "\n";

            // WPA2-PSK with AES-CCMP only
            config << "wpa=2\n";
            config << "wpa_passphrase=" << profile.passphrase << "\n";
            config << "wpa_key_mgmt=WPA-PSK\n";
            config << "rsn_pairwise=CCMP\n";
            return config.str();
        }

        std::string DaemonConfigWriter::render_dnsmasq_config(const core::NetworkProfile &profile) const
        {
            const auto &dhcp = settings_.dhcp;

            std::string netmask = "255.255.255.0";
            if (auto ap = core::Ipv4Interface::parse(profile.ap_address))
            {
                netmask = ap->netmask_string();
            }

            std::ostringstream config;
            config << "interface=" << profile.wireless_interface << "\n";
            config << "bind-interfaces\n";
            config << "dhcp-range=" << profile.dhcp_range_start << "," << profile.dhcp_range_end << ","
                   << netmask << "," << dhcp.lease_time << "\n";
            config << "dhcp-option=3," << profile.ap_host() << "\n";
            if (!dhcp.dns_servers.empty())
            {
                config << "dhcp-option=6";
                for (const auto &server : dhcp.dns_servers)
                {
                    config << "," << server;
                }
                config << "\n";
            }
            return config.str();
        }

        bool DaemonConfigWriter::write_hostapd_config(const core::NetworkProfile &profile) const
        {
            // The hostapd config carries the passphrase
            return write_with_backup(settings_.paths.hostapd_conf, render_hostapd_config(profile), true);
        }

        bool DaemonConfigWriter::write_dnsmasq_config(const core::NetworkProfile &profile) const
        {
            return write_with_backup(settings_.paths.dnsmasq_conf, render_dnsmasq_config(profile), false);
        }

        bool DaemonConfigWriter::point_hostapd_defaults() const
        {
            const fs::path defaults_path = settings_.paths.hostapd_defaults;
            const std::string directive = "DAEMON_CONF=\"" + settings_.paths.hostapd_conf + "\"";

            try
            {
                std::vector<std::string> lines;
                bool replaced = false;

                std::error_code ec;
                if (fs::exists(defaults_path, ec))
                {
                    std::ifstream in(defaults_path);
                    if (!in)
                    {
                        logger_->error("Cannot read hostapd defaults", core::LogContext().add("file", defaults_path.string()));
                        return false;
                    }

                    std::string line;
                    while (std::getline(in, line))
                    {
                        if (line.rfind("DAEMON_CONF=", 0) == 0)
                        {
                            line = directive;
                            replaced = true;
                        }
                        lines.push_back(line);
                    }
                }
                else if (defaults_path.has_parent_path())
                {
                    fs::create_directories(defaults_path.parent_path());
                }

                if (!replaced)
                {
                    lines.push_back(directive);
                }

                std::ofstream out(defaults_path, std::ios::trunc);
                for (const auto &line : lines)
                {
                    out << line << "\n";
                }
                out.flush();
                if (!out)
                {
                    logger_->error("Cannot write hostapd defaults", core::LogContext().add("file", defaults_path.string()));
                    return false;
                }

                logger_->debug("hostapd defaults updated",
                               core::LogContext().add("file", defaults_path.string()).add("replaced", replaced));
                return true;
            }
            catch (const fs::filesystem_error &e)
            {
                logger_->error("Error updating hostapd defaults", core::LogContext().add("error", e.what()));
                return false;
            }
        }

        bool DaemonConfigWriter::write_with_backup(const fs::path &path, const std::string &content, bool owner_only) const
        {
            const auto owner_rw = fs::perms::owner_read | fs::perms::owner_write;
            try
            {
                if (auto backup = backup_file(path))
                {
                    if (owner_only)
                    {
                        fs::permissions(*backup, owner_rw, fs::perm_options::replace);
                    }
                    logger_->warning("Backed up existing config",
                                     core::LogContext().add("file", path.string()).add("backup", backup->string()));
                }
                else if (path.has_parent_path())
                {
                    fs::create_directories(path.parent_path());
                }

                std::ofstream out(path, std::ios::trunc);
                if (!out)
                {
                    logger_->error("Cannot create config file", core::LogContext().add("file", path.string()));
                    return false;
                }
                if (owner_only)
                {
                    fs::permissions(path, owner_rw, fs::perm_options::replace);
                }
                out << content;
                out.flush();
                if (!out)
                {
                    logger_->error("Failed to write config file", core::LogContext().add("file", path.string()));
                    return false;
                }

                logger_->info("Config written", core::LogContext().add("file", path.string()));
                return true;
            }
            catch (const fs::filesystem_error &e)
            {
                logger_->error("Error writing config file", core::LogContext().add("error", e.what()));
                return false;
            }
        }

    } // namespace infrastructure
} // namespace aprelay
