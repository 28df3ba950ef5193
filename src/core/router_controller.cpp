/**
 * Router Controller Implementation
 * Sequences the link, daemon and packet filter steps of the Wi-Fi relay
 */

#include "core/router_controller.hpp"
#include "core/logger.hpp"
#include "core/network_profile.hpp"
#include "core/prompt.hpp"
#include "core/settings.hpp"
#include "infrastructure/command_runner.hpp"

#include <filesystem>
#include <utility>

namespace aprelay
{
    namespace core
    {

        namespace
        {
            infrastructure::ReadinessPolicy readiness_policy(const ReadinessSettings &settings)
            {
                infrastructure::ReadinessPolicy policy;
                policy.timeout = std::chrono::milliseconds(settings.timeout_ms);
                policy.initial_interval = std::chrono::milliseconds(settings.initial_interval_ms);
                policy.backoff_factor = settings.backoff_factor;
                policy.max_interval = std::chrono::milliseconds(settings.max_interval_ms);
                return policy;
            }

            void print_errors(Prompter &prompter, const std::vector<std::string> &errors)
            {
                for (const auto &error : errors)
                {
                    prompter.say("  " + error);
                }
            }
        }

        RouterController::RouterController(const ToolSettings &settings,
                                           ProfileStore &store,
                                           infrastructure::CommandRunner &runner,
                                           Sleeper sleeper)
            : settings_(settings),
              store_(store),
              logger_(get_logger("RouterController")),
              link_(runner),
              services_(runner, sleeper),
              firewall_(runner, settings.services.iptables_binary, settings.services.persistence_helper),
              config_writer_(settings),
              ap_probe_(readiness_policy(settings.readiness), sleeper)
        {
        }

        void RouterController::collect(NetworkProfile &profile, Prompter &prompter) const
        {
            NetworkProfile answers = profile;
            answers.apply_defaults();

            answers.internet_interface = prompter.ask_required("Internet interface (uplink, e.g. eth0)");
            while (true)
            {
                answers.wireless_interface = prompter.ask_required("Wi-Fi interface to run the access point on (e.g. wlan0)");
                if (answers.wireless_interface != answers.internet_interface)
                {
                    break;
                }
                prompter.say("  The Wi-Fi interface must differ from the Internet interface.");
            }

            while (true)
            {
                std::string ssid = prompter.ask("Network name (SSID)", answers.ssid);
                if (ssid.size() <= 32)
                {
                    answers.ssid = ssid;
                    break;
                }
                prompter.say("  The SSID must be at most 32 characters.");
            }

            while (true)
            {
                // A rejected answer must not become the next default
                NetworkProfile candidate = answers;
                candidate.passphrase = prompter.ask("WPA2 passphrase (8 to 63 characters)", answers.passphrase);
                auto errors = candidate.validate_passphrase();
                if (errors.empty())
                {
                    answers.passphrase = candidate.passphrase;
                    break;
                }
                print_errors(prompter, errors);
            }

            while (true)
            {
                std::string prefix = "24";
                auto slash = answers.ap_address.find('/');
                if (slash != std::string::npos)
                {
                    prefix = answers.ap_address.substr(slash + 1);
                }

                std::string host = prompter.ask("Access point address (gateway)", answers.ap_host());
                answers.ap_address = host.find('/') == std::string::npos ? host + "/" + prefix : host;
                answers.dhcp_range_start = prompter.ask("DHCP range start", answers.dhcp_range_start);
                answers.dhcp_range_end = prompter.ask("DHCP range end", answers.dhcp_range_end);

                auto errors = answers.validate_addressing();
                if (errors.empty())
                {
                    break;
                }
                print_errors(prompter, errors);
            }

            profile = answers;
        }

        ExitCode RouterController::interactive(NetworkProfile &profile, Prompter &prompter)
        {
            try
            {
                collect(profile, prompter);
            }
            catch (const InputClosed &)
            {
                logger_->error("Input ended before the configuration was complete, nothing saved");
                return ExitCode::INVALID_INVOCATION;
            }

            if (!save_profile(profile))
            {
                return ExitCode::INVALID_INVOCATION;
            }
            return ExitCode::SUCCESS;
        }

        ExitCode RouterController::start(NetworkProfile &profile)
        {
            profile.apply_defaults();

            auto errors = profile.validate();
            if (!errors.empty())
            {
                for (const auto &error : errors)
                {
                    logger_->error("Invalid configuration", LogContext().add("reason", error).add("profile", store_.path()));
                }
                return ExitCode::MISSING_RESOURCE;
            }

            if (!link_.interface_exists(profile.internet_interface))
            {
                logger_->error("Internet interface not found, check the name and retry",
                               LogContext().add("interface", profile.internet_interface));
                return ExitCode::MISSING_RESOURCE;
            }
            if (!link_.interface_exists(profile.wireless_interface))
            {
                logger_->error("Wi-Fi interface not found, check the name and retry",
                               LogContext().add("interface", profile.wireless_interface));
                return ExitCode::MISSING_RESOURCE;
            }

            assign_address(profile);

            if (!link_.set_link_up(profile.wireless_interface))
            {
                logger_->warning("Failed to bring interface up", LogContext().add("interface", profile.wireless_interface));
            }

            logger_->info("Enabling IP forwarding");
            if (!link_.enable_ip_forwarding())
            {
                logger_->warning("Failed to enable IP forwarding");
            }

            write_daemon_configs(profile);
            start_access_point(profile);
            wait_for_access_point(profile);
            start_dhcp_server();
            install_rules(profile);
            open_forward_policy(profile);
            persist_rules(false);
            save_profile(profile);

            logger_->info("Relay started, the network should now be visible", LogContext().add("ssid", profile.ssid));
            return ExitCode::SUCCESS;
        }

        ExitCode RouterController::stop(NetworkProfile &profile)
        {
            if (!profile.is_configured())
            {
                logger_->error("No configuration found, cannot stop cleanly. Run 'interactive' first.");
                return ExitCode::MISSING_RESOURCE;
            }

            logger_->info("Stopping relay");

            services_.stop(settings_.services.dnsmasq_unit);
            services_.stop(settings_.services.hostapd_unit);

            release_address(profile);
            remove_rules(profile);
            restore_forward_policy(profile);
            persist_rules(true);

            logger_->info("Relay stopped");
            return ExitCode::SUCCESS;
        }

        ExitCode RouterController::status(const NetworkProfile &profile, std::ostream &out) const
        {
            if (!profile.is_configured())
            {
                logger_->error("No configuration found. Run 'interactive' first.");
                return ExitCode::MISSING_RESOURCE;
            }

            out << "=== Relay status ===\n";
            out << "Internet interface: " << profile.internet_interface << "\n";
            out << "Wi-Fi interface: " << profile.wireless_interface << "\n";
            out << "\n";
            out << link_.address_summary(profile.wireless_interface, settings_.status.address_lines);
            out << "\n";
            out << settings_.services.hostapd_unit << " status:\n";
            out << services_.status_report(settings_.services.hostapd_unit);
            out << "\n";
            out << settings_.services.dnsmasq_unit << " status:\n";
            out << services_.status_report(settings_.services.dnsmasq_unit);
            out << "\n";
            out << "POSTROUTING (nat):\n";
            out << firewall_.report("nat", "POSTROUTING");
            out << "\n";
            out << "FORWARD (filter):\n";
            out << firewall_.report("filter", "FORWARD");
            out.flush();

            return ExitCode::SUCCESS;
        }

        void RouterController::assign_address(const NetworkProfile &profile)
        {
            logger_->info("Assigning static address",
                          LogContext().add("interface", profile.wireless_interface).add("address", profile.ap_address));

            if (link_.has_address(profile.wireless_interface, profile.ap_host()))
            {
                logger_->info("Address already present", LogContext().add("interface", profile.wireless_interface));
                return;
            }

            if (!link_.add_address(profile.wireless_interface, profile.ap_address))
            {
                logger_->warning("Failed to add address (maybe already present)",
                                 LogContext().add("interface", profile.wireless_interface));
            }
        }

        void RouterController::write_daemon_configs(const NetworkProfile &profile)
        {
            if (!config_writer_.write_hostapd_config(profile))
            {
                logger_->warning("Access point config not written", LogContext().add("file", settings_.paths.hostapd_conf));
            }
            if (!config_writer_.point_hostapd_defaults())
            {
                logger_->warning("hostapd defaults not updated", LogContext().add("file", settings_.paths.hostapd_defaults));
            }
            if (!config_writer_.write_dnsmasq_config(profile))
            {
                logger_->warning("DHCP config not written", LogContext().add("file", settings_.paths.dnsmasq_conf));
            }
        }

        void RouterController::start_access_point(const NetworkProfile &profile)
        {
            const auto &services = settings_.services;
            logger_->info("Starting access point daemon", LogContext().add("unit", services.hostapd_unit));

            services_.unmask(services.hostapd_unit);
            auto outcome = services_.start_with_fallback(services.hostapd_unit,
                                                         {services.hostapd_binary, settings_.paths.hostapd_conf},
                                                         std::chrono::milliseconds(services.hostapd_settle_ms));
            if (outcome == infrastructure::ServiceStart::FAILED)
            {
                logger_->warning("Access point daemon could not be started",
                                 LogContext().add("interface", profile.wireless_interface));
            }
        }

        void RouterController::wait_for_access_point(const NetworkProfile &profile)
        {
            const std::string &interface = profile.wireless_interface;

            auto result = ap_probe_.wait_until(
                [this, &interface]()
                { return link_.is_access_point_mode(interface); },
                [this, &interface](int attempt, std::chrono::milliseconds waited)
                {
                    logger_->info("Waiting for AP mode",
                                  LogContext()
                                      .add("interface", interface)
                                      .add("attempt", attempt)
                                      .add("waited_ms", waited.count()));
                });

            if (result.ready)
            {
                logger_->info("Interface is in AP mode",
                              LogContext().add("interface", interface).add("attempts", result.attempts));
            }
            else
            {
                logger_->warning("Interface did not report AP mode in time, continuing",
                                 LogContext()
                                     .add("interface", interface)
                                     .add("timeout_ms", ap_probe_.policy().timeout.count()));
            }
        }

        void RouterController::start_dhcp_server()
        {
            const auto &services = settings_.services;
            logger_->info("Starting DHCP server", LogContext().add("unit", services.dnsmasq_unit));

            auto outcome = services_.start_with_fallback(services.dnsmasq_unit,
                                                         {services.dnsmasq_binary, "--conf-file=" + settings_.paths.dnsmasq_conf},
                                                         std::chrono::milliseconds(services.dnsmasq_settle_ms));
            if (outcome == infrastructure::ServiceStart::FAILED)
            {
                logger_->warning("DHCP server could not be started");
            }
        }

        void RouterController::install_rules(const NetworkProfile &profile)
        {
            logger_->info("Configuring NAT");

            for (const auto &rule : infrastructure::PacketFilter::bridge_rules(profile))
            {
                switch (firewall_.ensure_rule(rule))
                {
                case infrastructure::RuleChange::ADDED:
                    logger_->info("Rule added", LogContext().add("rule", rule.describe()));
                    break;
                case infrastructure::RuleChange::UNCHANGED:
                    logger_->info("Rule already present", LogContext().add("rule", rule.describe()));
                    break;
                case infrastructure::RuleChange::FAILED:
                case infrastructure::RuleChange::REMOVED:
                    logger_->warning("Rule not installed", LogContext().add("rule", rule.describe()));
                    break;
                }
            }
        }

        void RouterController::open_forward_policy(NetworkProfile &profile)
        {
            auto policy = firewall_.chain_policy("filter", "FORWARD");
            if (!policy || *policy != "DROP")
            {
                return;
            }

            logger_->warning("FORWARD policy is DROP, setting it to ACCEPT so traffic can be routed");
            if (firewall_.set_policy("filter", "FORWARD", "ACCEPT"))
            {
                profile.forward_policy_overridden = true;
            }
            else
            {
                logger_->warning("Failed to change FORWARD policy");
            }
        }

        void RouterController::release_address(const NetworkProfile &profile)
        {
            if (!link_.has_address(profile.wireless_interface, profile.ap_host()))
            {
                logger_->info("Address not present",
                              LogContext().add("interface", profile.wireless_interface).add("address", profile.ap_host()));
                return;
            }

            if (!link_.remove_address(profile.wireless_interface, profile.ap_address))
            {
                logger_->warning("Failed to remove address (already removed?)",
                                 LogContext().add("interface", profile.wireless_interface));
            }
        }

        void RouterController::remove_rules(const NetworkProfile &profile)
        {
            for (const auto &rule : infrastructure::PacketFilter::bridge_rules(profile))
            {
                if (firewall_.remove_rule(rule) == infrastructure::RuleChange::REMOVED)
                {
                    logger_->info("Rule removed", LogContext().add("rule", rule.describe()));
                }
            }
        }

        void RouterController::restore_forward_policy(NetworkProfile &profile)
        {
            if (!profile.forward_policy_overridden)
            {
                return;
            }

            if (!settings_.firewall.restore_forward_policy_on_stop)
            {
                logger_->info("FORWARD policy left at ACCEPT, restoring it is up to the operator");
                return;
            }

            if (!firewall_.set_policy("filter", "FORWARD", "DROP"))
            {
                logger_->warning("Failed to restore FORWARD policy to DROP");
                return;
            }

            logger_->info("FORWARD policy restored to DROP");
            profile.forward_policy_overridden = false;
            save_profile(profile);
        }

        void RouterController::persist_rules(bool quiet)
        {
            switch (firewall_.persist())
            {
            case infrastructure::PersistOutcome::SAVED:
                logger_->info("Packet filter rules saved");
                break;
            case infrastructure::PersistOutcome::UNAVAILABLE:
                if (!quiet)
                {
                    logger_->warning("Rule persistence helper not installed, rules will not survive a reboot",
                                     LogContext().add("helper", settings_.services.persistence_helper));
                }
                break;
            case infrastructure::PersistOutcome::FAILED:
                if (!quiet)
                {
                    logger_->warning("Failed to save packet filter rules");
                }
                break;
            }
        }

        bool RouterController::save_profile(const NetworkProfile &profile)
        {
            try
            {
                store_.save(profile);
                logger_->info("Configuration saved", LogContext().add("file", store_.path()));
                return true;
            }
            catch (const ProfileError &e)
            {
                logger_->error("Failed to save configuration", LogContext().add("error", e.what()));
            }
            catch (const std::filesystem::filesystem_error &e)
            {
                logger_->error("Failed to save configuration", LogContext().add("error", e.what()));
            }
            return false;
        }

    } // namespace core
} // namespace aprelay
