#ifndef APRELAY_CORE_ROUTER_CONTROLLER_HPP
#define APRELAY_CORE_ROUTER_CONTROLLER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <ostream>

#include "infrastructure/daemon_config.hpp"
#include "infrastructure/link_manager.hpp"
#include "infrastructure/packet_filter.hpp"
#include "infrastructure/readiness_probe.hpp"
#include "infrastructure/service_supervisor.hpp"

namespace aprelay
{
    namespace core
    {
        class ToolSettings;
        class ProfileStore;
        class Prompter;
        class Logger;
        struct NetworkProfile;
    }
    namespace infrastructure
    {
        class CommandRunner;
    }
}

namespace aprelay
{
    namespace core
    {

        /**
         * Process exit status of an action
         */
        enum class ExitCode
        {
            SUCCESS = 0,
            INVALID_INVOCATION = 1, // Missing privilege, unknown action, unusable input
            MISSING_RESOURCE = 2    // Interface not found, no usable profile
        };

        /**
         * Router Controller
         * Turns the host into a Wi-Fi relay for its uplink and takes it down again.
         *
         * Every action re-reads the live system state and is safe to repeat. Steps
         * of start and stop are best effort: a failing step is logged and the
         * remaining steps still run, nothing is rolled back.
         */
        class RouterController
        {
        public:
            using Sleeper = std::function<void(std::chrono::milliseconds)>;

            RouterController(const ToolSettings &settings,
                             ProfileStore &store,
                             infrastructure::CommandRunner &runner,
                             Sleeper sleeper);

            // Asks for every parameter, re-asking until the answers are consistent.
            // Throws InputClosed when the input ends early.
            void collect(NetworkProfile &profile, Prompter &prompter) const;

            // collect() followed by saving the profile
            ExitCode interactive(NetworkProfile &profile, Prompter &prompter);

            ExitCode start(NetworkProfile &profile);
            ExitCode stop(NetworkProfile &profile);
            ExitCode status(const NetworkProfile &profile, std::ostream &out) const;

        private:
            // Start steps
            void assign_address(const NetworkProfile &profile);
            void write_daemon_configs(const NetworkProfile &profile);
            void start_access_point(const NetworkProfile &profile);
            void wait_for_access_point(const NetworkProfile &profile);
            void start_dhcp_server();
            void install_rules(const NetworkProfile &profile);
            void open_forward_policy(NetworkProfile &profile);

            // Stop steps
            void release_address(const NetworkProfile &profile);
            void remove_rules(const NetworkProfile &profile);
            void restore_forward_policy(NetworkProfile &profile);

            void persist_rules(bool quiet);
            bool save_profile(const NetworkProfile &profile);

            const ToolSettings &settings_;
            ProfileStore &store_;
            std::shared_ptr<Logger> logger_;

            // Collaborators
            infrastructure::LinkManager link_;
            infrastructure::ServiceSupervisor services_;
            infrastructure::PacketFilter firewall_;
            infrastructure::DaemonConfigWriter config_writer_;
            infrastructure::ReadinessProbe ap_probe_;
        };

    } // namespace core
} // namespace aprelay

#endif // APRELAY_CORE_ROUTER_CONTROLLER_HPP
