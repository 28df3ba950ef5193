/**
 * aprelay
 * Turns a Linux host into a Wi-Fi access point relaying to its wired uplink
 */

#include <iostream>
#include <string>
#include <unistd.h>

#include "core/application.hpp"
#include "core/logger.hpp"
#include "core/settings.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/readiness_probe.hpp"

// Command line argument parsing
#include <getopt.h>

namespace aprelay
{

    void print_usage(const char *program_name)
    {
        std::cout << "aprelay - Wi-Fi access point relay\n\n";
        std::cout << core::Application::usage(program_name) << "\n";
        std::cout << "Actions:\n";
        std::cout << "  interactive              Ask for the network parameters and save them (default)\n";
        std::cout << "  start                    Configure the access point, DHCP and NAT\n";
        std::cout << "  stop                     Stop the daemons and remove the address and NAT rules\n";
        std::cout << "  status                   Show addresses, daemon status and NAT rules\n\n";
        std::cout << "Options:\n";
        std::cout << "  -c, --config FILE        Tool settings file (default: " << core::ToolSettings::DEFAULT_PATH << ")\n";
        std::cout << "  -v, --verbose            Increase verbosity (-v for INFO, -vv for DEBUG)\n";
        std::cout << "  -l, --log-file FILE      Log to file instead of console\n";
        std::cout << "  -h, --help               Show this help message\n";
        std::cout << "  --version                Show version information\n";
        std::cout << std::endl;
    }

    void print_version()
    {
        std::cout << "aprelay v0.1.0" << std::endl;
        std::cout << "Built for Linux (hostapd, dnsmasq, iptables, systemd)" << std::endl;
    }

    struct Arguments
    {
        std::string config_file;
        int verbosity = 0;
        std::string log_file;
        std::string action = "interactive";
        bool help = false;
        bool version = false;
        bool invalid = false;
    };

    Arguments parse_arguments(int argc, char *argv[])
    {
        Arguments args;

        static struct option long_options[] = {
            {"config", required_argument, 0, 'c'},
            {"verbose", no_argument, 0, 'v'},
            {"log-file", required_argument, 0, 'l'},
            {"help", no_argument, 0, 'h'},
            {"version", no_argument, 0, 0},
            {0, 0, 0, 0}};

        int c;
        int option_index = 0;

        while ((c = getopt_long(argc, argv, "c:vl:h", long_options, &option_index)) != -1)
        {
            switch (c)
            {
            case 'c':
                args.config_file = optarg;
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'l':
                args.log_file = optarg;
                break;
            case 'h':
                args.help = true;
                break;
            case 0:
                if (option_index == 4) // --version
                {
                    args.version = true;
                }
                break;
            default:
                // getopt_long already printed an error message
                args.invalid = true;
                break;
            }
        }

        if (optind < argc)
        {
            args.action = argv[optind++];
        }
        if (optind < argc)
        {
            std::cerr << "Unexpected argument: " << argv[optind] << std::endl;
            args.invalid = true;
        }

        return args;
    }

} // namespace aprelay

int main(int argc, char *argv[])
{
    using namespace aprelay;

    try
    {
        auto args = parse_arguments(argc, argv);

        if (args.invalid)
        {
            std::cerr << core::Application::usage(argv[0]);
            return static_cast<int>(core::ExitCode::INVALID_INVOCATION);
        }

        if (args.help)
        {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version)
        {
            print_version();
            return 0;
        }

        // Load tool settings; the default file is optional, an explicit one is not
        core::ToolSettings settings;
        bool explicit_config = !args.config_file.empty();
        std::string config_path = explicit_config ? args.config_file : core::ToolSettings::DEFAULT_PATH;
        try
        {
            settings = core::ToolSettings::load(config_path, explicit_config);
        }
        catch (const core::SettingsError &e)
        {
            std::cerr << "Failed to load settings: " << e.what() << std::endl;
            return static_cast<int>(core::ExitCode::INVALID_INVOCATION);
        }

        auto errors = settings.validate();
        if (!errors.empty())
        {
            for (const auto &error : errors)
            {
                std::cerr << "Settings validation error: " << error << std::endl;
            }
            return static_cast<int>(core::ExitCode::INVALID_INVOCATION);
        }

        // Setup logging
        bool privileged = geteuid() == 0;
        core::Application::configure_logging(settings, args.verbosity, args.log_file, privileged);

        infrastructure::SystemCommandRunner runner;
        core::Application app(settings, runner, infrastructure::sleep_for,
                              std::cin, std::cout, std::cerr, argv[0]);

        return static_cast<int>(app.run(args.action, privileged));
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
