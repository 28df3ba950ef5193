#ifndef APRELAY_TESTS_FAKE_SYSTEM_HPP
#define APRELAY_TESTS_FAKE_SYSTEM_HPP

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "infrastructure/command_runner.hpp"

namespace aprelay
{
    namespace testing
    {

        /**
         * In-memory stand-in for ip, iw, sysctl, systemctl, iptables and the
         * rule persistence helper
         */
        class FakeSystem : public infrastructure::CommandRunner
        {
        public:
            struct Interface
            {
                std::vector<std::string> addresses;
                bool up = false;
                bool ap_mode = false;
            };

            struct Service
            {
                bool active = false;
                bool enabled = false;
                bool masked = false;
            };

            std::map<std::string, Interface> interfaces;
            std::map<std::string, Service> services;
            std::map<std::pair<std::string, std::string>, std::vector<std::string>> rules;
            std::map<std::pair<std::string, std::string>, std::string> policies;
            std::set<std::string> programs;
            std::set<std::string> missing_programs; // run() reports these as not found
            std::set<std::string> failing_units; // systemctl enable fails for these
            bool ip_forward = false;
            bool supports_iw = true;
            int ap_mode_after_checks = 0; // iw reports AP only after this many queries
            int rule_saves = 0;

            std::vector<std::vector<std::string>> history;
            std::vector<std::vector<std::string>> mutations;
            std::vector<std::vector<std::string>> spawned;

            FakeSystem()
            {
                for (const char *chain : {"INPUT", "FORWARD", "OUTPUT"})
                {
                    policies[{"filter", chain}] = "ACCEPT";
                }
                for (const char *chain : {"PREROUTING", "INPUT", "OUTPUT", "POSTROUTING"})
                {
                    policies[{"nat", chain}] = "ACCEPT";
                }
                services["hostapd"];
                services["dnsmasq"];
            }

            void add_interface(const std::string &name)
            {
                interfaces[name];
            }

            std::vector<std::string> &chain(const std::string &table, const std::string &chain_name)
            {
                return rules[{table, chain_name}];
            }

            size_t rule_count(const std::string &table, const std::string &chain_name) const
            {
                auto it = rules.find({table, chain_name});
                return it == rules.end() ? 0 : it->second.size();
            }

            infrastructure::CommandResult run(const std::vector<std::string> &argv) override
            {
                history.push_back(argv);
                if (argv.empty())
                {
                    return fail(-1);
                }

                const std::string &program = argv[0];
                if (missing_programs.count(program))
                    return fail(infrastructure::COMMAND_NOT_FOUND);
                if (program == "ip")
                    return run_ip(argv);
                if (program == "iw")
                    return run_iw(argv);
                if (program == "sysctl")
                    return run_sysctl(argv);
                if (program == "systemctl")
                    return run_systemctl(argv);
                if (program == "iptables")
                    return run_iptables(argv);
                if (program == "netfilter-persistent" && programs.count(program))
                {
                    mutations.push_back(argv);
                    ++rule_saves;
                    return ok();
                }
                return fail(infrastructure::COMMAND_NOT_FOUND);
            }

            bool spawn_detached(const std::vector<std::string> &argv) override
            {
                history.push_back(argv);
                mutations.push_back(argv);
                spawned.push_back(argv);
                if (!argv.empty() && argv[0] == "hostapd")
                {
                    for (auto &[name, interface] : interfaces)
                    {
                        interface.ap_mode = true;
                    }
                }
                return true;
            }

            bool has_program(const std::string &name) const override
            {
                return programs.count(name) > 0;
            }

        private:
            static infrastructure::CommandResult ok(const std::string &output = "")
            {
                return infrastructure::CommandResult{0, output};
            }

            static infrastructure::CommandResult fail(int code = 1)
            {
                return infrastructure::CommandResult{code, ""};
            }

            static bool has(const std::vector<std::string> &argv, size_t index, const std::string &value)
            {
                return argv.size() > index && argv[index] == value;
            }

            Interface *find_interface(const std::string &name)
            {
                auto it = interfaces.find(name);
                return it == interfaces.end() ? nullptr : &it->second;
            }

            infrastructure::CommandResult run_ip(const std::vector<std::string> &argv)
            {
                // ip link show dev X
                if (has(argv, 1, "link") && has(argv, 2, "show") && has(argv, 3, "dev") && argv.size() == 5)
                {
                    return find_interface(argv[4]) ? ok(argv[4] + ": <BROADCAST,MULTICAST>\n") : fail();
                }
                // ip link set X up
                if (has(argv, 1, "link") && has(argv, 2, "set") && has(argv, 4, "up"))
                {
                    auto *interface = find_interface(argv[3]);
                    if (!interface)
                        return fail();
                    mutations.push_back(argv);
                    interface->up = true;
                    return ok();
                }
                // ip -o -4 addr show dev X
                if (has(argv, 1, "-o") && has(argv, 2, "-4") && has(argv, 3, "addr") && has(argv, 5, "dev"))
                {
                    auto *interface = find_interface(argv[6]);
                    if (!interface)
                        return fail();
                    std::ostringstream out;
                    for (const auto &address : interface->addresses)
                    {
                        out << "3: " << argv[6] << "    inet " << address << " scope global " << argv[6]
                            << "\\       valid_lft forever preferred_lft forever\n";
                    }
                    return ok(out.str());
                }
                // ip addr show X
                if (has(argv, 1, "addr") && has(argv, 2, "show") && argv.size() == 4)
                {
                    auto *interface = find_interface(argv[3]);
                    if (!interface)
                        return fail();
                    std::ostringstream out;
                    out << "3: " << argv[3] << ": <BROADCAST,MULTICAST" << (interface->up ? ",UP" : "") << "> mtu 1500\n";
                    out << "    link/ether 00:11:22:33:44:55 brd ff:ff:ff:ff:ff:ff\n";
                    for (const auto &address : interface->addresses)
                    {
                        out << "    inet " << address << " scope global " << argv[3] << "\n";
                        out << "       valid_lft forever preferred_lft forever\n";
                    }
                    return ok(out.str());
                }
                // ip addr add|del CIDR dev X
                if (has(argv, 1, "addr") && (has(argv, 2, "add") || has(argv, 2, "del")) && has(argv, 4, "dev"))
                {
                    auto *interface = find_interface(argv[5]);
                    if (!interface)
                        return fail();
                    auto &addresses = interface->addresses;
                    auto it = std::find(addresses.begin(), addresses.end(), argv[3]);
                    if (argv[2] == "add")
                    {
                        if (it != addresses.end())
                            return fail(2);
                        mutations.push_back(argv);
                        addresses.push_back(argv[3]);
                        return ok();
                    }
                    if (it == addresses.end())
                        return fail(2);
                    mutations.push_back(argv);
                    addresses.erase(it);
                    return ok();
                }
                return fail();
            }

            infrastructure::CommandResult run_iw(const std::vector<std::string> &argv)
            {
                if (!supports_iw || !has(argv, 1, "dev") || !has(argv, 3, "info"))
                {
                    return fail();
                }
                auto *interface = find_interface(argv[2]);
                if (!interface)
                    return fail();

                bool ap = interface->ap_mode;
                if (ap && ap_mode_after_checks > 0)
                {
                    --ap_mode_after_checks;
                    ap = false;
                }
                std::ostringstream out;
                out << "Interface " << argv[2] << "\n";
                out << "\tifindex 3\n";
                out << "\ttype " << (ap ? "AP" : "managed") << "\n";
                return ok(out.str());
            }

            infrastructure::CommandResult run_sysctl(const std::vector<std::string> &argv)
            {
                if (has(argv, 1, "-w") && has(argv, 2, "net.ipv4.ip_forward=1"))
                {
                    mutations.push_back(argv);
                    ip_forward = true;
                    return ok("net.ipv4.ip_forward = 1\n");
                }
                return fail();
            }

            infrastructure::CommandResult run_systemctl(const std::vector<std::string> &argv)
            {
                if (argv.size() < 3)
                    return fail();

                const std::string &verb = argv[1];
                const std::string &unit = argv.back() == "--no-pager" ? argv[2] : argv.back();
                auto it = services.find(unit);

                if (verb == "status")
                {
                    if (it == services.end())
                        return fail(4);
                    std::string state = it->second.active ? "active (running)" : "inactive (dead)";
                    return infrastructure::CommandResult{it->second.active ? 0 : 3,
                                                         "* " + unit + ".service\n   Active: " + state + "\n"};
                }

                if (it == services.end())
                    return fail(5);

                if (verb == "unmask")
                {
                    mutations.push_back(argv);
                    it->second.masked = false;
                    return ok();
                }
                if (verb == "enable" && has(argv, 2, "--now"))
                {
                    if (failing_units.count(unit) || it->second.masked)
                        return fail();
                    mutations.push_back(argv);
                    it->second.enabled = true;
                    it->second.active = true;
                    if (unit == "hostapd")
                    {
                        for (auto &[name, interface] : interfaces)
                        {
                            interface.ap_mode = true;
                        }
                    }
                    return ok();
                }
                if (verb == "stop")
                {
                    mutations.push_back(argv);
                    it->second.active = false;
                    if (unit == "hostapd")
                    {
                        for (auto &[name, interface] : interfaces)
                        {
                            interface.ap_mode = false;
                        }
                    }
                    return ok();
                }
                return fail();
            }

            infrastructure::CommandResult run_iptables(const std::vector<std::string> &argv)
            {
                if (argv.size() < 5 || argv[1] != "-t")
                    return fail(2);

                const std::string &table = argv[2];
                const std::string &op = argv[3];
                const std::string &chain_name = argv[4];
                auto policy = policies.find({table, chain_name});
                if (policy == policies.end())
                    return fail(1);

                auto &entries = rules[{table, chain_name}];

                if (op == "-S")
                {
                    std::ostringstream out;
                    out << "-P " << chain_name << " " << policy->second << "\n";
                    for (const auto &entry : entries)
                    {
                        out << entry << "\n";
                    }
                    return ok(out.str());
                }
                if (op == "-L")
                {
                    std::ostringstream out;
                    out << "Chain " << chain_name << " (policy " << policy->second << " 0 packets, 0 bytes)\n";
                    out << " pkts bytes target     prot opt in     out     source               destination\n";
                    for (const auto &entry : entries)
                    {
                        out << "    0     0 " << entry << "\n";
                    }
                    return ok(out.str());
                }
                if (op == "-A")
                {
                    std::string line = "-A " + chain_name;
                    for (size_t i = 5; i < argv.size(); ++i)
                    {
                        line += " " + argv[i];
                    }
                    mutations.push_back(argv);
                    entries.push_back(line);
                    return ok();
                }
                if (op == "-D" && argv.size() == 6)
                {
                    size_t position = std::stoul(argv[5]);
                    if (position < 1 || position > entries.size())
                        return fail(1);
                    mutations.push_back(argv);
                    entries.erase(entries.begin() + static_cast<long>(position - 1));
                    return ok();
                }
                if (op == "-P" && argv.size() == 6)
                {
                    mutations.push_back(argv);
                    policy->second = argv[5];
                    return ok();
                }
                return fail(2);
            }
        };

    } // namespace testing
} // namespace aprelay

#endif // APRELAY_TESTS_FAKE_SYSTEM_HPP
