/**
 * Packet Filter Implementation
 * Reads iptables chains as rule descriptors and applies idempotent changes
 */

#include "infrastructure/packet_filter.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"
#include "core/network_profile.hpp"

#include <sstream>
#include <utility>

namespace aprelay
{
    namespace infrastructure
    {

        namespace
        {
            // Splits an `iptables -S` line, keeping double-quoted words together
            std::vector<std::string> tokenize(const std::string &line)
            {
                std::vector<std::string> tokens;
                std::string current;
                bool quoted = false;
                bool in_token = false;

                for (char c : line)
                {
                    if (c == '"')
                    {
                        quoted = !quoted;
                        in_token = true;
                        continue;
                    }
                    if (!quoted && (c == ' ' || c == '\t' || c == '\r'))
                    {
                        if (in_token)
                        {
                            tokens.push_back(current);
                            current.clear();
                            in_token = false;
                        }
                        continue;
                    }
                    current += c;
                    in_token = true;
                }
                if (in_token)
                {
                    tokens.push_back(current);
                }
                return tokens;
            }

            std::set<std::string> split_states(const std::string &value)
            {
                std::set<std::string> states;
                std::istringstream stream(value);
                std::string state;
                while (std::getline(stream, state, ','))
                {
                    if (!state.empty())
                    {
                        states.insert(state);
                    }
                }
                return states;
            }
        }

        std::optional<FirewallRule> FirewallRule::parse(const std::string &table, const std::string &line)
        {
            auto tokens = tokenize(line);
            if (tokens.size() < 2 || tokens[0] != "-A")
            {
                return std::nullopt;
            }

            FirewallRule rule;
            rule.table = table;
            rule.chain = tokens[1];

            for (size_t i = 2; i < tokens.size(); ++i)
            {
                const std::string &token = tokens[i];
                bool has_value = i + 1 < tokens.size();

                if (token == "!")
                {
                    // Negated match: keep the operator, option and value together
                    rule.extra.push_back(token);
                    if (has_value)
                        rule.extra.push_back(tokens[++i]);
                    if (i + 1 < tokens.size())
                        rule.extra.push_back(tokens[++i]);
                }
                else if ((token == "-i" || token == "--in-interface") && has_value)
                {
                    rule.in_interface = tokens[++i];
                }
                else if ((token == "-o" || token == "--out-interface") && has_value)
                {
                    rule.out_interface = tokens[++i];
                }
                else if ((token == "-j" || token == "--jump") && has_value)
                {
                    rule.target = tokens[++i];
                }
                else if (token == "-c" && i + 2 < tokens.size())
                {
                    i += 2; // Packet and byte counters
                }
                else if (token == "-m" && has_value && (tokens[i + 1] == "state" || tokens[i + 1] == "conntrack"))
                {
                    ++i;
                }
                else if ((token == "--state" || token == "--ctstate") && has_value)
                {
                    auto states = split_states(tokens[++i]);
                    rule.states.insert(states.begin(), states.end());
                }
                else
                {
                    rule.extra.push_back(token);
                }
            }

            return rule;
        }

        std::vector<std::string> FirewallRule::to_arguments() const
        {
            std::vector<std::string> args;
            if (!in_interface.empty())
            {
                args.insert(args.end(), {"-i", in_interface});
            }
            if (!out_interface.empty())
            {
                args.insert(args.end(), {"-o", out_interface});
            }
            if (!states.empty())
            {
                std::string joined;
                for (const auto &state : states)
                {
                    if (!joined.empty())
                        joined += ",";
                    joined += state;
                }
                args.insert(args.end(), {"-m", "state", "--state", joined});
            }
            args.insert(args.end(), extra.begin(), extra.end());
            if (!target.empty())
            {
                args.insert(args.end(), {"-j", target});
            }
            return args;
        }

        std::string FirewallRule::describe() const
        {
            return "-t " + table + " -A " + chain + " " + format_command(to_arguments());
        }

        bool FirewallRule::operator==(const FirewallRule &other) const
        {
            return table == other.table &&
                   chain == other.chain &&
                   in_interface == other.in_interface &&
                   out_interface == other.out_interface &&
                   states == other.states &&
                   target == other.target &&
                   extra == other.extra;
        }

        PacketFilter::PacketFilter(CommandRunner &runner, std::string iptables_binary, std::string persistence_helper)
            : runner_(runner),
              iptables_(std::move(iptables_binary)),
              persistence_helper_(std::move(persistence_helper)),
              logger_(core::get_logger("PacketFilter"))
        {
        }

        std::vector<std::string> PacketFilter::dump_chain(const std::string &table, const std::string &chain) const
        {
            auto result = runner_.run({iptables_, "-t", table, "-S", chain});

            std::vector<std::string> lines;
            if (!result.ok())
            {
                logger_->warning("Failed to list chain", core::LogContext().add("table", table).add("chain", chain));
                return lines;
            }

            std::istringstream stream(result.output);
            std::string line;
            while (std::getline(stream, line))
            {
                if (!line.empty())
                {
                    lines.push_back(line);
                }
            }
            return lines;
        }

        std::vector<FirewallRule> PacketFilter::list_rules(const std::string &table, const std::string &chain) const
        {
            std::vector<FirewallRule> rules;
            for (const auto &line : dump_chain(table, chain))
            {
                if (auto rule = FirewallRule::parse(table, line))
                {
                    rules.push_back(std::move(*rule));
                }
            }
            return rules;
        }

        std::optional<std::string> PacketFilter::chain_policy(const std::string &table, const std::string &chain) const
        {
            for (const auto &line : dump_chain(table, chain))
            {
                auto tokens = tokenize(line);
                if (tokens.size() >= 3 && tokens[0] == "-P" && tokens[1] == chain)
                {
                    return tokens[2];
                }
            }
            return std::nullopt;
        }

        bool PacketFilter::has_rule(const FirewallRule &rule) const
        {
            for (const auto &existing : list_rules(rule.table, rule.chain))
            {
                if (existing == rule)
                {
                    return true;
                }
            }
            return false;
        }

        RuleChange PacketFilter::ensure_rule(const FirewallRule &rule)
        {
            for (const auto &line : dump_chain(rule.table, rule.chain))
            {
                auto existing = FirewallRule::parse(rule.table, line);
                if (existing && *existing == rule)
                {
                    logger_->debug("Rule already present", core::LogContext().add("rule", rule.describe()));
                    return RuleChange::UNCHANGED;
                }
            }

            std::vector<std::string> command = {iptables_, "-t", rule.table, "-A", rule.chain};
            auto spec = rule.to_arguments();
            command.insert(command.end(), spec.begin(), spec.end());

            if (!runner_.run(command).ok())
            {
                logger_->warning("Failed to add rule", core::LogContext().add("rule", rule.describe()));
                return RuleChange::FAILED;
            }

            logger_->debug("Rule added", core::LogContext().add("rule", rule.describe()));
            return RuleChange::ADDED;
        }

        RuleChange PacketFilter::remove_rule(const FirewallRule &rule)
        {
            // Rule numbers of every equivalent entry, deleted from the bottom up
            std::vector<int> positions;
            int position = 0;
            for (const auto &line : dump_chain(rule.table, rule.chain))
            {
                auto existing = FirewallRule::parse(rule.table, line);
                if (!existing)
                {
                    continue;
                }
                ++position;
                if (*existing == rule)
                {
                    positions.push_back(position);
                }
            }

            if (positions.empty())
            {
                logger_->debug("Rule already absent", core::LogContext().add("rule", rule.describe()));
                return RuleChange::UNCHANGED;
            }

            bool failed = false;
            for (auto it = positions.rbegin(); it != positions.rend(); ++it)
            {
                if (!runner_.run({iptables_, "-t", rule.table, "-D", rule.chain, std::to_string(*it)}).ok())
                {
                    logger_->warning("Failed to delete rule",
                                     core::LogContext().add("rule", rule.describe()).add("position", *it));
                    failed = true;
                }
            }

            return failed ? RuleChange::FAILED : RuleChange::REMOVED;
        }

        bool PacketFilter::set_policy(const std::string &table, const std::string &chain, const std::string &policy)
        {
            return runner_.run({iptables_, "-t", table, "-P", chain, policy}).ok();
        }

        PersistOutcome PacketFilter::persist()
        {
            if (persistence_helper_.empty() || !runner_.has_program(persistence_helper_))
            {
                return PersistOutcome::UNAVAILABLE;
            }

            if (!runner_.run({persistence_helper_, "save"}).ok())
            {
                return PersistOutcome::FAILED;
            }
            return PersistOutcome::SAVED;
        }

        std::string PacketFilter::report(const std::string &table, const std::string &chain) const
        {
            auto result = runner_.run({iptables_, "-t", table, "-L", chain, "-n", "-v"});
            if (!result.ok())
            {
                return "Unable to list " + table + "/" + chain + "\n";
            }
            return result.output;
        }

        std::vector<FirewallRule> PacketFilter::bridge_rules(const core::NetworkProfile &profile)
        {
            FirewallRule masquerade;
            masquerade.table = "nat";
            masquerade.chain = "POSTROUTING";
            masquerade.out_interface = profile.internet_interface;
            masquerade.target = "MASQUERADE";

            FirewallRule inbound;
            inbound.chain = "FORWARD";
            inbound.in_interface = profile.internet_interface;
            inbound.out_interface = profile.wireless_interface;
            inbound.states = {"RELATED", "ESTABLISHED"};
            inbound.target = "ACCEPT";

            FirewallRule outbound;
            outbound.chain = "FORWARD";
            outbound.in_interface = profile.wireless_interface;
            outbound.out_interface = profile.internet_interface;
            outbound.target = "ACCEPT";

            return {masquerade, inbound, outbound};
        }

    } // namespace infrastructure
} // namespace aprelay
