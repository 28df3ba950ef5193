#ifndef APRELAY_INFRASTRUCTURE_PACKET_FILTER_HPP
#define APRELAY_INFRASTRUCTURE_PACKET_FILTER_HPP

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace aprelay
{
    namespace core
    {
        struct NetworkProfile;
        class Logger;
    }
    namespace infrastructure
    {
        class CommandRunner;
    }
}

namespace aprelay
{
    namespace infrastructure
    {

        /**
         * One rule of an iptables chain, in the shape `iptables -S` prints it
         */
        struct FirewallRule
        {
            std::string table = "filter";
            std::string chain;
            std::string in_interface;
            std::string out_interface;
            std::set<std::string> states; // conntrack states, e.g. RELATED,ESTABLISHED
            std::string target;
            std::vector<std::string> extra; // Any other match, kept verbatim

            // Parses an "-A CHAIN ..." line; other lines yield nothing
            static std::optional<FirewallRule> parse(const std::string &table, const std::string &line);

            // Rule specification following "-A CHAIN"
            std::vector<std::string> to_arguments() const;
            std::string describe() const;

            // Semantic equality: "-m state --state" and "-m conntrack --ctstate"
            // are the same match, and state order is irrelevant
            bool operator==(const FirewallRule &other) const;
            bool operator!=(const FirewallRule &other) const { return !(*this == other); }
        };

        enum class RuleChange
        {
            ADDED,
            REMOVED,
            UNCHANGED, // Already present for ensure, already absent for remove
            FAILED
        };

        enum class PersistOutcome
        {
            SAVED,
            UNAVAILABLE,
            FAILED
        };

        /**
         * Packet Filter
         * Structured access to the netfilter rule tables through iptables(8)
         */
        class PacketFilter
        {
        public:
            PacketFilter(CommandRunner &runner, std::string iptables_binary, std::string persistence_helper);

            // Rule table queries
            std::vector<FirewallRule> list_rules(const std::string &table, const std::string &chain) const;
            std::optional<std::string> chain_policy(const std::string &table, const std::string &chain) const;
            bool has_rule(const FirewallRule &rule) const;

            // Rule table updates, both idempotent
            RuleChange ensure_rule(const FirewallRule &rule);
            RuleChange remove_rule(const FirewallRule &rule);
            bool set_policy(const std::string &table, const std::string &chain, const std::string &policy);

            // Saves the live rule set with the persistence helper when it is installed
            PersistOutcome persist();

            // Human-readable listing with counters, for status reports
            std::string report(const std::string &table, const std::string &chain) const;

            // MASQUERADE on the uplink plus the two FORWARD accepts between the interfaces
            static std::vector<FirewallRule> bridge_rules(const core::NetworkProfile &profile);

        private:
            std::vector<std::string> dump_chain(const std::string &table, const std::string &chain) const;

            CommandRunner &runner_;
            std::string iptables_;
            std::string persistence_helper_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace aprelay

#endif // APRELAY_INFRASTRUCTURE_PACKET_FILTER_HPP
