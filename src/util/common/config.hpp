// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file config.hpp
 * Tools for reading options from a configuration file and building the
 * parameter set used by the branch daemon and its components.
 */

#ifndef BRANCHNET_SRC_UTIL_COMMON_CONFIG_H_
#define BRANCHNET_SRC_UTIL_COMMON_CONFIG_H_

#include "logging.hpp"
#include "util/network/socket.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace branchnet::config {
    /// What a participant does with PREPARED records found at startup.
    enum class recovery_policy : uint8_t {
        /// Abort every PREPARED record without contacting the coordinator.
        abort,
        /// Keep PREPARED records until resolved or their deadline passes.
        hold
    };

    namespace defaults {
        static constexpr size_t prepare_timeout_ms{5000};
        static constexpr size_t commit_retry_attempts{8};
        static constexpr size_t commit_retry_initial_delay_ms{200};
        static constexpr size_t commit_retry_max_delay_ms{5000};
        static constexpr size_t rpc_call_timeout_ms{3000};
        static constexpr size_t participant_deadline_ms{120000};
        static constexpr size_t participant_sweep_interval_ms{1000};
        static constexpr size_t resolved_retention_ms{86400000};
        static constexpr size_t server_threads{32};
        static constexpr auto participant_recovery = recovery_policy::abort;
        static constexpr auto log_level = logging::log_level::warn;
    }

    static constexpr auto branch_prefix = "branch";
    static constexpr auto branch_count_key = "branch_count";
    static constexpr auto config_separator = "_";
    static constexpr auto name_postfix = "name";
    static constexpr auto endpoint_postfix = "endpoint";
    static constexpr auto db_postfix = "db";
    static constexpr auto loglevel_postfix = "loglevel";
    static constexpr auto preload_postfix = "preload";
    static constexpr auto prepare_timeout_key = "prepare_timeout_ms";
    static constexpr auto commit_retry_attempts_key = "commit_retry_attempts";
    static constexpr auto commit_retry_initial_delay_key
        = "commit_retry_initial_delay_ms";
    static constexpr auto commit_retry_max_delay_key
        = "commit_retry_max_delay_ms";
    static constexpr auto rpc_call_timeout_key = "rpc_call_timeout_ms";
    static constexpr auto participant_deadline_key = "participant_deadline_ms";
    static constexpr auto participant_sweep_interval_key
        = "participant_sweep_interval_ms";
    static constexpr auto participant_recovery_key = "participant_recovery";
    static constexpr auto resolved_retention_key = "resolved_retention_ms";
    static constexpr auto server_threads_key = "server_threads";

    /// Configuration options shared by every branch daemon. Per-branch
    /// values are ordered by branch index.
    struct options {
        /// Branch names, used as transaction ID prefixes and log tags.
        std::vector<std::string> m_branch_names;
        /// Endpoint each branch listens on for clients and peers.
        std::vector<network::endpoint_t> m_branch_endpoints;
        /// LevelDB directory holding each branch's ledger.
        std::vector<std::string> m_branch_db_dirs;
        /// Log level of each branch.
        std::vector<logging::log_level> m_branch_loglevels;
        /// Whether each branch creates its sample accounts when its ledger
        /// is empty at startup.
        std::vector<bool> m_branch_preload;
        /// Shared time bound for both prepare calls of a transfer.
        size_t m_prepare_timeout_ms{defaults::prepare_timeout_ms};
        /// Maximum commit or abort delivery attempts per participant.
        size_t m_commit_retry_attempts{defaults::commit_retry_attempts};
        /// Delay before the second delivery attempt. Doubles on each retry.
        size_t m_commit_retry_initial_delay_ms{
            defaults::commit_retry_initial_delay_ms};
        /// Upper bound of the delay between delivery attempts.
        size_t m_commit_retry_max_delay_ms{
            defaults::commit_retry_max_delay_ms};
        /// Time bound of a single commit or abort call to a peer.
        size_t m_rpc_call_timeout_ms{defaults::rpc_call_timeout_ms};
        /// Lifetime of a PREPARED participant record before it is aborted
        /// unilaterally.
        size_t m_participant_deadline_ms{defaults::participant_deadline_ms};
        /// Interval between deadline sweeps.
        size_t m_participant_sweep_interval_ms{
            defaults::participant_sweep_interval_ms};
        /// Handling of PREPARED records found at startup.
        recovery_policy m_participant_recovery{defaults::participant_recovery};
        /// How long COMMITTED and ABORTED records are kept to answer
        /// repeated commit or abort requests.
        size_t m_resolved_retention_ms{defaults::resolved_retention_ms};
        /// Maximum number of threads serving client requests.
        size_t m_server_threads{defaults::server_threads};
    };

    /// Reads options from a config file. Only checks that required keys
    /// are present and well formed.
    /// \param config_file path of the file.
    /// \return the options, or an error message.
    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Reads options from a config file and validates them with
    /// \ref check_options.
    /// \param config_file path of the file.
    /// \return the options, or an error message.
    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Checks a fully populated options struct for invariants. Assumes struct
    /// contains all required options.
    /// \param opts options struct to check.
    /// \return std::nullopt if the struct satisfies all invariants. Error
    ///         string otherwise.
    auto check_options(const options& opts) -> std::optional<std::string>;

    /// Longest time a coordinator may spend between deciding a transfer and
    /// giving up on delivering the decision, with the configured retry
    /// schedule.
    /// \param opts options to read the schedule from.
    /// \return worst-case resolution time in milliseconds, including the
    ///         prepare phase.
    auto worst_case_resolution_ms(const options& opts) -> size_t;

    /// Copies main's arguments into strings.
    auto get_args(int argc, char** argv) -> std::vector<std::string>;

    /// Key-value configuration source. Each non-empty line of the input
    /// not starting with '#' holds key=value, with a lower-case key. A
    /// value is either a double-quoted string or an unsigned integer.
    /// Endpoints ("host:port") and log levels ("WARN") are strings. An
    /// environment variable named after the upper-cased key takes
    /// precedence over the input, e.g. PREPARE_TIMEOUT_MS=8000. String
    /// values given that way keep their quotes: BRANCH0_NAME='"pune"'.
    class parser {
      public:
        /// Constructor.
        /// \param filename path to the config file to read.
        explicit parser(const std::string& filename);

        /// Constructor.
        /// \param stream the generic stream used to add config values.
        explicit parser(std::istream& stream);

        /// Returns false if the file could not be opened or a line was not
        /// a valid key=value pair.
        explicit operator bool() const;

        /// \return the string value of key, or std::nullopt if it is
        ///         missing or not a string.
        [[nodiscard]] auto get_string(const std::string& key) const
            -> std::optional<std::string>;

        /// \return the integer value of key, or std::nullopt if it is
        ///         missing or not an integer.
        [[nodiscard]] auto get_ulong(const std::string& key) const
            -> std::optional<size_t>;

        /// \return the endpoint held by key, or std::nullopt if it is
        ///         missing or not a "host:port" string.
        [[nodiscard]] auto get_endpoint(const std::string& key) const
            -> std::optional<network::endpoint_t>;

        /// \return the log level named by key, or std::nullopt if it is
        ///         missing or not a level name.
        [[nodiscard]] auto get_loglevel(const std::string& key) const
            -> std::optional<logging::log_level>;

      private:
        using value_t = std::variant<std::string, size_t>;

        [[nodiscard]] auto find_or_env(const std::string& key) const
            -> std::optional<value_t>;

        template<typename T>
        [[nodiscard]] auto get_val(const std::string& key) const
            -> std::optional<T> {
            const auto it = find_or_env(key);
            if(it) {
                const auto* val = std::get_if<T>(&it.value());
                if(val != nullptr) {
                    return *val;
                }
            }
            return std::nullopt;
        }

        void init(std::istream& stream);

        [[nodiscard]] static auto parse_value(const std::string& val)
            -> std::optional<value_t>;

        std::map<std::string, value_t> m_options;
        bool m_valid{true};
    };

    /// Parses a "host:port" string.
    /// \param in_str string to parse.
    /// \return endpoint, or std::nullopt if the string is not a host and a
    ///         port number separated by a colon.
    auto parse_ip_port(const std::string& in_str)
        -> std::optional<network::endpoint_t>;
}

#endif // BRANCHNET_SRC_UTIL_COMMON_CONFIG_H_
