// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_set>

namespace branchnet::config {
    auto parse_ip_port(const std::string& in_str)
        -> std::optional<network::endpoint_t> {
        const auto sep = in_str.rfind(':');
        if(sep == std::string::npos || sep == 0 || sep + 1 == in_str.size()) {
            return std::nullopt;
        }
        auto host = in_str.substr(0, sep);
        const auto port_str = in_str.substr(sep + 1);
        if(!std::all_of(port_str.begin(), port_str.end(), [](char c) {
               return c >= '0' && c <= '9';
           })) {
            return std::nullopt;
        }
        static constexpr auto max_port_digits = 5;
        if(port_str.size() > max_port_digits) {
            return std::nullopt;
        }
        auto port = std::stoul(port_str);
        if(port > std::numeric_limits<unsigned short>::max()) {
            return std::nullopt;
        }
        return network::endpoint_t{std::move(host),
                                   static_cast<unsigned short>(port)};
    }

    auto get_branch_key(size_t branch_id, const std::string& postfix)
        -> std::string {
        std::stringstream ss;
        ss << branch_prefix << branch_id << config_separator << postfix;
        return ss.str();
    }

    auto read_branch_options(options& opts, const parser& cfg)
        -> std::optional<std::string> {
        const auto branch_count = cfg.get_ulong(branch_count_key).value_or(0);
        for(size_t i{0}; i < branch_count; i++) {
            const auto name_key = get_branch_key(i, name_postfix);
            const auto name = cfg.get_string(name_key);
            if(!name) {
                return "No name specified for branch " + std::to_string(i)
                     + " (" + name_key + ")";
            }
            opts.m_branch_names.push_back(*name);

            const auto ep_key = get_branch_key(i, endpoint_postfix);
            const auto ep = cfg.get_endpoint(ep_key);
            if(!ep) {
                return "No valid endpoint specified for branch "
                     + std::to_string(i) + " (" + ep_key + ")";
            }
            opts.m_branch_endpoints.push_back(*ep);

            const auto db_key = get_branch_key(i, db_postfix);
            const auto db = cfg.get_string(db_key);
            if(!db) {
                return "No db directory specified for branch "
                     + std::to_string(i) + " (" + db_key + ")";
            }
            opts.m_branch_db_dirs.push_back(*db);

            const auto loglevel_key = get_branch_key(i, loglevel_postfix);
            const auto loglevel
                = cfg.get_loglevel(loglevel_key).value_or(defaults::log_level);
            opts.m_branch_loglevels.push_back(loglevel);

            const auto preload_key = get_branch_key(i, preload_postfix);
            opts.m_branch_preload.push_back(
                cfg.get_ulong(preload_key).value_or(0) != 0);
        }
        return std::nullopt;
    }

    auto read_protocol_options(options& opts, const parser& cfg)
        -> std::optional<std::string> {
        opts.m_prepare_timeout_ms = cfg.get_ulong(prepare_timeout_key)
                                        .value_or(opts.m_prepare_timeout_ms);
        opts.m_commit_retry_attempts
            = cfg.get_ulong(commit_retry_attempts_key)
                  .value_or(opts.m_commit_retry_attempts);
        opts.m_commit_retry_initial_delay_ms
            = cfg.get_ulong(commit_retry_initial_delay_key)
                  .value_or(opts.m_commit_retry_initial_delay_ms);
        opts.m_commit_retry_max_delay_ms
            = cfg.get_ulong(commit_retry_max_delay_key)
                  .value_or(opts.m_commit_retry_max_delay_ms);
        opts.m_rpc_call_timeout_ms = cfg.get_ulong(rpc_call_timeout_key)
                                         .value_or(opts.m_rpc_call_timeout_ms);
        opts.m_participant_deadline_ms
            = cfg.get_ulong(participant_deadline_key)
                  .value_or(opts.m_participant_deadline_ms);
        opts.m_participant_sweep_interval_ms
            = cfg.get_ulong(participant_sweep_interval_key)
                  .value_or(opts.m_participant_sweep_interval_ms);
        opts.m_resolved_retention_ms
            = cfg.get_ulong(resolved_retention_key)
                  .value_or(opts.m_resolved_retention_ms);
        opts.m_server_threads = cfg.get_ulong(server_threads_key)
                                    .value_or(opts.m_server_threads);

        const auto policy = cfg.get_string(participant_recovery_key);
        if(policy.has_value()) {
            if(*policy == "abort") {
                opts.m_participant_recovery = recovery_policy::abort;
            } else if(*policy == "hold") {
                opts.m_participant_recovery = recovery_policy::hold;
            } else {
                return "Unknown participant recovery policy \"" + *policy
                     + "\" (" + participant_recovery_key + ")";
            }
        }
        return std::nullopt;
    }

    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        auto opts = options{};
        auto cfg = parser(config_file);
        if(!cfg) {
            return "Unable to read config file " + config_file;
        }

        auto err = read_branch_options(opts, cfg);
        if(err.has_value()) {
            return err.value();
        }

        err = read_protocol_options(opts, cfg);
        if(err.has_value()) {
            return err.value();
        }

        return opts;
    }

    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        auto opt = read_options(config_file);
        if(std::holds_alternative<options>(opt)) {
            auto res = check_options(std::get<options>(opt));
            if(res) {
                return *res;
            }
        }
        return opt;
    }

    auto worst_case_resolution_ms(const options& opts) -> size_t {
        auto total = opts.m_prepare_timeout_ms;
        auto delay = opts.m_commit_retry_initial_delay_ms;
        for(size_t i{0}; i < opts.m_commit_retry_attempts; i++) {
            total += opts.m_rpc_call_timeout_ms;
            if(i + 1 < opts.m_commit_retry_attempts) {
                total += delay;
                delay = std::min(delay * 2, opts.m_commit_retry_max_delay_ms);
            }
        }
        return total;
    }

    auto check_options(const options& opts) -> std::optional<std::string> {
        if(opts.m_branch_names.empty()) {
            return "At least one branch must be configured";
        }

        auto names = std::unordered_set<std::string>();
        for(const auto& name : opts.m_branch_names) {
            if(name.empty()) {
                return "Branch names must not be empty";
            }
            if(!names.insert(name).second) {
                return "Duplicate branch name \"" + name + "\"";
            }
        }

        if(opts.m_prepare_timeout_ms == 0) {
            return "The prepare timeout must be greater than zero";
        }
        if(opts.m_commit_retry_attempts == 0) {
            return "At least one commit delivery attempt is required";
        }
        if(opts.m_commit_retry_max_delay_ms
           < opts.m_commit_retry_initial_delay_ms) {
            return "The maximum commit retry delay is smaller than the "
                   "initial delay";
        }
        if(opts.m_participant_sweep_interval_ms == 0) {
            return "The participant sweep interval must be greater than zero";
        }

        const auto resolution = worst_case_resolution_ms(opts);
        if(opts.m_participant_deadline_ms <= resolution) {
            return "The participant deadline ("
                 + std::to_string(opts.m_participant_deadline_ms)
                 + "ms) must exceed the worst-case coordinator resolution "
                   "time ("
                 + std::to_string(resolution) + "ms)";
        }

        return std::nullopt;
    }

    auto get_args(int argc, char** argv) -> std::vector<std::string> {
        auto args = std::vector<char*>(static_cast<size_t>(argc));
        std::memcpy(args.data(),
                    argv,
                    static_cast<size_t>(argc) * sizeof(argv));
        auto ret = std::vector<std::string>();
        ret.reserve(static_cast<size_t>(argc));
        for(auto* arg : args) {
            ret.emplace_back(arg);
        }
        return ret;
    }

    parser::parser(const std::string& filename) {
        std::ifstream file(filename);
        if(!file.good()) {
            m_valid = false;
            return;
        }
        init(file);
    }

    parser::parser(std::istream& stream) {
        init(stream);
    }

    parser::operator bool() const {
        return m_valid;
    }

    void parser::init(std::istream& stream) {
        std::string line;
        while(std::getline(stream, line)) {
            if(line.empty() || line[0] == '#') {
                continue;
            }
            std::istringstream line_stream(line);
            std::string key;
            std::string value;
            if(!std::getline(line_stream, key, '=')
               || !std::getline(line_stream, value)) {
                m_valid = false;
                continue;
            }
            auto parsed = parse_value(value);
            if(!parsed.has_value()) {
                m_valid = false;
                continue;
            }
            m_options.emplace(key, std::move(parsed.value()));
        }
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        return get_val<std::string>(key);
    }

    auto parser::get_ulong(const std::string& key) const
        -> std::optional<size_t> {
        return get_val<size_t>(key);
    }

    auto parser::get_endpoint(const std::string& key) const
        -> std::optional<network::endpoint_t> {
        const auto val_str = get_string(key);
        if(!val_str.has_value()) {
            return std::nullopt;
        }
        return parse_ip_port(val_str.value());
    }

    auto parser::get_loglevel(const std::string& key) const
        -> std::optional<logging::log_level> {
        const auto val_str = get_string(key);
        if(!val_str.has_value()) {
            return std::nullopt;
        }
        return logging::parse_loglevel(val_str.value());
    }

    auto parser::find_or_env(const std::string& key) const
        -> std::optional<value_t> {
        auto upper_key = key;
        std::transform(upper_key.begin(),
                       upper_key.end(),
                       upper_key.begin(),
                       [](unsigned char c) {
                           return std::toupper(c);
                       });
        if(const auto* env_v = std::getenv(upper_key.c_str())) {
            return parse_value(std::string(env_v));
        }

        auto it = m_options.find(key);
        if(it != m_options.end()) {
            return it->second;
        }

        return std::nullopt;
    }

    auto parser::parse_value(const std::string& value)
        -> std::optional<value_t> {
        if(value.empty()) {
            return std::nullopt;
        }
        if(value.size() >= 2 && value.front() == '\"'
           && value.back() == '\"') {
            return value.substr(1, value.size() - 2);
        }
        try {
            auto pos = size_t{};
            const auto as_int = std::stoull(value, &pos);
            if(pos != value.size()) {
                return std::nullopt;
            }
            return static_cast<size_t>(as_int);
        } catch(const std::logic_error&) {
            return std::nullopt;
        }
    }
}
