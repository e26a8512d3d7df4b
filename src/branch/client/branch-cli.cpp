// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "client.hpp"
#include "util/common/config.hpp"

#include <iostream>

namespace {
    /// Time bound of a command. Covers the worst-case resolution time of an
    /// inter-branch transfer with the default retry schedule.
    constexpr auto command_timeout = std::chrono::seconds(120);

    auto parse_account(const std::string& str)
        -> std::optional<branchnet::ledger::account_no_t> {
        try {
            size_t pos{};
            auto val = std::stoull(str, &pos);
            if(pos != str.size()) {
                return std::nullopt;
            }
            return val;
        } catch(const std::exception& /* e */) {
            return std::nullopt;
        }
    }

    auto parse_amount(const std::string& str)
        -> std::optional<branchnet::ledger::amount_t> {
        try {
            size_t pos{};
            auto val = std::stoll(str, &pos);
            if(pos != str.size()) {
                return std::nullopt;
            }
            return val;
        } catch(const std::exception& /* e */) {
            return std::nullopt;
        }
    }

    void print_error(const branchnet::error& err) {
        std::cerr << branchnet::to_string(err.m_code);
        if(!err.m_message.empty()) {
            std::cerr << ": " << err.m_message;
        }
        std::cerr << std::endl;
    }

    void print_account(const branchnet::ledger::account& acc) {
        std::cout << acc.m_account_no << " " << acc.m_name
                  << " balance: " << acc.m_balance
                  << " reserved: " << acc.m_reserved;
        if(acc.m_reserved_by) {
            std::cout << " by " << acc.m_reserved_by.value();
        }
        std::cout << std::endl;
    }

    auto print_outcome(branchnet::coordinator::outcome out) -> std::string {
        switch(out) {
            case branchnet::coordinator::outcome::committed:
                return "COMMITTED";
            case branchnet::coordinator::outcome::aborted:
                return "ABORTED";
            case branchnet::coordinator::outcome::unresolved:
                return "UNRESOLVED";
        }
        return "UNKNOWN";
    }

    auto print_result(const branchnet::coordinator::result& res) -> bool {
        std::cout << res.m_tx_id << " " << print_outcome(res.m_outcome)
                  << std::endl;
        if(res.m_reason) {
            print_error(res.m_reason.value());
        }
        return res.m_outcome == branchnet::coordinator::outcome::committed;
    }

    auto print_account_result(
        const branchnet::branch::client::account_result& res) -> bool {
        if(auto* err = std::get_if<branchnet::error>(&res)) {
            print_error(*err);
            return false;
        }
        print_account(std::get<branchnet::ledger::account>(res));
        return true;
    }

    auto account_amount_command(branchnet::branch::client& cli,
                                const std::vector<std::string>& args)
        -> bool {
        static constexpr auto arg_count = 5;
        if(args.size() < arg_count) {
            std::cerr << args[2] << " requires args <account> <amount>"
                      << std::endl;
            return false;
        }
        auto account_no = parse_account(args[3]);
        auto amount = parse_amount(args[4]);
        if(!account_no || !amount) {
            std::cerr << "Invalid account number or amount" << std::endl;
            return false;
        }
        if(args[2] == "deposit") {
            return print_account_result(
                cli.deposit(account_no.value(), amount.value()));
        }
        return print_account_result(
            cli.withdraw(account_no.value(), amount.value()));
    }

    auto transfer_local_command(branchnet::branch::client& cli,
                                const std::vector<std::string>& args)
        -> bool {
        static constexpr auto arg_count = 6;
        if(args.size() < arg_count) {
            std::cerr << "transfer_local requires args <src account>"
                      << " <dst account> <amount>" << std::endl;
            return false;
        }
        auto src = parse_account(args[3]);
        auto dst = parse_account(args[4]);
        auto amount = parse_amount(args[5]);
        if(!src || !dst || !amount) {
            std::cerr << "Invalid account number or amount" << std::endl;
            return false;
        }
        auto res
            = cli.transfer_local(src.value(), dst.value(), amount.value());
        if(auto* err = std::get_if<branchnet::error>(&res)) {
            print_error(*err);
            return false;
        }
        const auto& accs
            = std::get<branchnet::branch::transfer_local_response>(res);
        print_account(accs.m_src_account);
        print_account(accs.m_dst_account);
        return true;
    }

    auto transfer_command(branchnet::branch::client& cli,
                          const std::vector<std::string>& args) -> bool {
        static constexpr auto arg_count = 7;
        static constexpr auto tx_id_arg = 7;
        if(args.size() < arg_count) {
            std::cerr << "transfer requires args <src account>"
                      << " <dst host:port> <dst account> <amount> [tx id]"
                      << std::endl;
            return false;
        }
        auto req = branchnet::branch::inter_branch_transfer_request();
        auto src = parse_account(args[3]);
        auto dst_ep = branchnet::config::parse_ip_port(args[4]);
        auto dst = parse_account(args[5]);
        auto amount = parse_amount(args[6]);
        if(!src || !dst_ep || !dst || !amount) {
            std::cerr << "Invalid transfer arguments" << std::endl;
            return false;
        }
        req.m_src_account = src.value();
        req.m_dst_endpoint = dst_ep.value();
        req.m_dst_account = dst.value();
        req.m_amount = amount.value();
        if(args.size() > tx_id_arg) {
            req.m_tx_id = args[tx_id_arg];
        }
        auto res = cli.inter_branch_transfer(std::move(req));
        if(auto* err = std::get_if<branchnet::error>(&res)) {
            print_error(*err);
            return false;
        }
        return print_result(std::get<branchnet::coordinator::result>(res));
    }

    auto list_accounts_command(branchnet::branch::client& cli) -> bool {
        auto res = cli.list_accounts();
        if(auto* err = std::get_if<branchnet::error>(&res)) {
            print_error(*err);
            return false;
        }
        for(const auto& acc :
            std::get<std::vector<branchnet::ledger::account>>(res)) {
            print_account(acc);
        }
        return true;
    }

    auto create_account_command(branchnet::branch::client& cli,
                                const std::vector<std::string>& args)
        -> bool {
        static constexpr auto arg_count = 6;
        if(args.size() < arg_count) {
            std::cerr << "create_account requires args <account> <name>"
                      << " <balance>" << std::endl;
            return false;
        }
        auto account_no = parse_account(args[3]);
        auto balance = parse_amount(args[5]);
        if(!account_no || !balance) {
            std::cerr << "Invalid account number or balance" << std::endl;
            return false;
        }
        return print_account_result(
            cli.create_account(account_no.value(), args[4], balance.value()));
    }

    auto list_unresolved_command(branchnet::branch::client& cli) -> bool {
        auto res = cli.list_unresolved();
        if(auto* err = std::get_if<branchnet::error>(&res)) {
            print_error(*err);
            return false;
        }
        for(const auto& rec :
            std::get<std::vector<branchnet::coordinator::record>>(res)) {
            std::cout << rec.m_tx_id << " " << rec.m_src_account << " -> "
                      << branchnet::network::to_string(rec.m_dst_endpoint)
                      << "/" << rec.m_dst_account << " " << rec.m_amount;
            if(rec.m_reason) {
                std::cout << " "
                          << branchnet::to_string(
                                 rec.m_reason->m_code);
            }
            std::cout << std::endl;
        }
        return true;
    }

    auto resolve_command(branchnet::branch::client& cli,
                         const std::vector<std::string>& args) -> bool {
        static constexpr auto arg_count = 4;
        if(args.size() < arg_count) {
            std::cerr << "resolve requires args <tx id>" << std::endl;
            return false;
        }
        auto res = cli.resolve_unresolved(args[3]);
        if(auto* err = std::get_if<branchnet::error>(&res)) {
            print_error(*err);
            return false;
        }
        return print_result(std::get<branchnet::coordinator::result>(res));
    }
}

// LCOV_EXCL_START
auto main(int argc, char** argv) -> int {
    auto args = branchnet::config::get_args(argc, argv);
    static constexpr auto min_arg_count = 3;
    if(args.size() < min_arg_count) {
        std::cerr << "Usage: " << args[0] << " <host:port> <command>"
                  << " <args...>" << std::endl
                  << "Commands: balance, deposit, withdraw, transfer_local,"
                  << " transfer, list_accounts, create_account,"
                  << " list_unresolved, resolve" << std::endl;
        return 0;
    }

    auto endpoint = branchnet::config::parse_ip_port(args[1]);
    if(!endpoint) {
        std::cerr << "Invalid branch endpoint: " << args[1] << std::endl;
        return -1;
    }

    auto logger = std::make_shared<branchnet::logging::log>(
        branchnet::config::defaults::log_level);

    auto cli = branchnet::branch::client(endpoint.value(),
                                         command_timeout,
                                         logger);
    if(!cli.init()) {
        std::cerr << "PEER_UNREACHABLE: could not connect to " << args[1]
                  << std::endl;
        return -1;
    }

    auto ok = false;
    const auto& command = args[2];
    if(command == "balance") {
        auto account_no
            = args.size() > min_arg_count ? parse_account(args[3])
                                          : std::nullopt;
        if(!account_no) {
            std::cerr << "balance requires args <account>" << std::endl;
            return -1;
        }
        ok = print_account_result(cli.balance(account_no.value()));
    } else if(command == "deposit" || command == "withdraw") {
        ok = account_amount_command(cli, args);
    } else if(command == "transfer_local") {
        ok = transfer_local_command(cli, args);
    } else if(command == "transfer") {
        ok = transfer_command(cli, args);
    } else if(command == "list_accounts") {
        ok = list_accounts_command(cli);
    } else if(command == "create_account") {
        ok = create_account_command(cli, args);
    } else if(command == "list_unresolved") {
        ok = list_unresolved_command(cli);
    } else if(command == "resolve") {
        ok = resolve_command(cli, args);
    } else {
        std::cerr << "Unknown command" << std::endl;
    }

    return ok ? 0 : -1;
}
// LCOV_EXCL_STOP
