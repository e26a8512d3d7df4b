// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "error.hpp"

#include <array>

namespace branchnet {
    auto error::operator==(const error& rhs) const -> bool {
        return m_code == rhs.m_code && m_message == rhs.m_message;
    }

    auto to_string(error_code code) -> std::string {
        static constexpr auto names = std::array<const char*, 10>{
            "NOT_FOUND",
            "INSUFFICIENT_FUNDS",
            "TX_CONFLICT",
            "TIMEOUT",
            "PEER_UNREACHABLE",
            "PROTOCOL_VIOLATION",
            "UNRESOLVED",
            "INVALID_ARGUMENT",
            "ACCOUNT_EXISTS",
            "STORAGE_FAILURE"};
        const auto idx = static_cast<size_t>(code);
        if(idx >= names.size()) {
            return "UNKNOWN";
        }
        return names[idx];
    }
}
