// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_COMMON_VARIANT_OVERLOADED_H_
#define BRANCHNET_SRC_UTIL_COMMON_VARIANT_OVERLOADED_H_

namespace branchnet {
    /// Combines lambdas into one visitor for std::visit, one lambda per
    /// alternative.
    /// \tparam Ts lambda types.
    template<class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };
    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}

#endif // BRANCHNET_SRC_UTIL_COMMON_VARIANT_OVERLOADED_H_
