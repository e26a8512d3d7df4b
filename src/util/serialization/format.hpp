// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_SERIALIZATION_FORMAT_H_
#define BRANCHNET_SRC_UTIL_SERIALIZATION_FORMAT_H_

#include "serializer.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/// Wire and storage encoding shared by every message and record.
///
/// Integers are fixed width and big-endian. Booleans are one byte holding
/// 0 or 1. Strings and vectors carry a uint64 element count. Optionals
/// carry a presence flag and variants a uint8 alternative index. A length
/// that exceeds the remaining input fails the decode before anything is
/// allocated.
namespace branchnet {
    auto operator<<(serializer& ser, bool val) -> serializer&;
    /// Fails on any byte other than 0 or 1.
    auto operator>>(serializer& deser, bool& val) -> serializer&;

    auto operator<<(serializer& ser, const std::string& str) -> serializer&;
    auto operator>>(serializer& deser, std::string& str) -> serializer&;

    /// Empty types occupy no bytes.
    template<typename T>
    auto operator<<(serializer& ser, T /* val */)
        -> std::enable_if_t<std::is_empty_v<T>, serializer&> {
        return ser;
    }

    template<typename T>
    auto operator>>(serializer& deser, T& /* val */)
        -> std::enable_if_t<std::is_empty_v<T>, serializer&> {
        return deser;
    }

    template<typename T>
    auto operator<<(serializer& ser, T val)
        -> std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>,
                            serializer&> {
        using U = std::make_unsigned_t<T>;
        auto bits = static_cast<U>(val);
        auto bytes = std::array<uint8_t, sizeof(T)>{};
        for(auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
            *it = static_cast<uint8_t>(bits & 0xffU);
            if constexpr(sizeof(T) > 1) {
                bits = static_cast<U>(bits >> 8U);
            }
        }
        ser.write(bytes.data(), bytes.size());
        return ser;
    }

    template<typename T>
    auto operator>>(serializer& deser, T& val)
        -> std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>,
                            serializer&> {
        using U = std::make_unsigned_t<T>;
        auto bytes = std::array<uint8_t, sizeof(T)>{};
        if(!deser.read(bytes.data(), bytes.size())) {
            return deser;
        }
        U bits{0};
        for(const auto b : bytes) {
            if constexpr(sizeof(T) > 1) {
                bits = static_cast<U>(bits << 8U);
            }
            bits = static_cast<U>(bits | b);
        }
        val = static_cast<T>(bits);
        return deser;
    }

    /// Enums travel as their underlying integer. Callers that need a
    /// range check do it after decoding.
    template<typename T>
    auto operator<<(serializer& ser, T val)
        -> std::enable_if_t<std::is_enum_v<T>, serializer&> {
        return ser << static_cast<std::underlying_type_t<T>>(val);
    }

    template<typename T>
    auto operator>>(serializer& deser, T& val)
        -> std::enable_if_t<std::is_enum_v<T>, serializer&> {
        auto raw = std::underlying_type_t<T>{};
        if(deser >> raw) {
            val = static_cast<T>(raw);
        }
        return deser;
    }

    template<typename T>
    auto operator<<(serializer& ser, const std::optional<T>& val)
        -> serializer& {
        ser << val.has_value();
        if(val.has_value()) {
            ser << *val;
        }
        return ser;
    }

    template<typename T>
    auto operator>>(serializer& deser, std::optional<T>& val) -> serializer& {
        bool present{false};
        if(!(deser >> present)) {
            return deser;
        }
        if(!present) {
            val.reset();
            return deser;
        }
        auto inner = T{};
        if(deser >> inner) {
            val = std::move(inner);
        }
        return deser;
    }

    template<typename A, typename B>
    auto operator<<(serializer& ser, const std::pair<A, B>& p) -> serializer& {
        return ser << p.first << p.second;
    }

    template<typename A, typename B>
    auto operator>>(serializer& deser, std::pair<A, B>& p) -> serializer& {
        return deser >> p.first >> p.second;
    }

    template<typename T>
    auto operator<<(serializer& ser, const std::vector<T>& vec)
        -> serializer& {
        ser << static_cast<uint64_t>(vec.size());
        for(const auto& elem : vec) {
            ser << elem;
        }
        return ser;
    }

    /// Every element occupies at least one byte, so a count larger than
    /// the remaining input is rejected up front.
    template<typename T>
    auto operator>>(serializer& deser, std::vector<T>& vec) -> serializer& {
        static_assert(!std::is_empty_v<T>);
        uint64_t count{0};
        if(!(deser >> count)) {
            return deser;
        }
        if(count > deser.remaining()) {
            deser.invalidate();
            return deser;
        }
        vec.clear();
        vec.reserve(static_cast<size_t>(count));
        for(uint64_t i{0}; i < count; i++) {
            auto elem = T{};
            if(!(deser >> elem)) {
                return deser;
            }
            vec.push_back(std::move(elem));
        }
        return deser;
    }

    namespace detail {
        /// Default-constructs alternative idx of the variant in place and
        /// decodes into it. Fails the serializer if idx is out of range.
        template<size_t I, typename... Ts>
        void decode_alternative(serializer& deser,
                                size_t idx,
                                std::variant<Ts...>& var) {
            if constexpr(I < sizeof...(Ts)) {
                if(idx != I) {
                    decode_alternative<I + 1>(deser, idx, var);
                    return;
                }
                deser >> var.template emplace<I>();
            } else {
                deser.invalidate();
            }
        }
    }

    template<typename... Ts>
    auto operator<<(serializer& ser, const std::variant<Ts...>& var)
        -> serializer& {
        static_assert(sizeof...(Ts) <= std::numeric_limits<uint8_t>::max());
        ser << static_cast<uint8_t>(var.index());
        std::visit(
            [&](const auto& alt) {
                ser << alt;
            },
            var);
        return ser;
    }

    template<typename... Ts>
    auto operator>>(serializer& deser, std::variant<Ts...>& var)
        -> serializer& {
        uint8_t idx{0};
        if(deser >> idx) {
            detail::decode_alternative<0>(deser, idx, var);
        }
        return deser;
    }
}

#endif // BRANCHNET_SRC_UTIL_SERIALIZATION_FORMAT_H_
