// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

namespace branchnet {
    auto operator<<(serializer& ser, bool val) -> serializer& {
        return ser << static_cast<uint8_t>(val ? 1 : 0);
    }

    auto operator>>(serializer& deser, bool& val) -> serializer& {
        uint8_t raw{0};
        if(!(deser >> raw)) {
            return deser;
        }
        if(raw > 1) {
            deser.invalidate();
            return deser;
        }
        val = raw == 1;
        return deser;
    }

    auto operator<<(serializer& ser, const std::string& str) -> serializer& {
        ser << static_cast<uint64_t>(str.size());
        ser.write(str.data(), str.size());
        return ser;
    }

    auto operator>>(serializer& deser, std::string& str) -> serializer& {
        uint64_t len{0};
        if(!(deser >> len)) {
            return deser;
        }
        if(len > deser.remaining()) {
            deser.invalidate();
            return deser;
        }
        auto out = std::string(static_cast<size_t>(len), '\0');
        if(deser.read(out.data(), out.size())) {
            str = std::move(out);
        }
        return deser;
    }
}
