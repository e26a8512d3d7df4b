// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.hpp"

#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace branchnet::logging {
    namespace {
        constexpr auto level_names = std::array<const char*, 6>{
            "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    }

    log::log(log_level level, std::string tag)
        : m_level(level),
          m_tag(std::move(tag)) {}

    auto log::prefix(log_level level) const -> std::string {
        using std::chrono::system_clock;
        const auto now = system_clock::now();
        const auto secs = system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<
                                std::chrono::milliseconds>(
                                now.time_since_epoch())
                                .count()
                          % 1000;
        auto local = std::tm();
        localtime_r(&secs, &local);

        auto out = std::ostringstream();
        out << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << millis << "] ["
            << std::setfill(' ') << std::left << std::setw(5)
            << level_names.at(static_cast<size_t>(level)) << ']';
        if(!m_tag.empty()) {
            out << " [" << m_tag << ']';
        }
        return out.str();
    }

    void log::emit(const std::string& line) {
        std::lock_guard<std::mutex> l(m_out_mut);
        std::cout << line << std::flush;
    }

    auto parse_loglevel(const std::string& name) -> std::optional<log_level> {
        for(size_t i{0}; i < level_names.size(); i++) {
            if(name == level_names.at(i)) {
                return static_cast<log_level>(i);
            }
        }
        return std::nullopt;
    }
}
