// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BRANCHNET_SRC_UTIL_COMMON_LOGGING_H_
#define BRANCHNET_SRC_UTIL_COMMON_LOGGING_H_

#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace branchnet::logging {
    /// Severity of a log statement, least severe first. A logger prints
    /// statements at or above its configured level.
    enum class log_level : uint8_t {
        trace,
        debug,
        info,
        warn,
        error,
        /// Unrecoverable. The process exits after logging.
        fatal
    };

    /// Thread-safe logger writing one line per statement to stdout. Lines
    /// start with a local timestamp, the level and the optional tag, and
    /// the statement arguments follow separated by spaces.
    class log {
      public:
        /// \param level least severe level to print.
        /// \param tag printed on every line, typically the branch name.
        ///            Empty for none.
        explicit log(log_level level, std::string tag = "");

        template<typename... Targs>
        void trace(Targs&&... args) {
            write(log_level::trace, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void debug(Targs&&... args) {
            write(log_level::debug, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void info(Targs&&... args) {
            write(log_level::info, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void warn(Targs&&... args) {
            write(log_level::warn, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void error(Targs&&... args) {
            write(log_level::error, std::forward<Targs>(args)...);
        }

        /// Logs regardless of the configured level and exits the process
        /// with EXIT_FAILURE.
        template<typename... Targs>
        [[noreturn]] void fatal(Targs&&... args) {
            emit(format(log_level::fatal, std::forward<Targs>(args)...));
            std::exit(EXIT_FAILURE);
        }

      private:
        const log_level m_level;
        const std::string m_tag;
        std::mutex m_out_mut;

        template<typename... Targs>
        void write(log_level level, Targs&&... args) {
            if(level < m_level) {
                return;
            }
            emit(format(level, std::forward<Targs>(args)...));
        }

        template<typename... Targs>
        auto format(log_level level, Targs&&... args) const -> std::string {
            auto line = std::ostringstream();
            line << prefix(level);
            ((line << ' ' << std::forward<Targs>(args)), ...);
            line << '\n';
            return line.str();
        }

        [[nodiscard]] auto prefix(log_level level) const -> std::string;
        void emit(const std::string& line);
    };

    /// Reads an upper-case level name such as "WARN".
    /// \param name level name.
    /// \return the level, or std::nullopt for an unknown name.
    auto parse_loglevel(const std::string& name) -> std::optional<log_level>;
}

#endif // BRANCHNET_SRC_UTIL_COMMON_LOGGING_H_
