// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BTCRPC_SRC_UTIL_COMMON_LOGGING_H_
#define BTCRPC_SRC_UTIL_COMMON_LOGGING_H_

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace btcrpc::logging {
    /// Log file destination that discards everything. Used when the client
    /// only logs to stdout.
    class null_stream : public std::ostream {
      public:
        /// Constructor. Sets the instance's stream buffer to nullptr.
        null_stream();

        template<typename T>
        auto operator<<(const T& /* unused */) -> null_stream& {
            return *this;
        }
    };

    /// Log levels, lowest first. A logger prints statements at its own level
    /// and above. Set from the `loglevel` config key.
    enum class log_level : uint8_t {
        /// Request and response bodies, fully verbose.
        trace,
        /// Endpoint details, HTTP status codes and daemon-reported errors.
        debug,
        /// General information.
        info,
        /// Failed calls and unexpected responses.
        warn,
        /// Errors the caller is expected to act on.
        error,
        /// Unusable configuration, such as a malformed endpoint URL.
        fatal
    };

    /// \brief Leveled logger shared by the transport and the client.
    ///
    /// Each statement is one line: a millisecond timestamp, the level, the
    /// optional component tag and the arguments separated by spaces. Lines
    /// go to stdout and/or a log file. Writes are serialized so one logger
    /// can be shared by clients on several threads.
    class log {
      public:
        /// \brief Creates a new log instance.
        ///
        /// By default, logs to stdout only.
        /// \param level lowest level printed.
        /// \param use_stdout true to print to stdout.
        /// \param logfile additional destination for every statement.
        /// \param component tag printed after the level, e.g. "rpc".
        ///                  Omitted when empty.
        explicit log(log_level level,
                     bool use_stdout = true,
                     std::unique_ptr<std::ostream> logfile
                     = std::make_unique<null_stream>(),
                     std::string component = {});

        /// Enables or disables printing the log output to stdout.
        void set_stdout_enabled(bool stdout_enabled);

        /// Replaces the log file destination.
        void set_logfile(std::unique_ptr<std::ostream> logfile);

        /// Changes the log level threshold.
        void set_loglevel(log_level level);

        /// Flushes stdout.
        static void flush();

        /// Writes the argument list to the trace log level.
        template<typename... Targs>
        void trace(Targs&&... args) {
            write_log_statement(log_level::trace,
                                std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the debug log level.
        template<typename... Targs>
        void debug(Targs&&... args) {
            write_log_statement(log_level::debug,
                                std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the info log level.
        template<typename... Targs>
        void info(Targs&&... args) {
            write_log_statement(log_level::info, std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the warn log level.
        template<typename... Targs>
        void warn(Targs&&... args) {
            write_log_statement(log_level::warn, std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the error log level.
        template<typename... Targs>
        void error(Targs&&... args) {
            write_log_statement(log_level::error,
                                std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the fatal log level regardless of the
        /// configured level, flushes stdout and the log file, then
        /// terminates the process with EXIT_FAILURE.
        template<typename... Targs>
        [[noreturn]] void fatal(Targs&&... args) {
            write_log_statement(log_level::fatal,
                                std::forward<Targs>(args)...);
            flush();
            {
                const std::lock_guard<std::mutex> lock(m_stream_mut);
                m_logfile->flush();
            }
            std::exit(EXIT_FAILURE);
        }

        /// Returns the current log level of the logger.
        [[nodiscard]] auto get_log_level() const -> log_level;

      private:
        bool m_stdout{true};
        log_level m_loglevel{};
        std::string m_component;
        std::mutex m_stream_mut{};
        std::unique_ptr<std::ostream> m_logfile;

        auto static to_string(log_level level) -> std::string;
        void write_log_prefix(std::stringstream& ss, log_level level) const;
        template<typename... Targs>
        void write_log_statement(log_level level, Targs&&... args) {
            if(m_loglevel <= level || level == log_level::fatal) {
                std::stringstream ss;
                write_log_prefix(ss, level);
                ((ss << " " << args), ...);
                ss << "\n";
                auto formatted_statement = ss.str();
                const std::lock_guard<std::mutex> lock(m_stream_mut);
                if(m_stdout) {
                    std::cout << formatted_statement;
                }
                *m_logfile << formatted_statement;
            }
        }
    };

    /// Parses the value of the `loglevel` config key.
    /// \param level one of TRACE, DEBUG, INFO, WARN, ERROR or FATAL.
    /// \return the log level, or std::nullopt for any other string.
    auto parse_loglevel(const std::string& level) -> std::optional<log_level>;
}

#endif // BTCRPC_SRC_UTIL_COMMON_LOGGING_H_
