// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
#ifndef CODEPROOF_SRC_COMMON_LOGGING_H_
#define CODEPROOF_SRC_COMMON_LOGGING_H_

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace codeproof::logging {
    /// Severity of a log statement. A logger prints statements at its
    /// configured level and above.
    enum class log_level : uint8_t {
        /// Every RPC attempt and subprocess invocation.
        trace,
        /// Intermediate results such as normalized code lengths.
        debug,
        /// Progress of a verification request.
        info,
        /// Recoverable problems, e.g. a retried RPC call or a failed
        /// decompilation.
        warn,
        /// Failures that end a request or a chain's pipeline.
        error,
        /// Only fatal errors.
        fatal
    };

    /// \brief Thread-safe leveled logger.
    ///
    /// Statements are written to a single sink, stderr unless another
    /// stream is given. Loggers created with \ref with_tag share their
    /// parent's sink and prefix every statement with a tag, so each chain
    /// task can log under its own [chain N] tag.
    class log {
      public:
        /// Creates a new log instance.
        /// \param level the log level (and above) to print.
        /// \param out stream to write statements to. Null selects stderr.
        explicit log(log_level level,
                     std::unique_ptr<std::ostream> out = nullptr);

        /// Returns a logger writing to the same sink, at the same level,
        /// with every statement prefixed by [tag].
        /// \param tag text placed in brackets after the level.
        /// \return new logger sharing this logger's sink.
        [[nodiscard]] auto with_tag(const std::string& tag) const
            -> std::shared_ptr<log>;

        /// Changes the log level threshold of this logger. Tagged loggers
        /// created earlier keep their level.
        /// \param level anything for this log level and more severe will
        ///              be written to the sink.
        void set_loglevel(log_level level);

        /// Returns the current log level of the logger.
        [[nodiscard]] auto get_log_level() const -> log_level;

        /// Flushes the sink.
        void flush();

        /// Writes the argument list to the trace log level.
        template<typename... Targs>
        void trace(Targs&&... args) {
            write(log_level::trace, std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the debug log level.
        template<typename... Targs>
        void debug(Targs&&... args) {
            write(log_level::debug, std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the info log level.
        template<typename... Targs>
        void info(Targs&&... args) {
            write(log_level::info, std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the warn log level.
        template<typename... Targs>
        void warn(Targs&&... args) {
            write(log_level::warn, std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the error log level.
        template<typename... Targs>
        void error(Targs&&... args) {
            write(log_level::error, std::forward<Targs>(args)...);
        }

        /// Writes the argument list to the fatal log level and terminates
        /// the program.
        template<typename... Targs>
        [[noreturn]] void fatal(Targs&&... args) {
            write(log_level::fatal, std::forward<Targs>(args)...);
            flush();
            std::exit(EXIT_FAILURE);
        }

      private:
        struct sink {
            std::mutex m_mut;
            std::unique_ptr<std::ostream> m_owned;
            std::ostream* m_out{};
        };

        log(log_level level, std::shared_ptr<sink> s, std::string tag);

        log_level m_loglevel{};
        std::shared_ptr<sink> m_sink;
        std::string m_tag;

        [[nodiscard]] auto prefix(log_level level) const -> std::string;
        void emit(const std::string& line);

        template<typename... Targs>
        void write(log_level level, Targs&&... args) {
            if(level < m_loglevel) {
                return;
            }
            std::stringstream ss;
            ss << prefix(level);
            ((ss << " " << args), ...);
            ss << "\n";
            emit(ss.str());
        }
    };

    /// \brief Parses a capitalized string into a log level.
    ///
    /// Possible input values: TRACE, DEBUG, INFO, WARN, ERROR, and FATAL.
    /// \param level string corresponding to a log level.
    /// \return the log level, or std::nullopt if the input does not correspond
    ///         to a known log level.
    auto parse_loglevel(const std::string& level) -> std::optional<log_level>;

    /// Returns the five-character name of a log level used in log prefixes.
    auto to_string(log_level level) -> std::string;
}

#endif // CODEPROOF_SRC_COMMON_LOGGING_H_
