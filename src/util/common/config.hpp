// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
//               2022 MITRE Corporation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file config.hpp
 * Tools for reading options from a configuration file and building
 * the verifier's parameter set for use in executables.
 */

#ifndef CODEPROOF_SRC_COMMON_CONFIG_H_
#define CODEPROOF_SRC_COMMON_CONFIG_H_

#include "logging.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace codeproof::config {
    namespace defaults {
        static constexpr size_t rpc_timeout_ms{10000};
        static constexpr size_t rpc_max_retries{3};
        static constexpr size_t rpc_backoff_ms{250};
        static constexpr size_t rpc_backoff_max_ms{4000};
        static constexpr size_t max_in_flight{4};
        static constexpr size_t request_timeout_ms{120000};
        static constexpr auto git_path = "git";
        static constexpr auto forge_path = "forge";

        static constexpr auto log_level = logging::log_level::warn;
    }

    static constexpr auto chain_count_key = "chain_count";
    static constexpr auto chain_prefix = "chain";
    static constexpr auto config_separator = "_";
    static constexpr auto id_postfix = "id";
    static constexpr auto name_postfix = "name";
    static constexpr auto rpc_url_postfix = "rpc_url";
    static constexpr auto rpc_timeout_key = "rpc_timeout_ms";
    static constexpr auto rpc_max_retries_key = "rpc_max_retries";
    static constexpr auto rpc_backoff_key = "rpc_backoff_ms";
    static constexpr auto rpc_backoff_max_key = "rpc_backoff_max_ms";
    static constexpr auto max_in_flight_key = "max_in_flight";
    static constexpr auto request_timeout_key = "request_timeout_ms";
    static constexpr auto work_dir_key = "work_dir";
    static constexpr auto git_path_key = "git_path";
    static constexpr auto forge_path_key = "forge_path";
    static constexpr auto decompiler_path_key = "decompiler_path";
    static constexpr auto loglevel_key = "loglevel";

    /// Connection settings for one configured chain.
    struct chain_options {
        /// EIP-155 chain ID.
        uint64_t m_id{};
        /// Display name used in results and log lines.
        std::string m_name;
        /// JSON-RPC endpoint URLs, tried in order.
        std::vector<std::string> m_rpc_urls;
    };

    /// Project-wide configuration options.
    struct options {
        /// Chains the verifier may target, in configuration order.
        std::vector<chain_options> m_chains;

        /// Timeout for a single JSON-RPC call, in milliseconds.
        size_t m_rpc_timeout_ms{defaults::rpc_timeout_ms};
        /// Number of times a transient RPC failure is retried.
        size_t m_rpc_max_retries{defaults::rpc_max_retries};
        /// Delay before the first retry, in milliseconds. Doubles per
        /// attempt.
        size_t m_rpc_backoff_ms{defaults::rpc_backoff_ms};
        /// Upper bound on the retry delay, in milliseconds.
        size_t m_rpc_backoff_max_ms{defaults::rpc_backoff_max_ms};

        /// Maximum number of chain tasks running at once.
        size_t m_max_in_flight{defaults::max_in_flight};
        /// Deadline for a whole verification request, in milliseconds.
        size_t m_request_timeout_ms{defaults::request_timeout_ms};

        /// Root directory for per-request working directories. Empty means
        /// the system temporary directory.
        std::string m_work_dir;
        std::string m_git_path{defaults::git_path};
        std::string m_forge_path{defaults::forge_path};
        /// External decompiler executable. Empty selects the in-process
        /// dispatcher scan.
        std::string m_decompiler_path;

        logging::log_level m_loglevel{defaults::log_level};
    };

    /// Read options from the given config file without checking invariants.
    /// \param config_file the path to the config file from which to load
    ///                    options.
    /// \return options struct with all required values, or string with error
    ///         message on failure.
    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Read options from a stream of config lines without checking
    /// invariants.
    /// \param stream source of key=value lines.
    /// \return options struct, or error message on failure.
    auto read_options(std::istream& stream)
        -> std::variant<options, std::string>;

    /// Loads options from the given config file and check for invariants.
    /// \param config_file the path to the config file from which load options.
    /// \return valid options struct, or string with error message on failure.
    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Checks a fully populated options struct for invariants. Assumes struct
    /// contains all required options.
    /// \param opts options struct to check.
    /// \return std::nullopt if the struct satisfies all invariants. Error
    ///         string otherwise.
    auto check_options(const options& opts) -> std::optional<std::string>;

    /// Converts c-args from an executable's main function into a vector of
    /// strings.
    auto get_args(int argc, char** argv) -> std::vector<std::string>;

    /// Returns the config key for a per-chain setting.
    /// \param chain_idx zero-based index of the chain in the config file.
    /// \param postfix setting name.
    /// \return key in the form chain<idx>_<postfix>.
    auto get_chain_key(size_t chain_idx, const std::string& postfix)
        -> std::string;

    /// Splits a comma separated list, trimming whitespace and dropping
    /// empty entries.
    /// \param list text to split.
    /// \return list entries in order.
    auto split_list(const std::string& list) -> std::vector<std::string>;

    /// Reads configuration parameters line-by-line from a file. Expects a file
    /// of line-separated parameters with each line in the form key=value,
    /// where the key is a lower-case string that may contain numbers and
    /// symbols. Blank lines and lines starting with # are ignored.
    /// Acceptable value types:
    /// - Strings: quoted with double quotes. Ex: some_string="hello"
    /// - Integers: standalone numbers. Ex: some_int=30
    /// - Doubles: a number with a decimal point. Ex: some_double=12.4
    /// - Log levels: in the form of a string. Must be one of the log levels
    ///   enumerated in logging.hpp, in upper-case. Ex: some_loglevel="TRACE"
    ///
    /// The class will override file-enumerated config parameters with
    /// values from environment variables, where the environment variable key
    /// is the upper-case version of the config file string. For example, a
    /// max_in_flight=4 line in the config file would be overridden by
    /// setting the environment variable MAX_IN_FLIGHT=8. String options
    /// supplied through environment variables must be quoted, e.g.
    /// SOMEKEY='"some_value"'.
    class parser {
      public:
        /// Constructor.
        /// \param stream the generic stream used to add config values.
        explicit parser(std::istream& stream);

        /// Returns the given key if its value is a string.
        /// \param key key to retrieve.
        /// \return value associated with the key or std::nullopt if the value
        ///         was not a string or does not exist.
        [[nodiscard]] auto get_string(const std::string& key) const
            -> std::optional<std::string>;

        /// Return the value for the given key if its value is a long.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a long or doesn't exist.
        [[nodiscard]] auto get_ulong(const std::string& key) const
            -> std::optional<size_t>;

        /// Return the value for the given key if its value is a loglevel.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a loglevel or does not exist.
        [[nodiscard]] auto get_loglevel(const std::string& key) const
            -> std::optional<logging::log_level>;

        /// Return the value for the given key if its value is a double.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a double or does not exist.
        [[nodiscard]] auto get_decimal(const std::string& key) const
            -> std::optional<double>;

        /// Returns true if the key is set in the file or the environment,
        /// whatever its type.
        [[nodiscard]] auto has(const std::string& key) const -> bool;

      private:
        using value_t = std::variant<std::string, size_t, double>;

        [[nodiscard]] auto find_or_env(const std::string& key) const
            -> std::optional<value_t>;

        template<typename T>
        [[nodiscard]] auto get_val(const std::string& key) const
            -> std::optional<T> {
            const auto it = find_or_env(key);
            if(it) {
                const auto* val = std::get_if<T>(&it.value());
                if(val != nullptr) {
                    return *val;
                }
            }

            return std::nullopt;
        }

        void init(std::istream& stream);

        [[nodiscard]] static auto parse_value(const std::string& val)
            -> std::optional<value_t>;

        std::map<std::string, value_t> m_options;
    };
}

#endif // CODEPROOF_SRC_COMMON_CONFIG_H_
