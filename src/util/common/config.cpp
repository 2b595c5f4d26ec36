// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <set>
#include <sstream>

namespace codeproof::config {
    auto get_chain_key(size_t chain_idx, const std::string& postfix)
        -> std::string {
        std::stringstream ss;
        ss << chain_prefix << chain_idx << config_separator << postfix;
        return ss.str();
    }

    auto split_list(const std::string& list) -> std::vector<std::string> {
        auto ret = std::vector<std::string>();
        auto ss = std::istringstream(list);
        auto item = std::string();
        while(std::getline(ss, item, ',')) {
            auto first = item.find_first_not_of(" \t");
            if(first == std::string::npos) {
                continue;
            }
            auto last = item.find_last_not_of(" \t");
            ret.emplace_back(item.substr(first, last - first + 1));
        }
        return ret;
    }

    auto read_chain_options(options& opts, const parser& cfg)
        -> std::optional<std::string> {
        const auto chain_count = cfg.get_ulong(chain_count_key);
        if(!chain_count.has_value()) {
            return "No chain_count specified";
        }
        for(size_t i{0}; i < chain_count.value(); i++) {
            auto chain = chain_options{};

            const auto id_key = get_chain_key(i, id_postfix);
            const auto id = cfg.get_ulong(id_key);
            if(!id.has_value()) {
                return "No chain ID specified for chain " + std::to_string(i)
                     + " (" + id_key + ")";
            }
            chain.m_id = id.value();

            const auto name_key = get_chain_key(i, name_postfix);
            chain.m_name = cfg.get_string(name_key).value_or(
                "chain-" + std::to_string(chain.m_id));

            const auto url_key = get_chain_key(i, rpc_url_postfix);
            const auto urls = cfg.get_string(url_key);
            if(!urls.has_value()) {
                return "No RPC URL specified for chain " + std::to_string(i)
                     + " (" + url_key + ")";
            }
            chain.m_rpc_urls = split_list(urls.value());

            opts.m_chains.emplace_back(std::move(chain));
        }
        return std::nullopt;
    }

    void read_rpc_options(options& opts, const parser& cfg) {
        opts.m_rpc_timeout_ms
            = cfg.get_ulong(rpc_timeout_key).value_or(opts.m_rpc_timeout_ms);
        opts.m_rpc_max_retries = cfg.get_ulong(rpc_max_retries_key)
                                     .value_or(opts.m_rpc_max_retries);
        opts.m_rpc_backoff_ms
            = cfg.get_ulong(rpc_backoff_key).value_or(opts.m_rpc_backoff_ms);
        opts.m_rpc_backoff_max_ms = cfg.get_ulong(rpc_backoff_max_key)
                                        .value_or(opts.m_rpc_backoff_max_ms);
        opts.m_max_in_flight
            = cfg.get_ulong(max_in_flight_key).value_or(opts.m_max_in_flight);
        opts.m_request_timeout_ms = cfg.get_ulong(request_timeout_key)
                                        .value_or(opts.m_request_timeout_ms);
    }

    auto read_tool_options(options& opts, const parser& cfg)
        -> std::optional<std::string> {
        opts.m_work_dir
            = cfg.get_string(work_dir_key).value_or(opts.m_work_dir);
        opts.m_git_path
            = cfg.get_string(git_path_key).value_or(opts.m_git_path);
        opts.m_forge_path
            = cfg.get_string(forge_path_key).value_or(opts.m_forge_path);
        opts.m_decompiler_path = cfg.get_string(decompiler_path_key)
                                     .value_or(opts.m_decompiler_path);

        if(cfg.has(loglevel_key)) {
            const auto lvl = cfg.get_loglevel(loglevel_key);
            if(!lvl.has_value()) {
                return "Invalid loglevel";
            }
            opts.m_loglevel = lvl.value();
        }
        return std::nullopt;
    }

    auto read_options(std::istream& stream)
        -> std::variant<options, std::string> {
        auto opts = options{};
        auto cfg = parser(stream);

        auto err = read_chain_options(opts, cfg);
        if(err.has_value()) {
            return err.value();
        }

        read_rpc_options(opts, cfg);

        err = read_tool_options(opts, cfg);
        if(err.has_value()) {
            return err.value();
        }

        return opts;
    }

    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        std::ifstream file(config_file);
        if(!file.good()) {
            return "Unable to open config file " + config_file;
        }
        return read_options(file);
    }

    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        auto opt = read_options(config_file);
        if(std::holds_alternative<options>(opt)) {
            auto res = check_options(std::get<options>(opt));
            if(res) {
                return *res;
            }
        }
        return opt;
    }

    auto check_options(const options& opts) -> std::optional<std::string> {
        if(opts.m_chains.empty()) {
            return "At least one chain must be configured";
        }

        auto seen = std::set<uint64_t>();
        for(const auto& chain : opts.m_chains) {
            if(!seen.insert(chain.m_id).second) {
                return "Duplicate chain ID " + std::to_string(chain.m_id);
            }
            if(chain.m_rpc_urls.empty()) {
                return "Chain " + std::to_string(chain.m_id)
                     + " has no RPC URL";
            }
        }

        if(opts.m_max_in_flight == 0) {
            return "max_in_flight must be at least 1";
        }
        if(opts.m_rpc_timeout_ms == 0) {
            return "rpc_timeout_ms must be non-zero";
        }
        if(opts.m_request_timeout_ms == 0) {
            return "request_timeout_ms must be non-zero";
        }
        if(opts.m_rpc_backoff_ms > opts.m_rpc_backoff_max_ms) {
            return "rpc_backoff_ms > rpc_backoff_max_ms";
        }
        if(opts.m_git_path.empty() || opts.m_forge_path.empty()) {
            return "git_path and forge_path must not be empty";
        }

        return std::nullopt;
    }

    auto get_args(int argc, char** argv) -> std::vector<std::string> {
        auto args = std::vector<char*>(static_cast<size_t>(argc));
        std::memcpy(args.data(),
                    argv,
                    static_cast<size_t>(argc) * sizeof(argv));
        auto ret = std::vector<std::string>();
        ret.reserve(static_cast<size_t>(argc));
        for(auto* arg : args) {
            auto str = std::string(arg);
            ret.emplace_back(std::move(str));
        }
        return ret;
    }

    parser::parser(std::istream& stream) {
        init(stream);
    }

    void parser::init(std::istream& stream) {
        std::string line;
        while(std::getline(stream, line)) {
            if(line.empty() || line[0] == '#') {
                continue;
            }
            std::istringstream line_stream(line);
            std::string key;
            if(std::getline(line_stream, key, '=')) {
                std::string value;
                if(std::getline(line_stream, value)) {
                    auto parsed = parse_value(value);
                    if(parsed.has_value()) {
                        m_options.emplace(key, std::move(parsed.value()));
                    }
                }
            }
        }
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        return get_val<std::string>(key);
    }

    auto parser::get_ulong(const std::string& key) const
        -> std::optional<size_t> {
        return get_val<size_t>(key);
    }

    auto parser::get_loglevel(const std::string& key) const
        -> std::optional<logging::log_level> {
        const auto val_str = get_string(key);
        if(!val_str.has_value()) {
            return std::nullopt;
        }
        return logging::parse_loglevel(val_str.value());
    }

    auto parser::get_decimal(const std::string& key) const
        -> std::optional<double> {
        return get_val<double>(key);
    }

    auto parser::has(const std::string& key) const -> bool {
        return find_or_env(key).has_value();
    }

    auto parser::find_or_env(const std::string& key) const
        -> std::optional<value_t> {
        auto upper_key = key;
        std::transform(upper_key.begin(),
                       upper_key.end(),
                       upper_key.begin(),
                       [](unsigned char c) {
                           return std::toupper(c);
                       });
        if(const auto* env_v = std::getenv(upper_key.c_str())) {
            auto value = std::string(env_v);
            return parse_value(value);
        }

        auto it = m_options.find(key);
        if(it != m_options.end()) {
            return it->second;
        }

        return std::nullopt;
    }

    auto parser::parse_value(const std::string& value)
        -> std::optional<value_t> {
        if(value.empty()) {
            return std::nullopt;
        }
        if(value.size() >= 2 && value.front() == '\"'
           && value.back() == '\"') {
            return value.substr(1, value.size() - 2);
        }

        char* end{};
        if(value.find('.') == std::string::npos) {
            const auto as_int = std::strtoull(value.c_str(), &end, 10);
            if(end == value.c_str() + value.size()) {
                return static_cast<size_t>(as_int);
            }
            return std::nullopt;
        }
        const auto as_dbl = std::strtod(value.c_str(), &end);
        if(end == value.c_str() + value.size()) {
            return as_dbl;
        }
        return std::nullopt;
    }
}
