// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/config.hpp"
#include "verifier/verifier.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <unordered_map>

namespace {
    constexpr auto exit_result = 0;
    constexpr auto exit_request_error = 1;
    constexpr auto exit_usage = 2;

    void usage(const std::string& prog) {
        std::cerr << "Usage: " << prog
                  << " --config=<file> --address=0x<40 hex>"
                     " [--repo=<url> --commit=<sha> --contract=<path>:<Name>]"
                     " [--tx=0x<64 hex>] [--profile=<name>] [--chain=<id>]"
                     " [--log_file=<file>]"
                  << std::endl;
    }

    auto parse_args(const std::vector<std::string>& args)
        -> std::optional<std::unordered_map<std::string, std::string>> {
        auto opts = std::unordered_map<std::string, std::string>();
        for(size_t i = 1; i < args.size(); i++) {
            const auto& arg = args[i];
            if(arg.rfind("--", 0) != 0) {
                return std::nullopt;
            }
            auto eq = arg.find('=');
            if(eq == std::string::npos || eq == 2) {
                return std::nullopt;
            }
            opts.emplace(arg.substr(2, eq - 2), arg.substr(eq + 1));
        }
        return opts;
    }

    auto read_request(const std::unordered_map<std::string, std::string>& opts)
        -> std::optional<codeproof::verifier::verification_request> {
        auto get = [&](const std::string& key) -> std::optional<std::string> {
            auto it = opts.find(key);
            if(it == opts.end()) {
                return std::nullopt;
            }
            return it->second;
        };

        auto req = codeproof::verifier::verification_request();
        auto address = get("address");
        if(!address.has_value()) {
            return std::nullopt;
        }
        req.m_address = address.value();

        auto repo = get("repo");
        auto commit = get("commit");
        auto contract = get("contract");
        if(repo.has_value() || commit.has_value() || contract.has_value()) {
            req.m_source = codeproof::verifier::source_spec{
                repo.value_or(""),
                commit.value_or(""),
                contract.value_or("")};
        }

        req.m_creation_tx = get("tx");
        if(auto profile = get("profile")) {
            req.m_profile = profile.value();
        }

        if(auto chain = get("chain")) {
            char* end{};
            const auto id = std::strtoull(chain->c_str(), &end, 10);
            if(chain->empty() || end != chain->c_str() + chain->size()) {
                return std::nullopt;
            }
            req.m_chain_id = id;
        }
        return req;
    }
}

auto main(int argc, char** argv) -> int {
    auto args = codeproof::config::get_args(argc, argv);
    auto opts = parse_args(args);
    if(!opts.has_value() || opts->count("config") == 0) {
        usage(args.front());
        return exit_usage;
    }

    auto req = read_request(opts.value());
    if(!req.has_value()) {
        usage(args.front());
        return exit_usage;
    }

    auto cfg_or_err = codeproof::config::load_options(opts->at("config"));
    if(std::holds_alternative<std::string>(cfg_or_err)) {
        std::cerr << "Error loading config file: "
                  << std::get<std::string>(cfg_or_err) << std::endl;
        return exit_usage;
    }
    auto cfg = std::get<codeproof::config::options>(cfg_or_err);

    // stdout carries the result, so log lines go to stderr or a file.
    auto logfile = std::unique_ptr<std::ostream>();
    if(opts->count("log_file") != 0) {
        logfile = std::make_unique<std::ofstream>(opts->at("log_file"),
                                                  std::ios::app);
    }
    auto log = std::make_shared<codeproof::logging::log>(cfg.m_loglevel,
                                                         std::move(logfile));

    auto verifier = codeproof::verifier::make_verifier(cfg, log);
    auto res = verifier->verify(req.value());

    auto ret = exit_result;
    auto out = Json::Value();
    if(std::holds_alternative<codeproof::verifier::verification_error>(res)) {
        out = codeproof::verifier::to_json(
            std::get<codeproof::verifier::verification_error>(res));
        ret = exit_request_error;
    } else {
        out = codeproof::verifier::to_json(
            std::get<codeproof::verifier::verification_result>(res));
    }
    std::cout << codeproof::verifier::to_string(out) << std::endl;
    log->flush();
    return ret;
}
