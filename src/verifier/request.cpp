// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "request.hpp"

#include "chain/util.hpp"

#include <algorithm>
#include <cctype>

namespace codeproof::verifier {
    namespace {
        constexpr size_t commit_hash_len = 40;

        auto is_commit_hash(const std::string& commit) -> bool {
            return commit.size() == commit_hash_len
                && std::all_of(commit.begin(), commit.end(), [](char c) {
                       return std::isxdigit(static_cast<unsigned char>(c))
                           != 0;
                   });
        }

        auto validate_source(const source_spec& src,
                             const std::string& profile)
            -> std::variant<artifact::build_request, request_failure> {
            if(src.m_repo_url.empty()) {
                return request_failure{request_error::missing_source_field,
                                       "repository URL is empty"};
            }
            if(src.m_commit.empty()) {
                return request_failure{request_error::missing_source_field,
                                       "commit is empty"};
            }
            if(src.m_contract.empty()) {
                return request_failure{request_error::missing_source_field,
                                       "contract is empty"};
            }
            if(!is_commit_hash(src.m_commit)) {
                return request_failure{request_error::malformed_commit,
                                       "commit must be 40 hex characters"};
            }
            auto contract = artifact::parse_contract_id(src.m_contract);
            if(!contract.has_value()) {
                return request_failure{request_error::missing_source_field,
                                       "contract must be path:Name"};
            }
            auto commit = src.m_commit;
            std::transform(commit.begin(),
                           commit.end(),
                           commit.begin(),
                           [](unsigned char c) {
                               return std::tolower(c);
                           });
            return artifact::build_request{src.m_repo_url,
                                           std::move(commit),
                                           std::move(contract.value()),
                                           profile};
        }
    }

    auto to_string(request_error err) -> std::string {
        switch(err) {
            case request_error::missing_source_field:
                return "missing_source_field";
            case request_error::malformed_commit:
                return "malformed_commit";
            case request_error::malformed_address:
                return "malformed_address";
            case request_error::malformed_tx_hash:
                return "malformed_tx_hash";
            case request_error::empty_profile:
                return "empty_profile";
            case request_error::unsupported_chain:
                return "unsupported_chain";
            case request_error::no_chains:
                return "no_chains";
        }
        return "unknown";
    }

    auto validate(const verification_request& req,
                  const chain::registry& chains)
        -> std::variant<validated_request, request_failure> {
        auto ret = validated_request();

        if(req.m_profile.empty()) {
            return request_failure{request_error::empty_profile,
                                   "build profile is empty"};
        }

        if(req.m_source.has_value()) {
            auto build = validate_source(req.m_source.value(), req.m_profile);
            if(std::holds_alternative<request_failure>(build)) {
                return std::get<request_failure>(build);
            }
            ret.m_build = std::move(std::get<artifact::build_request>(build));
        }

        auto addr = chain::from_hex<evmc::address>(req.m_address);
        if(!addr.has_value()) {
            return request_failure{request_error::malformed_address,
                                   "address must be 0x followed by 40 hex "
                                   "digits"};
        }
        ret.m_address = addr.value();

        if(req.m_creation_tx.has_value()) {
            auto tx = chain::from_hex<evmc::bytes32>(req.m_creation_tx.value());
            if(!tx.has_value()) {
                return request_failure{request_error::malformed_tx_hash,
                                       "transaction hash must be 0x followed "
                                       "by 64 hex digits"};
            }
            ret.m_creation_tx = tx.value();
        }

        if(chains.empty()) {
            return request_failure{request_error::no_chains,
                                   "no chains are configured"};
        }
        if(req.m_chain_id.has_value()) {
            auto info = chains.find(req.m_chain_id.value());
            if(!info.has_value()) {
                return request_failure{
                    request_error::unsupported_chain,
                    "chain " + std::to_string(req.m_chain_id.value())
                        + " is not configured"};
            }
            ret.m_targets.emplace_back(std::move(info.value()));
        } else {
            ret.m_targets = chains.all();
        }

        return ret;
    }
}
