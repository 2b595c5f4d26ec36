// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "result.hpp"

#include "orchestrator/orchestrator.hpp"
#include "util/common/variant_overloaded.hpp"

#include <algorithm>
#include <set>

namespace codeproof::verifier {
    namespace {
        auto to_json(const verification_request& req) -> Json::Value {
            auto ret = Json::Value(Json::objectValue);
            if(req.m_source.has_value()) {
                auto src = Json::Value(Json::objectValue);
                src["repo_url"] = req.m_source->m_repo_url;
                src["commit"] = req.m_source->m_commit;
                src["contract"] = req.m_source->m_contract;
                ret["source"] = src;
            } else {
                ret["source"] = Json::Value();
            }
            ret["address"] = req.m_address;
            ret["creation_tx"] = req.m_creation_tx.has_value()
                                   ? Json::Value(req.m_creation_tx.value())
                                   : Json::Value();
            ret["profile"] = req.m_profile;
            ret["chain_id"]
                = req.m_chain_id.has_value()
                    ? Json::Value(Json::UInt64(req.m_chain_id.value()))
                    : Json::Value();
            return ret;
        }

        auto to_json(const artifact_summary& art) -> Json::Value {
            auto ret = Json::Value(Json::objectValue);
            ret["contract"] = artifact::to_string(art.m_contract);
            ret["compiler_version"] = art.m_compiler_version;
            ret["language"] = art.m_language;
            ret["settings"] = art.m_settings;
            ret["profile"] = art.m_profile;
            ret["abi"] = art.m_abi;
            ret["metadata_length"] = Json::UInt64(art.m_metadata_length);
            return ret;
        }
    }

    auto assemble(const verification_request& req,
                  const std::vector<chain::chain_info>& targets,
                  const artifact::build_artifact* art,
                  std::vector<orchestrator::chain_verification_result> results)
        -> verification_result {
        auto ret = verification_result();
        ret.m_request = req;
        if(art != nullptr) {
            ret.m_artifact = artifact_summary{art->m_contract,
                                              art->m_compiler_version,
                                              art->m_language,
                                              art->m_settings,
                                              art->m_profile,
                                              art->m_abi,
                                              art->m_metadata_length};
        }

        auto wanted = std::set<chain::chain_id_type>();
        for(const auto& t : targets) {
            wanted.insert(t.m_id);
        }
        auto seen = std::set<chain::chain_id_type>();
        for(auto& r : results) {
            if(wanted.count(r.m_chain_id) == 0
               || !seen.insert(r.m_chain_id).second) {
                continue;
            }
            ret.m_chains.emplace_back(std::move(r));
        }
        for(const auto& t : targets) {
            if(seen.insert(t.m_id).second) {
                ret.m_chains.emplace_back(
                    orchestrator::failed_result(t,
                                                chain::chain_error::cancelled,
                                                "no result recorded"));
            }
        }

        std::stable_sort(ret.m_chains.begin(),
                         ret.m_chains.end(),
                         [](const auto& a, const auto& b) {
                             return a.m_chain_id < b.m_chain_id;
                         });
        return ret;
    }

    auto to_json(const orchestrator::chain_verification_result& res)
        -> Json::Value {
        auto ret = Json::Value(Json::objectValue);
        ret["chain_id"] = Json::UInt64(res.m_chain_id);
        ret["chain_name"] = res.m_chain_name;
        ret["creation"] = bytecode::to_string(res.m_creation);
        ret["runtime"] = bytecode::to_string(res.m_runtime);
        if(res.m_reason.has_value()) {
            ret["reason"] = res.m_reason.value();
        }
        if(res.m_error.has_value()) {
            auto err = Json::Value(Json::objectValue);
            err["code"] = chain::to_string(res.m_error->m_code);
            err["message"] = res.m_error->m_message;
            ret["error"] = err;
        }
        if(res.m_creation_block.has_value()) {
            ret["creation_block"]
                = Json::UInt64(res.m_creation_block.value());
        }
        if(res.m_code_hash.has_value()) {
            ret["code_hash"]
                = "0x" + codeproof::to_string(res.m_code_hash.value());
        }
        if(res.m_decompilation.has_value()) {
            auto dec = Json::Value(Json::objectValue);
            dec["abi"] = res.m_decompilation->m_abi;
            dec["pseudo_source"] = res.m_decompilation->m_pseudo_source;
            ret["decompilation"] = dec;
        }
        return ret;
    }

    auto to_json(const verification_result& res) -> Json::Value {
        auto ret = Json::Value(Json::objectValue);
        ret["request"] = to_json(res.m_request);
        ret["artifact"] = res.m_artifact.has_value()
                            ? to_json(res.m_artifact.value())
                            : Json::Value();
        auto chains = Json::Value(Json::arrayValue);
        for(const auto& c : res.m_chains) {
            chains.append(to_json(c));
        }
        ret["chains"] = chains;
        return ret;
    }

    auto to_json(const verification_error& err) -> Json::Value {
        auto body = Json::Value(Json::objectValue);
        std::visit(overloaded{[&](const request_failure& f) {
                                  body["kind"] = "request";
                                  body["code"] = to_string(f.m_code);
                                  body["message"] = f.m_message;
                              },
                              [&](const artifact::build_failure& f) {
                                  body["kind"] = "build";
                                  body["code"] = artifact::to_string(f.m_code);
                                  body["message"] = f.m_message;
                              }},
                   err);
        auto ret = Json::Value(Json::objectValue);
        ret["error"] = body;
        return ret;
    }

    auto to_string(const Json::Value& json) -> std::string {
        auto builder = Json::StreamWriterBuilder();
        builder["indentation"] = "  ";
        return Json::writeString(builder, json);
    }
}
