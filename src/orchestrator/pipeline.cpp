// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pipeline.hpp"

#include "bytecode/abi.hpp"
#include "util/common/variant_overloaded.hpp"

namespace codeproof::orchestrator {
    namespace {
        constexpr auto no_source_reason = "no source supplied";

        auto is_miss(bytecode::match_verdict v) -> bool {
            return v == bytecode::match_verdict::no_match
                || v == bytecode::match_verdict::absent;
        }
    }

    auto should_decompile(bytecode::match_verdict creation,
                          bytecode::match_verdict runtime,
                          bool has_code) -> bool {
        return has_code && is_miss(creation) && is_miss(runtime);
    }

    auto fetch_chain(chain::chain_id_type chain_id,
                     chain::fetcher& fetcher,
                     const evmc::address& addr,
                     const std::optional<evmc::bytes32>& tx_hash)
        -> chain::on_chain_data {
        auto ret = chain::on_chain_data();
        ret.m_chain_id = chain_id;
        ret.m_code = fetcher.fetch_code(addr);
        if(tx_hash.has_value()
           && std::holds_alternative<chain::code_present>(ret.m_code)) {
            ret.m_creation_input = fetcher.fetch_creation_input(*tx_hash);
        }
        return ret;
    }

    auto match_chain(const chain::on_chain_data& data,
                     const artifact::build_artifact* art)
        -> chain_verification_result {
        auto ret = chain_verification_result();
        ret.m_chain_id = data.m_chain_id;

        const buffer* code{nullptr};
        std::visit(overloaded{[&](const chain::code_absent&) {},
                              [&](const chain::code_present& c) {
                                  code = &c.m_code;
                              },
                              [&](const chain::chain_failure& f) {
                                  ret.m_error = f;
                              }},
                   data.m_code);
        if(code == nullptr) {
            return ret;
        }
        ret.m_code_hash = keccak_data(code->data(), code->size());

        auto runtime = bytecode::match_outcome{
            bytecode::match_verdict::no_match,
            no_source_reason};
        if(art != nullptr) {
            runtime = bytecode::match_runtime(art->m_runtime_code,
                                              *code,
                                              art->m_immutables);
        }
        ret.m_runtime = runtime.m_verdict;
        ret.m_reason = runtime.m_reason;

        if(!data.m_creation_input.has_value()) {
            return ret;
        }
        std::visit(
            overloaded{
                [&](const chain::creation_tx& tx) {
                    ret.m_creation_block = tx.m_block;
                    auto creation = bytecode::match_outcome{
                        bytecode::match_verdict::no_match,
                        no_source_reason};
                    if(art != nullptr) {
                        creation = bytecode::match_creation(
                            art->m_creation_code,
                            tx.m_input,
                            bytecode::constructor_inputs(art->m_abi));
                    }
                    ret.m_creation = creation.m_verdict;
                    if(!ret.m_reason.has_value()) {
                        ret.m_reason = creation.m_reason;
                    }
                },
                [&](const chain::chain_failure& f) {
                    ret.m_error = f;
                }},
            data.m_creation_input.value());
        return ret;
    }

    auto run_chain(const chain::chain_info& chain,
                   chain::fetcher& fetcher,
                   const evmc::address& addr,
                   const std::optional<evmc::bytes32>& tx_hash,
                   const artifact::build_artifact* art,
                   decompiler::interface& decompiler,
                   logging::log& log) -> chain_verification_result {
        const auto data = fetch_chain(chain.m_id, fetcher, addr, tx_hash);
        auto ret = match_chain(data, art);
        ret.m_chain_name = chain.m_name;
        if(ret.m_error.has_value()) {
            log.warn(chain::to_string(ret.m_error->m_code),
                     ret.m_error->m_message);
        }
        log.info("runtime:",
                 bytecode::to_string(ret.m_runtime),
                 "creation:",
                 bytecode::to_string(ret.m_creation));

        const auto* present = std::get_if<chain::code_present>(&data.m_code);
        if(!should_decompile(ret.m_creation,
                             ret.m_runtime,
                             present != nullptr)) {
            return ret;
        }

        log.info("Decompiling", present->m_code.size(), "bytes");
        ret.m_decompilation = decompiler.decompile(
            present->m_code,
            art != nullptr ? art->m_abi : Json::Value::nullSingleton());
        if(!ret.m_decompilation.has_value()) {
            log.warn("Decompilation produced no output");
        }
        return ret;
    }
}
