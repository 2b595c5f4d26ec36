// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "selector_scan.hpp"

#include "bytecode/normalizer.hpp"

#include <set>
#include <sstream>

namespace codeproof::decompiler {
    namespace {
        constexpr uint8_t op_eq = 0x14;
        constexpr uint8_t op_push1 = 0x60;
        constexpr uint8_t op_push4 = 0x63;
        constexpr uint8_t op_push32 = 0x7f;
        constexpr size_t eq_window = 2;

        auto immediate_size(uint8_t op) -> size_t {
            if(op < op_push1 || op > op_push32) {
                return 0;
            }
            return static_cast<size_t>(op - op_push1) + 1;
        }

        auto placeholder_name(const bytecode::selector_t& sel) -> std::string {
            return "Unresolved_" + bytecode::to_string(sel).substr(2);
        }
    }

    auto scan_selectors(const buffer& code)
        -> std::vector<bytecode::selector_t> {
        const auto core = bytecode::strip_metadata(code).m_core;
        auto found = std::set<bytecode::selector_t>();

        size_t pc = 0;
        while(pc < core.size()) {
            const auto op = core.byte_at(pc);
            const auto imm = immediate_size(op);
            const auto next = pc + 1 + imm;
            if(op == op_push4 && next <= core.size()) {
                // Dispatchers emit PUSH4 sel EQ or PUSH4 sel DUP2 EQ.
                auto at = next;
                for(size_t i = 0; i < eq_window && at < core.size(); i++) {
                    const auto follow = core.byte_at(at);
                    if(follow == op_eq) {
                        auto sel = bytecode::selector_t();
                        for(size_t j = 0; j < sel.size(); j++) {
                            sel[j] = core.byte_at(pc + 1 + j);
                        }
                        found.insert(sel);
                        break;
                    }
                    at += 1 + immediate_size(follow);
                }
            }
            pc = next;
        }

        return {found.begin(), found.end()};
    }

    auto selector_scan::decompile(const buffer& code,
                                  const Json::Value& known_abi)
        -> std::optional<decompilation> {
        if(code.empty()) {
            return std::nullopt;
        }

        const auto known = bytecode::functions_by_selector(known_abi);
        auto ret = decompilation();
        auto src = std::stringstream();
        src << "// Recovered from the function dispatcher. Signatures are "
               "best effort.\n";
        src << "contract Decompiled {\n";

        for(const auto& sel : scan_selectors(code)) {
            auto it = known.find(sel);
            if(it != known.end()) {
                ret.m_abi.append(it->second);
                src << "    function "
                    << bytecode::function_signature(it->second).value_or("")
                    << " external; // " << bytecode::to_string(sel) << "\n";
                continue;
            }
            auto entry = Json::Value(Json::objectValue);
            entry["type"] = "function";
            entry["name"] = placeholder_name(sel);
            entry["inputs"] = Json::Value(Json::arrayValue);
            entry["outputs"] = Json::Value(Json::arrayValue);
            entry["stateMutability"] = "nonpayable";
            ret.m_abi.append(entry);
            src << "    function " << placeholder_name(sel)
                << "() external; // " << bytecode::to_string(sel) << "\n";
        }
        src << "}\n";
        ret.m_pseudo_source = src.str();
        return ret;
    }
}
