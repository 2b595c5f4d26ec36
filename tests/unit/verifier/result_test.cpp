// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../../util.hpp"
#include "util/common/hash.hpp"
#include "verifier/result.hpp"

#include <gtest/gtest.h>

using codeproof::bytecode::match_verdict;
using codeproof::orchestrator::chain_verification_result;

class result_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_request.m_address = "0x" + std::string(40, '1');
        m_artifact.m_contract = {"src/Counter.sol", "Counter"};
        m_artifact.m_compiler_version = "0.8.19";
        m_artifact.m_language = "Solidity";
        m_artifact.m_settings["optimizer"]["enabled"] = true;
        m_artifact.m_settings["optimizer"]["runs"] = 200;
        m_artifact.m_profile = "default";
        m_artifact.m_metadata_length = 53;
    }

    static auto result(uint64_t id, match_verdict runtime)
        -> chain_verification_result {
        auto ret = chain_verification_result();
        ret.m_chain_id = id;
        ret.m_chain_name = "chain-" + std::to_string(id);
        ret.m_runtime = runtime;
        return ret;
    }

    codeproof::verifier::verification_request m_request;
    codeproof::artifact::build_artifact m_artifact;
    std::vector<codeproof::chain::chain_info> m_targets{
        {1, "mainnet", {}},
        {10, "optimism", {}},
        {137, "polygon", {}}};
};

TEST_F(result_test, assemble_sorts_and_fills) {
    auto results = std::vector<chain_verification_result>{
        result(137, match_verdict::absent),
        result(1, match_verdict::exact_match)};
    auto res = codeproof::verifier::assemble(m_request,
                                             m_targets,
                                             &m_artifact,
                                             results);
    ASSERT_EQ(res.m_chains.size(), 3UL);
    ASSERT_EQ(res.m_chains[0].m_chain_id, 1UL);
    ASSERT_EQ(res.m_chains[0].m_runtime, match_verdict::exact_match);
    ASSERT_EQ(res.m_chains[1].m_chain_id, 10UL);
    ASSERT_EQ(res.m_chains[1].m_chain_name, "optimism");
    ASSERT_TRUE(res.m_chains[1].m_error.has_value());
    ASSERT_EQ(res.m_chains[1].m_error->m_code,
              codeproof::chain::chain_error::cancelled);
    ASSERT_EQ(res.m_chains[2].m_chain_id, 137UL);

    ASSERT_TRUE(res.m_artifact.has_value());
    ASSERT_EQ(res.m_artifact->m_metadata_length, 53UL);
}

TEST_F(result_test, assemble_drops_duplicates_and_strays) {
    auto results = std::vector<chain_verification_result>{
        result(1, match_verdict::exact_match),
        result(1, match_verdict::no_match),
        result(5, match_verdict::exact_match),
        result(10, match_verdict::partial_match),
        result(137, match_verdict::absent)};
    auto res = codeproof::verifier::assemble(m_request,
                                             m_targets,
                                             nullptr,
                                             results);
    ASSERT_EQ(res.m_chains.size(), 3UL);
    ASSERT_EQ(res.m_chains[0].m_runtime, match_verdict::exact_match);
    ASSERT_EQ(res.m_chains[1].m_runtime, match_verdict::partial_match);
    ASSERT_FALSE(res.m_artifact.has_value());
}

TEST_F(result_test, result_json) {
    auto chain = result(1, match_verdict::partial_match);
    chain.m_creation = match_verdict::exact_match;
    chain.m_code_hash = codeproof::keccak_data(nullptr, 0);
    chain.m_creation_block = 17;
    auto res = codeproof::verifier::assemble(
        m_request,
        {{1, "mainnet", {}}},
        &m_artifact,
        {chain});
    auto json = codeproof::verifier::to_json(res);

    ASSERT_TRUE(json["request"]["source"].isNull());
    ASSERT_EQ(json["request"]["address"].asString(),
              "0x" + std::string(40, '1'));
    ASSERT_TRUE(json["request"]["creation_tx"].isNull());
    ASSERT_EQ(json["request"]["profile"].asString(), "default");
    ASSERT_TRUE(json["request"]["chain_id"].isNull());

    ASSERT_EQ(json["artifact"]["contract"].asString(),
              "src/Counter.sol:Counter");
    ASSERT_EQ(json["artifact"]["compiler_version"].asString(), "0.8.19");
    ASSERT_EQ(json["artifact"]["metadata_length"].asUInt64(), 53UL);
    ASSERT_TRUE(json["artifact"]["abi"].isArray());
    ASSERT_EQ(json["artifact"]["language"].asString(), "Solidity");
    ASSERT_TRUE(json["artifact"]["settings"]["optimizer"]["enabled"].asBool());
    ASSERT_EQ(json["artifact"]["settings"]["optimizer"]["runs"].asInt(), 200);

    const auto& c = json["chains"][0];
    ASSERT_EQ(c["chain_id"].asUInt64(), 1UL);
    ASSERT_EQ(c["chain_name"].asString(), "chain-1");
    ASSERT_EQ(c["creation"].asString(), "exact_match");
    ASSERT_EQ(c["runtime"].asString(), "partial_match");
    ASSERT_EQ(c["creation_block"].asUInt64(), 17UL);
    ASSERT_EQ(c["code_hash"].asString(),
              "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85"
              "a470");
    ASSERT_FALSE(c.isMember("error"));
    ASSERT_FALSE(c.isMember("reason"));
    ASSERT_FALSE(c.isMember("decompilation"));
}

TEST_F(result_test, chain_json_with_error_and_decompilation) {
    auto chain = result(10, match_verdict::no_match);
    chain.m_reason = "no source supplied";
    chain.m_error = codeproof::chain::chain_failure{
        codeproof::chain::chain_error::tx_pending,
        "transaction has no inclusion block"};
    chain.m_decompilation = codeproof::decompiler::decompilation{
        Json::Value(Json::arrayValue),
        "contract Decompiled {}"};
    auto json = codeproof::verifier::to_json(chain);
    ASSERT_EQ(json["reason"].asString(), "no source supplied");
    ASSERT_EQ(json["error"]["code"].asString(), "tx_pending");
    ASSERT_EQ(json["error"]["message"].asString(),
              "transaction has no inclusion block");
    ASSERT_EQ(json["decompilation"]["pseudo_source"].asString(),
              "contract Decompiled {}");
    ASSERT_TRUE(json["decompilation"]["abi"].isArray());
    ASSERT_FALSE(json.isMember("creation_block"));
}

TEST(error_json_test, request_and_build_errors) {
    auto req = codeproof::verifier::verification_error{
        codeproof::verifier::request_failure{
            codeproof::verifier::request_error::malformed_address,
            "bad address"}};
    auto json = codeproof::verifier::to_json(req);
    ASSERT_EQ(json["error"]["kind"].asString(), "request");
    ASSERT_EQ(json["error"]["code"].asString(), "malformed_address");
    ASSERT_EQ(json["error"]["message"].asString(), "bad address");

    auto build = codeproof::verifier::verification_error{
        codeproof::artifact::build_failure{
            codeproof::artifact::build_error::compilation_failed,
            "Error (2314)"}};
    json = codeproof::verifier::to_json(build);
    ASSERT_EQ(json["error"]["kind"].asString(), "build");
    ASSERT_EQ(json["error"]["code"].asString(), "compilation_failed");
}

TEST(json_string_test, deterministic_output) {
    auto json = Json::Value(Json::objectValue);
    json["b"] = 1;
    json["a"] = "x";
    auto text = codeproof::verifier::to_string(json);
    ASSERT_EQ(text, "{\n  \"a\" : \"x\",\n  \"b\" : 1\n}");
}
