// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../../util.hpp"
#include "artifact/builder.hpp"

#include <gtest/gtest.h>

using codeproof::artifact::build_artifact;
using codeproof::artifact::build_error;
using codeproof::artifact::build_failure;
using codeproof::artifact::build_tool::build_output;

class builder_test : public ::testing::Test {
  protected:
    void SetUp() override {
        std::filesystem::remove_all(m_work_root);
        std::filesystem::create_directories(m_work_root);
        m_source_control
            = std::make_shared<codeproof::test::fake_source_control>();
        m_build_tool = std::make_shared<codeproof::test::fake_build_tool>();
        m_builder = std::make_unique<codeproof::artifact::builder>(
            m_work_root.string(),
            m_source_control,
            m_build_tool,
            m_log);
    }

    void TearDown() override {
        std::filesystem::remove_all(m_work_root);
    }

    static auto make_artifact(const std::string& path,
                              const std::string& name) -> build_artifact {
        auto art = build_artifact();
        art.m_contract = {path, name};
        art.m_creation_code = codeproof::test::hex("6080604052");
        art.m_runtime_code = codeproof::test::with_trailer(
            codeproof::test::hex("6080604052"),
            codeproof::test::hex("a163616263420102"));
        art.m_compiler_version = "0.8.19";
        return art;
    }

    void set_output(std::vector<build_artifact> contracts) {
        auto out = build_output();
        out.m_contracts = std::move(contracts);
        m_build_tool->m_output = std::move(out);
    }

    auto build(const std::string& contract, const std::string& profile)
        -> codeproof::artifact::build_return_type {
        auto req = codeproof::artifact::build_request{
            "https://example.com/project.git",
            std::string(40, 'a'),
            codeproof::artifact::parse_contract_id(contract).value(),
            profile};
        return m_builder->build(req);
    }

    static auto failure(const codeproof::artifact::build_return_type& res)
        -> build_failure {
        EXPECT_TRUE(std::holds_alternative<build_failure>(res));
        if(!std::holds_alternative<build_failure>(res)) {
            return {};
        }
        return std::get<build_failure>(res);
    }

    std::filesystem::path m_work_root{std::filesystem::temp_directory_path()
                                      / "codeproof-builder-test"};
    std::shared_ptr<codeproof::logging::log> m_log{
        std::make_shared<codeproof::logging::log>(
            codeproof::logging::log_level::fatal)};
    std::shared_ptr<codeproof::test::fake_source_control> m_source_control;
    std::shared_ptr<codeproof::test::fake_build_tool> m_build_tool;
    std::unique_ptr<codeproof::artifact::builder> m_builder;
};

TEST_F(builder_test, success) {
    set_output({make_artifact("src/Token.sol", "Token")});
    auto res = build("src/Token.sol:Token", "default");
    ASSERT_TRUE((std::holds_alternative<
                 std::shared_ptr<const build_artifact>>(res)));
    const auto& art = std::get<std::shared_ptr<const build_artifact>>(res);
    ASSERT_EQ(art->m_contract.m_name, "Token");
    ASSERT_EQ(art->m_profile, "default");
    ASSERT_EQ(art->m_metadata_length, 10UL);

    auto expected_calls = std::vector<std::string>{
        "clone https://example.com/project.git",
        "checkout " + std::string(40, 'a')};
    ASSERT_EQ(m_source_control->m_calls, expected_calls);
    ASSERT_EQ(m_build_tool->m_compiled_profiles,
              std::vector<std::string>{"default"});
}

TEST_F(builder_test, working_directory_removed) {
    set_output({make_artifact("src/Token.sol", "Token")});
    auto res = build("src/Token.sol:Token", "default");
    ASSERT_TRUE(m_source_control->m_parent_existed);
    ASSERT_FALSE(std::filesystem::exists(m_source_control->m_dir));
    ASSERT_FALSE(
        std::filesystem::exists(m_source_control->m_dir.parent_path()));
    ASSERT_TRUE(std::filesystem::is_empty(m_work_root));

    m_source_control->m_checkout_error
        = build_failure{build_error::checkout_failed, "bad commit"};
    res = build("src/Token.sol:Token", "default");
    ASSERT_TRUE(std::holds_alternative<build_failure>(res));
    ASSERT_TRUE(std::filesystem::is_empty(m_work_root));
}

TEST_F(builder_test, metadata_not_appended) {
    auto art = make_artifact("src/Token.sol", "Token");
    art.m_metadata_appended = false;
    set_output({art});
    auto res = build("src/Token.sol:Token", "default");
    const auto& built = std::get<std::shared_ptr<const build_artifact>>(res);
    ASSERT_EQ(built->m_metadata_length, 0UL);
}

TEST_F(builder_test, clone_failed) {
    m_source_control->m_clone_error
        = build_failure{build_error::clone_failed, "repository not found"};
    auto err = failure(build("src/Token.sol:Token", "default"));
    ASSERT_EQ(err.m_code, build_error::clone_failed);
    ASSERT_EQ(err.m_message, "repository not found");
    ASSERT_EQ(m_source_control->m_calls.size(), 1UL);
    ASSERT_TRUE(m_build_tool->m_compiled_profiles.empty());
}

TEST_F(builder_test, checkout_failed) {
    m_source_control->m_checkout_error
        = build_failure{build_error::checkout_failed, "unknown revision"};
    auto err = failure(build("src/Token.sol:Token", "default"));
    ASSERT_EQ(err.m_code, build_error::checkout_failed);
    ASSERT_TRUE(m_build_tool->m_compiled_profiles.empty());
}

TEST_F(builder_test, unsupported_project) {
    m_build_tool->m_profiles_error
        = build_failure{build_error::unsupported_project, "no foundry.toml"};
    auto err = failure(build("src/Token.sol:Token", "default"));
    ASSERT_EQ(err.m_code, build_error::unsupported_project);
}

TEST_F(builder_test, unknown_profile) {
    m_build_tool->m_profiles = {"default", "ci"};
    auto err = failure(build("src/Token.sol:Token", "release"));
    ASSERT_EQ(err.m_code, build_error::unknown_profile);
    ASSERT_NE(err.m_message.find("release"), std::string::npos);
    ASSERT_TRUE(m_build_tool->m_compiled_profiles.empty());
}

TEST_F(builder_test, named_profile) {
    m_build_tool->m_profiles = {"default", "ci"};
    set_output({make_artifact("src/Token.sol", "Token")});
    auto res = build("src/Token.sol:Token", "ci");
    const auto& art = std::get<std::shared_ptr<const build_artifact>>(res);
    ASSERT_EQ(art->m_profile, "ci");
    ASSERT_EQ(m_build_tool->m_compiled_profiles,
              std::vector<std::string>{"ci"});
}

TEST_F(builder_test, compilation_failed) {
    m_build_tool->m_output
        = build_failure{build_error::compilation_failed, "Error (2314)"};
    auto err = failure(build("src/Token.sol:Token", "default"));
    ASSERT_EQ(err.m_code, build_error::compilation_failed);
    ASSERT_EQ(err.m_message, "Error (2314)");
}

TEST_F(builder_test, contract_not_found) {
    set_output({make_artifact("src/Token.sol", "Token")});
    auto err = failure(build("src/Token.sol:Vault", "default"));
    ASSERT_EQ(err.m_code, build_error::contract_not_found);
}

TEST_F(builder_test, malformed_requested_artifact) {
    auto out = build_output();
    out.m_contracts.push_back(make_artifact("src/Token.sol", "Token"));
    out.m_malformed.push_back(
        {{"Vault.sol", "Vault"}, "deployedBytecode.object missing"});
    m_build_tool->m_output = out;

    auto err = failure(build("src/Vault.sol:Vault", "default"));
    ASSERT_EQ(err.m_code, build_error::malformed_artifact);

    // Unrelated malformed outputs do not affect the requested contract.
    auto res = build("src/Token.sol:Token", "default");
    ASSERT_TRUE((std::holds_alternative<
                 std::shared_ptr<const build_artifact>>(res)));
}

TEST_F(builder_test, empty_bytecode) {
    auto art = make_artifact("src/IToken.sol", "IToken");
    art.m_creation_code = codeproof::buffer();
    art.m_runtime_code = codeproof::buffer();
    set_output({art});
    auto err = failure(build("src/IToken.sol:IToken", "default"));
    ASSERT_EQ(err.m_code, build_error::malformed_artifact);
}

TEST(builder_select_test, prefers_project_sources) {
    auto lib = build_artifact();
    lib.m_contract = {"lib/openzeppelin/src/Ownable.sol", "Ownable"};
    lib.m_creation_code = codeproof::test::hex("01");
    lib.m_runtime_code = codeproof::test::hex("01");
    auto own = lib;
    own.m_contract = {"src/access/Ownable.sol", "Ownable"};
    own.m_runtime_code = codeproof::test::hex("02");

    auto out = build_output();
    out.m_contracts = {lib, own};
    auto res = codeproof::artifact::builder::select(
        out,
        codeproof::artifact::contract_id{"Ownable.sol", "Ownable"});
    ASSERT_TRUE(std::holds_alternative<build_artifact>(res));
    ASSERT_EQ(std::get<build_artifact>(res).m_contract.m_path,
              "src/access/Ownable.sol");
}

TEST(builder_select_test, exact_path_wins) {
    auto a = build_artifact();
    a.m_contract = {"src/Ownable.sol", "Ownable"};
    a.m_creation_code = codeproof::test::hex("01");
    a.m_runtime_code = codeproof::test::hex("01");
    auto b = a;
    b.m_contract = {"test/src/Ownable.sol", "Ownable"};

    auto out = build_output();
    out.m_contracts = {b, a};
    auto res = codeproof::artifact::builder::select(
        out,
        codeproof::artifact::contract_id{"src/Ownable.sol", "Ownable"});
    ASSERT_EQ(std::get<build_artifact>(res).m_contract.m_path,
              "src/Ownable.sol");
}
