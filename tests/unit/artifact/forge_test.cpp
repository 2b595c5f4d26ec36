// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../../util.hpp"
#include "artifact/build_tool/forge.hpp"

#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using codeproof::artifact::build_artifact;
using codeproof::artifact::build_tool::forge;

namespace {
    auto parse_json(const std::string& text) -> Json::Value {
        auto val = Json::Value();
        auto r = Json::Reader();
        EXPECT_TRUE(r.parse(text, val, false))
            << r.getFormattedErrorMessages();
        return val;
    }
}

TEST(forge_profiles_test, default_always_present) {
    auto ss = std::stringstream("[rpc_endpoints]\nmainnet = \"x\"\n");
    auto profiles = forge::parse_profiles(ss);
    ASSERT_EQ(profiles, std::set<std::string>{"default"});
}

TEST(forge_profiles_test, sections) {
    auto ss = std::stringstream("[profile.default]\n"
                                "src = \"src\"\n"
                                "\n"
                                "  [profile.ci]  \n"
                                "optimizer = true\n"
                                "[profile.ci.fuzz]\n"
                                "runs = 10\n"
                                "[profile.\"via-ir\"]\n"
                                "via_ir = true\n"
                                "[[profile.lite.extra]]\n"
                                "# [profile.commented]\n"
                                "[fmt]\n");
    auto profiles = forge::parse_profiles(ss);
    auto expected = std::set<std::string>{"default", "ci", "via-ir"};
    ASSERT_EQ(profiles, expected);
}

TEST(forge_profiles_test, missing_project_file) {
    auto log = std::make_shared<codeproof::logging::log>(
        codeproof::logging::log_level::fatal);
    auto tool = forge("forge", log);
    auto res = tool.profiles("/nonexistent/codeproof/project");
    ASSERT_TRUE(
        std::holds_alternative<codeproof::artifact::build_failure>(res));
    ASSERT_EQ(std::get<codeproof::artifact::build_failure>(res).m_code,
              codeproof::artifact::build_error::unsupported_project);
}

TEST(forge_compile_test, missing_executable) {
    auto log = std::make_shared<codeproof::logging::log>(
        codeproof::logging::log_level::fatal);
    auto tool = forge("/nonexistent/codeproof/forge", log);
    auto res = tool.compile(std::filesystem::temp_directory_path(),
                            "default");
    ASSERT_TRUE(
        std::holds_alternative<codeproof::artifact::build_failure>(res));
    ASSERT_EQ(std::get<codeproof::artifact::build_failure>(res).m_code,
              codeproof::artifact::build_error::compilation_failed);
}

TEST(forge_artifact_test, full_artifact) {
    auto json = parse_json(R"({
        "abi": [{"type": "function", "name": "owner", "inputs": [],
                 "outputs": [{"type": "address"}],
                 "stateMutability": "view"}],
        "bytecode": {"object": "0x6080604052"},
        "deployedBytecode": {
            "object": "0x60806040527f00",
            "immutableReferences": {
                "12": [{"start": 5, "length": 32},
                       {"start": 90, "length": 32}]
            }
        },
        "metadata": {
            "compiler": {"version": "0.8.19+commit.7dd6d404"},
            "language": "Solidity",
            "settings": {
                "compilationTarget": {"src/Ownable.sol": "Ownable"},
                "evmVersion": "paris",
                "optimizer": {"enabled": true, "runs": 200},
                "metadata": {"bytecodeHash": "ipfs"}
            }
        }
    })");
    auto res = forge::parse_artifact(json, "Ownable.sol/Ownable.json");
    ASSERT_TRUE(std::holds_alternative<build_artifact>(res));
    const auto& art = std::get<build_artifact>(res);
    ASSERT_EQ(art.m_contract.m_path, "src/Ownable.sol");
    ASSERT_EQ(art.m_contract.m_name, "Ownable");
    ASSERT_EQ(art.m_compiler_version, "0.8.19+commit.7dd6d404");
    ASSERT_EQ(art.m_language, "Solidity");
    ASSERT_EQ(art.m_settings["evmVersion"].asString(), "paris");
    ASSERT_EQ(art.m_settings["optimizer"]["runs"].asInt(), 200);
    ASSERT_EQ(art.m_creation_code, codeproof::test::hex("6080604052"));
    ASSERT_EQ(art.m_runtime_code, codeproof::test::hex("60806040527f00"));
    ASSERT_EQ(art.m_abi.size(), 1U);
    ASSERT_TRUE(art.m_metadata_appended);

    ASSERT_EQ(art.m_immutables.size(), 1UL);
    const auto& ranges = art.m_immutables.at("12");
    ASSERT_EQ(ranges.size(), 2UL);
    ASSERT_EQ(ranges[0].m_offset, 5UL);
    ASSERT_EQ(ranges[1].m_offset, 90UL);
    ASSERT_EQ(ranges[1].m_length, 32UL);
}

TEST(forge_artifact_test, defaults_from_file_name) {
    auto json = parse_json(R"({
        "abi": [],
        "bytecode": {"object": "0x00"},
        "deployedBytecode": {"object": "0x00"}
    })");
    auto res = forge::parse_artifact(json, "Counter.sol/Counter.json");
    ASSERT_TRUE(std::holds_alternative<build_artifact>(res));
    const auto& art = std::get<build_artifact>(res);
    ASSERT_EQ(art.m_contract.m_path, "Counter.sol");
    ASSERT_EQ(art.m_contract.m_name, "Counter");
    ASSERT_TRUE(art.m_compiler_version.empty());
    ASSERT_TRUE(art.m_language.empty());
    ASSERT_TRUE(art.m_settings.isNull());
    ASSERT_TRUE(art.m_immutables.empty());
    ASSERT_TRUE(art.m_metadata_appended);
}

TEST(forge_artifact_test, metadata_disabled) {
    auto json = parse_json(R"({
        "abi": [],
        "bytecode": {"object": "0x00"},
        "deployedBytecode": {"object": "0x00"},
        "metadata": {"settings": {"metadata": {
            "bytecodeHash": "none", "appendCBOR": false}}}
    })");
    auto res = forge::parse_artifact(json, "A.sol/A.json");
    ASSERT_FALSE(std::get<build_artifact>(res).m_metadata_appended);

    json["metadata"]["settings"]["metadata"]["appendCBOR"] = true;
    res = forge::parse_artifact(json, "A.sol/A.json");
    ASSERT_TRUE(std::get<build_artifact>(res).m_metadata_appended);

    // No CBOR at all, whatever the hash setting.
    json["metadata"]["settings"]["metadata"]["bytecodeHash"] = "ipfs";
    json["metadata"]["settings"]["metadata"]["appendCBOR"] = false;
    res = forge::parse_artifact(json, "A.sol/A.json");
    ASSERT_FALSE(std::get<build_artifact>(res).m_metadata_appended);
}

TEST(forge_artifact_test, unlinked_library) {
    auto json = parse_json(R"({
        "abi": [],
        "bytecode": {"object": "0x73__$1234567890abcdef$__6000"},
        "deployedBytecode": {"object": "0x00"}
    })");
    auto res = forge::parse_artifact(json, "A.sol/A.json");
    ASSERT_TRUE(std::holds_alternative<std::string>(res));
    ASSERT_NE(std::get<std::string>(res).find("unlinked"),
              std::string::npos);
}

TEST(forge_artifact_test, malformed_fields) {
    auto no_abi = parse_json(R"({
        "bytecode": {"object": "0x00"},
        "deployedBytecode": {"object": "0x00"}
    })");
    ASSERT_TRUE(std::holds_alternative<std::string>(
        forge::parse_artifact(no_abi, "A.sol/A.json")));

    auto bad_hex = parse_json(R"({
        "abi": [],
        "bytecode": {"object": "0x0g"},
        "deployedBytecode": {"object": "0x00"}
    })");
    ASSERT_TRUE(std::holds_alternative<std::string>(
        forge::parse_artifact(bad_hex, "A.sol/A.json")));

    auto bad_refs = parse_json(R"({
        "abi": [],
        "bytecode": {"object": "0x00"},
        "deployedBytecode": {"object": "0x00",
                             "immutableReferences": {"3": [{"start": -1}]}}
    })");
    ASSERT_TRUE(std::holds_alternative<std::string>(
        forge::parse_artifact(bad_refs, "A.sol/A.json")));

    ASSERT_TRUE(std::holds_alternative<std::string>(
        forge::parse_artifact(Json::Value(Json::arrayValue), "A.sol/A.json")));
}

class forge_build_test : public ::testing::Test {
  protected:
    void SetUp() override {
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir / "project");
    }

    void TearDown() override {
        std::filesystem::remove_all(m_dir);
    }

    void write(const std::filesystem::path& rel, const std::string& text) {
        auto path = m_dir / rel;
        std::filesystem::create_directories(path.parent_path());
        auto f = std::ofstream(path);
        f << text;
    }

    // Records the profile it was run with and exits with the given code.
    auto fake_forge(int exit_code) -> forge {
        write("bin/forge",
              "#!/bin/sh\n"
              "echo \"$FOUNDRY_PROFILE $1\" > profile.txt\n"
              "echo 'Compiler run finished'\n"
              "exit "
                  + std::to_string(exit_code) + "\n");
        std::filesystem::permissions(m_dir / "bin/forge",
                                     std::filesystem::perms::owner_all);
        return forge((m_dir / "bin/forge").string(), m_log);
    }

    static auto artifact_json(const std::string& path,
                              const std::string& name) -> std::string {
        return R"({"abi": [],
                   "bytecode": {"object": "0x6080"},
                   "deployedBytecode": {"object": "0x6001"},
                   "metadata": {"settings": {"compilationTarget": {")"
             + path + R"(": ")" + name + R"("}},
                                "compiler": {"version": "0.8.19"}}})";
    }

    std::filesystem::path m_dir{std::filesystem::temp_directory_path()
                                / "codeproof-forge-test"};
    std::shared_ptr<codeproof::logging::log> m_log{
        std::make_shared<codeproof::logging::log>(
            codeproof::logging::log_level::fatal)};
};

TEST_F(forge_build_test, reads_sorted_output) {
    write("project/out/B.sol/B.json", artifact_json("src/B.sol", "B"));
    write("project/out/A.sol/A.json", artifact_json("src/A.sol", "A"));
    write("project/out/Broken.sol/Broken.json", "{ not json");
    write("project/out/build-info/0123.json", R"({"id": "0123"})");
    write("project/out/A.sol/notes.txt", "ignored");

    auto tool = fake_forge(0);
    auto res = tool.compile(m_dir / "project", "ci");
    ASSERT_TRUE(
        std::holds_alternative<codeproof::artifact::build_tool::build_output>(
            res));
    const auto& out
        = std::get<codeproof::artifact::build_tool::build_output>(res);

    ASSERT_EQ(out.m_contracts.size(), 2UL);
    ASSERT_EQ(out.m_contracts[0].m_contract.m_path, "src/A.sol");
    ASSERT_EQ(out.m_contracts[1].m_contract.m_path, "src/B.sol");
    ASSERT_EQ(out.m_contracts[1].m_contract.m_name, "B");
    ASSERT_EQ(out.m_contracts[0].m_compiler_version, "0.8.19");

    ASSERT_EQ(out.m_malformed.size(), 1UL);
    ASSERT_EQ(out.m_malformed[0].m_contract.m_path, "Broken.sol");
    ASSERT_EQ(out.m_malformed[0].m_contract.m_name, "Broken");

    auto f = std::ifstream(m_dir / "project/profile.txt");
    auto line = std::string();
    std::getline(f, line);
    ASSERT_EQ(line, "ci build");
}

TEST_F(forge_build_test, failed_build_keeps_output) {
    auto tool = fake_forge(1);
    auto res = tool.compile(m_dir / "project", "default");
    ASSERT_TRUE(
        std::holds_alternative<codeproof::artifact::build_failure>(res));
    const auto& err = std::get<codeproof::artifact::build_failure>(res);
    ASSERT_EQ(err.m_code,
              codeproof::artifact::build_error::compilation_failed);
    ASSERT_NE(err.m_message.find("Compiler run finished"), std::string::npos);
}

TEST_F(forge_build_test, missing_output_directory) {
    auto tool = fake_forge(0);
    auto res = tool.compile(m_dir / "project", "default");
    ASSERT_TRUE(
        std::holds_alternative<codeproof::artifact::build_failure>(res));
    ASSERT_EQ(std::get<codeproof::artifact::build_failure>(res).m_code,
              codeproof::artifact::build_error::compilation_failed);
}
