// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "forge.hpp"

#include "util/common/subprocess.hpp"

#include <algorithm>
#include <fstream>
#include <tuple>

namespace codeproof::artifact::build_tool {
    namespace {
        constexpr auto build_info_dir = "build-info";
        constexpr auto unlinked_marker = "__$";

        auto trim(const std::string& s) -> std::string {
            auto first = s.find_first_not_of(" \t\r");
            if(first == std::string::npos) {
                return {};
            }
            auto last = s.find_last_not_of(" \t\r");
            return s.substr(first, last - first + 1);
        }

        auto unquote(const std::string& s) -> std::string {
            if(s.size() >= 2
               && ((s.front() == '"' && s.back() == '"')
                   || (s.front() == '\'' && s.back() == '\''))) {
                return s.substr(1, s.size() - 2);
            }
            return s;
        }

        auto parse_code(const Json::Value& section, const std::string& what)
            -> std::variant<buffer, std::string> {
            const auto& obj = section["object"];
            if(!obj.isString()) {
                return what + ".object missing";
            }
            const auto hex = obj.asString();
            if(hex.find(unlinked_marker) != std::string::npos) {
                return what + " has unlinked library references";
            }
            auto code = buffer::from_hex_prefixed(hex);
            if(!code.has_value()) {
                return what + ".object is not valid hex";
            }
            return std::move(code.value());
        }

        auto parse_immutables(const Json::Value& refs)
            -> std::variant<bytecode::immutable_map, std::string> {
            auto ret = bytecode::immutable_map();
            if(refs.isNull()) {
                return ret;
            }
            if(!refs.isObject()) {
                return "immutableReferences is not an object";
            }
            for(const auto& id : refs.getMemberNames()) {
                const auto& ranges = refs[id];
                if(!ranges.isArray()) {
                    return "immutableReferences." + id + " is not an array";
                }
                auto& out = ret[id];
                for(const auto& r : ranges) {
                    if(!r["start"].isUInt64() || !r["length"].isUInt64()) {
                        return "immutableReferences." + id
                             + " has a malformed range";
                    }
                    out.push_back(bytecode::immutable_range{
                        static_cast<size_t>(r["start"].asUInt64()),
                        static_cast<size_t>(r["length"].asUInt64())});
                }
            }
            return ret;
        }

        // solc appends the CBOR trailer unless appendCBOR is false. With
        // bytecodeHash none the trailer still carries the compiler version.
        auto metadata_appended(const Json::Value& settings) -> bool {
            const auto* meta = &settings["metadata"];
            if(!meta->isObject()) {
                meta = &settings;
            }
            const auto& cbor = (*meta)["appendCBOR"];
            return !(cbor.isBool() && !cbor.asBool());
        }
    }

    forge::forge(std::string forge_path, std::shared_ptr<logging::log> log)
        : m_forge_path(std::move(forge_path)),
          m_log(std::move(log)) {}

    auto forge::parse_profiles(std::istream& toml) -> std::set<std::string> {
        static constexpr auto section_prefix = "profile.";
        static constexpr size_t section_prefix_len = 8;

        auto ret = std::set<std::string>{default_profile};
        auto line = std::string();
        while(std::getline(toml, line)) {
            line = trim(line);
            if(line.size() < 2 || line.front() != '[' || line[1] == '[') {
                continue;
            }
            auto close = line.find(']');
            if(close == std::string::npos) {
                continue;
            }
            auto section = trim(line.substr(1, close - 1));
            if(section.compare(0, section_prefix_len, section_prefix) != 0) {
                continue;
            }
            auto rest = section.substr(section_prefix_len);
            auto name = std::string();
            if(!rest.empty() && (rest.front() == '"' || rest.front() == '\'')) {
                auto end = rest.find(rest.front(), 1);
                if(end == std::string::npos) {
                    continue;
                }
                name = rest.substr(1, end - 1);
            } else {
                name = trim(rest.substr(0, rest.find('.')));
            }
            if(!name.empty()) {
                ret.insert(unquote(name));
            }
        }
        return ret;
    }

    auto forge::profiles(const std::filesystem::path& dir)
        -> profiles_return_type {
        auto file = std::ifstream(dir / project_file);
        if(!file.good()) {
            return build_failure{build_error::unsupported_project,
                                 std::string("No ") + project_file
                                     + " in project root"};
        }
        return parse_profiles(file);
    }

    auto forge::parse_artifact(const Json::Value& json,
                               const std::filesystem::path& file)
        -> std::variant<build_artifact, std::string> {
        if(!json.isObject()) {
            return "artifact is not a JSON object";
        }

        auto ret = build_artifact();
        ret.m_contract.m_name = file.stem().string();
        ret.m_contract.m_path = file.parent_path().filename().string();

        const auto& metadata = json["metadata"];
        if(metadata.isObject()) {
            const auto& target = metadata["settings"]["compilationTarget"];
            if(target.isObject() && target.size() == 1) {
                auto path = target.getMemberNames().front();
                if(target[path].isString()) {
                    ret.m_contract.m_path = path;
                    ret.m_contract.m_name = target[path].asString();
                }
            }
            const auto& version = metadata["compiler"]["version"];
            if(version.isString()) {
                ret.m_compiler_version = version.asString();
            }
            const auto& language = metadata["language"];
            if(language.isString()) {
                ret.m_language = language.asString();
            }
            if(metadata["settings"].isObject()) {
                ret.m_settings = metadata["settings"];
            }
            ret.m_metadata_appended = metadata_appended(metadata["settings"]);
        }

        const auto& abi = json["abi"];
        if(!abi.isArray()) {
            return "abi is not an array";
        }
        ret.m_abi = abi;

        auto creation = parse_code(json["bytecode"], "bytecode");
        if(std::holds_alternative<std::string>(creation)) {
            return std::get<std::string>(creation);
        }
        ret.m_creation_code = std::move(std::get<buffer>(creation));

        const auto& deployed = json["deployedBytecode"];
        auto runtime = parse_code(deployed, "deployedBytecode");
        if(std::holds_alternative<std::string>(runtime)) {
            return std::get<std::string>(runtime);
        }
        ret.m_runtime_code = std::move(std::get<buffer>(runtime));

        auto immutables = parse_immutables(deployed["immutableReferences"]);
        if(std::holds_alternative<std::string>(immutables)) {
            return std::get<std::string>(immutables);
        }
        ret.m_immutables
            = std::move(std::get<bytecode::immutable_map>(immutables));

        return ret;
    }

    auto forge::compile(const std::filesystem::path& dir,
                        const std::string& profile) -> compile_return_type {
        m_log->info("Running forge build with profile", profile);
        auto res = subprocess::run(
            {m_forge_path, "build", "--skip", "test", "--skip", "script"},
            dir.string(),
            {{"FOUNDRY_PROFILE", profile}});
        if(std::holds_alternative<std::string>(res)) {
            m_log->error(std::get<std::string>(res));
            return build_failure{build_error::compilation_failed,
                                 std::get<std::string>(res)};
        }
        auto& out = std::get<subprocess::result>(res);
        if(!out.success()) {
            m_log->warn("forge build exited with", out.m_exit_code);
            return build_failure{build_error::compilation_failed,
                                 out.m_output};
        }

        auto ret = build_output();
        const auto out_dir = dir / output_dir;
        auto ec = std::error_code();
        auto it = std::filesystem::recursive_directory_iterator(out_dir, ec);
        if(ec) {
            return build_failure{build_error::compilation_failed,
                                 "No build output in " + out_dir.string()};
        }
        for(; it != std::filesystem::recursive_directory_iterator();
            it.increment(ec)) {
            if(ec) {
                break;
            }
            const auto& entry = *it;
            if(entry.is_directory()
               && entry.path().filename() == build_info_dir) {
                it.disable_recursion_pending();
                continue;
            }
            if(!entry.is_regular_file()
               || entry.path().extension() != ".json") {
                continue;
            }

            const auto rel = entry.path().lexically_relative(out_dir);
            auto file = std::ifstream(entry.path());
            auto json = Json::Value();
            auto r = Json::Reader();
            if(!r.parse(file, json, false)) {
                ret.m_malformed.push_back(
                    {contract_id{rel.parent_path().filename().string(),
                                 rel.stem().string()},
                     r.getFormattedErrorMessages()});
                continue;
            }

            auto parsed = parse_artifact(json, rel);
            if(std::holds_alternative<std::string>(parsed)) {
                m_log->debug("Skipping",
                             rel.string(),
                             std::get<std::string>(parsed));
                ret.m_malformed.push_back(
                    {contract_id{rel.parent_path().filename().string(),
                                 rel.stem().string()},
                     std::get<std::string>(parsed)});
                continue;
            }
            ret.m_contracts.emplace_back(
                std::move(std::get<build_artifact>(parsed)));
        }
        if(ec) {
            return build_failure{build_error::compilation_failed,
                                 "Unable to read " + out_dir.string() + ": "
                                     + ec.message()};
        }

        // Directory order is unspecified; selection ties must not depend on
        // it.
        std::sort(ret.m_contracts.begin(),
                  ret.m_contracts.end(),
                  [](const build_artifact& a, const build_artifact& b) {
                      return std::tie(a.m_contract.m_path, a.m_contract.m_name)
                           < std::tie(b.m_contract.m_path,
                                      b.m_contract.m_name);
                  });

        m_log->info("forge produced",
                    ret.m_contracts.size(),
                    "artifacts,",
                    ret.m_malformed.size(),
                    "skipped");
        return ret;
    }
}
