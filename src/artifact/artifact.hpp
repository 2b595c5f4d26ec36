// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_ARTIFACT_ARTIFACT_H_
#define CODEPROOF_SRC_ARTIFACT_ARTIFACT_H_

#include "bytecode/normalizer.hpp"
#include "util/common/buffer.hpp"

#include <json/json.h>
#include <optional>
#include <string>

namespace codeproof::artifact {
    /// Identifies a contract by its source file and name.
    struct contract_id {
        /// Source path relative to the project root, e.g. src/Counter.sol.
        std::string m_path;
        /// Contract name within the file.
        std::string m_name;

        auto operator==(const contract_id& rhs) const -> bool;

        /// Returns true if this contract's path equals, or ends with, the
        /// requested path and the names are equal.
        [[nodiscard]] auto matches(const contract_id& requested) const
            -> bool;
    };

    /// Parses a contract identifier of the form path:Name.
    /// \param id identifier text.
    /// \return contract ID, or std::nullopt if either part is empty.
    auto parse_contract_id(const std::string& id)
        -> std::optional<contract_id>;

    /// Formats a contract ID as path:Name.
    auto to_string(const contract_id& id) -> std::string;

    /// Errors that fail a whole request because no artifact can be built.
    enum class build_error : uint8_t {
        /// The working directory could not be created.
        workspace_error,
        /// The repository could not be cloned.
        clone_failed,
        /// The commit does not exist in the repository.
        checkout_failed,
        /// The checkout is not a supported project type.
        unsupported_project,
        /// The requested build profile is not defined by the project.
        unknown_profile,
        /// The build tool reported an error.
        compilation_failed,
        /// No contract with the requested path and name was produced.
        contract_not_found,
        /// The requested contract's build output could not be used.
        malformed_artifact
    };

    /// Returns the snake_case name of a build error.
    auto to_string(build_error err) -> std::string;

    /// A build error with the diagnostic text of the failing tool.
    struct build_failure {
        build_error m_code{};
        std::string m_message;
    };

    /// Compilation output for one contract.
    struct build_artifact {
        contract_id m_contract;
        /// Creation (deployment) bytecode.
        buffer m_creation_code;
        /// Runtime (deployed) bytecode.
        buffer m_runtime_code;
        /// Contract ABI as emitted by the compiler.
        Json::Value m_abi{Json::arrayValue};
        /// Immutable reference ranges within the runtime code.
        bytecode::immutable_map m_immutables;
        /// Length of the metadata trailer of the runtime code, including
        /// its 2-byte length suffix. 0 if the compiler appended none.
        size_t m_metadata_length{};
        /// Compiler version string from the metadata, if present.
        std::string m_compiler_version;
        /// Source language from the metadata, e.g. Solidity.
        std::string m_language;
        /// Compiler settings from the metadata: optimizer, EVM version,
        /// remappings and so on. Null when the metadata is absent.
        Json::Value m_settings;
        /// Build profile the artifact was compiled with.
        std::string m_profile;
        /// True unless the compiler settings disabled the metadata trailer.
        bool m_metadata_appended{true};
    };
}

#endif // CODEPROOF_SRC_ARTIFACT_ARTIFACT_H_
