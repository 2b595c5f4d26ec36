// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "artifact.hpp"

namespace codeproof::artifact {
    auto contract_id::operator==(const contract_id& rhs) const -> bool {
        return m_path == rhs.m_path && m_name == rhs.m_name;
    }

    auto contract_id::matches(const contract_id& requested) const -> bool {
        if(m_name != requested.m_name) {
            return false;
        }
        if(m_path == requested.m_path) {
            return true;
        }
        const auto& want = requested.m_path;
        return m_path.size() > want.size()
            && m_path.compare(m_path.size() - want.size(), want.size(), want)
                   == 0
            && m_path[m_path.size() - want.size() - 1] == '/';
    }

    auto parse_contract_id(const std::string& id)
        -> std::optional<contract_id> {
        auto sep = id.rfind(':');
        if(sep == std::string::npos || sep == 0 || sep + 1 == id.size()) {
            return std::nullopt;
        }
        return contract_id{id.substr(0, sep), id.substr(sep + 1)};
    }

    auto to_string(const contract_id& id) -> std::string {
        return id.m_path + ":" + id.m_name;
    }

    auto to_string(build_error err) -> std::string {
        switch(err) {
            case build_error::workspace_error:
                return "workspace_error";
            case build_error::clone_failed:
                return "clone_failed";
            case build_error::checkout_failed:
                return "checkout_failed";
            case build_error::unsupported_project:
                return "unsupported_project";
            case build_error::unknown_profile:
                return "unknown_profile";
            case build_error::compilation_failed:
                return "compilation_failed";
            case build_error::contract_not_found:
                return "contract_not_found";
            case build_error::malformed_artifact:
                return "malformed_artifact";
        }
        return "unknown";
    }
}
