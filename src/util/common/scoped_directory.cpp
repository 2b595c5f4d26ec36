// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "scoped_directory.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

namespace codeproof {
    auto scoped_directory::create(const std::string& root,
                                  const std::string& prefix)
        -> std::variant<std::unique_ptr<scoped_directory>, std::string> {
        auto ec = std::error_code();
        auto base = root.empty() ? std::filesystem::temp_directory_path(ec)
                                 : std::filesystem::path(root);
        if(ec) {
            return "no temporary directory: " + ec.message();
        }
        std::filesystem::create_directories(base, ec);
        if(ec) {
            return "cannot create " + base.string() + ": " + ec.message();
        }

        auto templ = (base / (prefix + "XXXXXX")).string();
        auto buf = std::vector<char>(templ.begin(), templ.end());
        buf.push_back('\0');
        if(mkdtemp(buf.data()) == nullptr) {
            return "mkdtemp failed for " + templ + ": "
                 + std::string(std::strerror(errno));
        }

        return std::unique_ptr<scoped_directory>(
            new scoped_directory(std::filesystem::path(buf.data())));
    }

    scoped_directory::scoped_directory(std::filesystem::path path)
        : m_path(std::move(path)) {}

    scoped_directory::~scoped_directory() {
        auto ec = std::error_code();
        std::filesystem::remove_all(m_path, ec);
    }

    auto scoped_directory::path() const -> const std::filesystem::path& {
        return m_path;
    }
}
