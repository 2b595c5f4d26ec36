// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_COMMON_SCOPED_DIRECTORY_H_
#define CODEPROOF_SRC_COMMON_SCOPED_DIRECTORY_H_

#include <filesystem>
#include <memory>
#include <string>
#include <variant>

namespace codeproof {
    /// Uniquely named temporary directory, removed recursively with all of
    /// its contents when the object is destroyed.
    class scoped_directory {
      public:
        /// Creates a fresh directory.
        /// \param root parent directory. Empty selects the system temporary
        ///             directory.
        /// \param prefix leading part of the directory name.
        /// \return the directory guard, or an error message.
        static auto create(const std::string& root, const std::string& prefix)
            -> std::variant<std::unique_ptr<scoped_directory>, std::string>;

        ~scoped_directory();

        scoped_directory(const scoped_directory&) = delete;
        auto operator=(const scoped_directory&) -> scoped_directory& = delete;
        scoped_directory(scoped_directory&&) = delete;
        auto operator=(scoped_directory&&) -> scoped_directory& = delete;

        /// Returns the directory path.
        [[nodiscard]] auto path() const -> const std::filesystem::path&;

      private:
        explicit scoped_directory(std::filesystem::path path);

        std::filesystem::path m_path;
    };
}

#endif // CODEPROOF_SRC_COMMON_SCOPED_DIRECTORY_H_
