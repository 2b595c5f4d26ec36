// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_TESTS_UTIL_H_
#define CODEPROOF_TESTS_UTIL_H_

#include "artifact/build_tool/interface.hpp"
#include "artifact/source_control/interface.hpp"
#include "chain/rpc/interface.hpp"
#include "decompiler/interface.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <vector>

namespace codeproof::test {
    /// Parses hex test data, with or without a 0x prefix. Fails the test on
    /// invalid input.
    auto hex(const std::string& str) -> buffer;

    /// Returns a runtime bytecode with a metadata trailer: core followed by
    /// trailer_body and its 2-byte big-endian length.
    auto with_trailer(const buffer& core, const buffer& trailer_body)
        -> buffer;

    /// Address used by tests, 0x1111...11.
    auto test_address() -> evmc::address;

    /// Transaction hash used by tests, 0x2222...22.
    auto test_tx_hash() -> evmc::bytes32;

    /// Chain RPC returning canned responses.
    class fake_chain_rpc : public chain::rpc::interface {
      public:
        /// Constructor.
        /// \param code code returned by get_code.
        explicit fake_chain_rpc(buffer code = {});

        auto get_code(const evmc::address& addr) -> code_return_type override;

        auto get_transaction(const evmc::bytes32& tx_hash)
            -> transaction_return_type override;

        /// Makes the next n calls of either kind fail.
        void fail_next(size_t n);

        /// Makes every call fail.
        void fail_always();

        /// Sets the response of get_transaction.
        void set_transaction(std::optional<chain::transaction> tx);

        /// Delays every call by the given time.
        void set_delay(std::chrono::milliseconds delay);

        [[nodiscard]] auto code_calls() const -> size_t;
        [[nodiscard]] auto tx_calls() const -> size_t;

      private:
        std::mutex m_mut;
        buffer m_code;
        std::optional<chain::transaction> m_tx;
        size_t m_fail_next{0};
        bool m_fail_always{false};
        std::chrono::milliseconds m_delay{0};
        std::atomic<size_t> m_code_calls{0};
        std::atomic<size_t> m_tx_calls{0};

        auto should_fail() -> bool;
    };

    /// Source control recording its calls.
    class fake_source_control
        : public artifact::source_control::interface {
      public:
        auto clone(const std::string& url, const std::filesystem::path& dir)
            -> std::optional<artifact::build_failure> override;

        auto checkout(const std::filesystem::path& dir,
                      const std::string& commit)
            -> std::optional<artifact::build_failure> override;

        std::optional<artifact::build_failure> m_clone_error;
        std::optional<artifact::build_failure> m_checkout_error;
        std::vector<std::string> m_calls;
        /// Directory passed to clone.
        std::filesystem::path m_dir;
        /// True if the working directory existed during clone.
        bool m_parent_existed{false};
    };

    /// Build tool returning a canned build output.
    class fake_build_tool : public artifact::build_tool::interface {
      public:
        auto profiles(const std::filesystem::path& dir)
            -> artifact::build_tool::profiles_return_type override;

        auto compile(const std::filesystem::path& dir,
                     const std::string& profile)
            -> artifact::build_tool::compile_return_type override;

        std::set<std::string> m_profiles{"default"};
        std::optional<artifact::build_failure> m_profiles_error;
        artifact::build_tool::compile_return_type m_output{
            artifact::build_tool::build_output{}};
        std::vector<std::string> m_compiled_profiles;
    };

    /// Decompiler recording which bytecode it was asked to decompile.
    class recording_decompiler : public decompiler::interface {
      public:
        auto decompile(const buffer& code, const Json::Value& known_abi)
            -> std::optional<decompiler::decompilation> override;

        [[nodiscard]] auto calls() const -> size_t;
        [[nodiscard]] auto last_code() -> buffer;

        /// Returned by decompile when set.
        std::optional<decompiler::decompilation> m_result{
            decompiler::decompilation{Json::Value(Json::arrayValue),
                                      "contract Decompiled {}"}};

      private:
        std::mutex m_mut;
        std::atomic<size_t> m_calls{0};
        buffer m_last_code;
    };
}

#endif // CODEPROOF_TESTS_UTIL_H_
