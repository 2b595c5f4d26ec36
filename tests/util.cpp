// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include <array>
#include <cstring>
#include <gtest/gtest.h>
#include <thread>

namespace codeproof::test {
    auto hex(const std::string& str) -> buffer {
        auto buf = buffer::from_hex_prefixed(str);
        EXPECT_TRUE(buf.has_value()) << "bad test hex " << str;
        return buf.value_or(buffer());
    }

    auto with_trailer(const buffer& core, const buffer& trailer_body)
        -> buffer {
        static constexpr auto byte_bits = 8;
        static constexpr auto byte_mask = 0xff;
        auto ret = core;
        ret.append(trailer_body.data(), trailer_body.size());
        auto len = std::array<uint8_t, 2>{
            static_cast<uint8_t>((trailer_body.size() >> byte_bits)
                                 & byte_mask),
            static_cast<uint8_t>(trailer_body.size() & byte_mask)};
        ret.append(len.data(), len.size());
        return ret;
    }

    auto test_address() -> evmc::address {
        auto ret = evmc::address();
        std::memset(ret.bytes, 0x11, sizeof(ret.bytes));
        return ret;
    }

    auto test_tx_hash() -> evmc::bytes32 {
        auto ret = evmc::bytes32();
        std::memset(ret.bytes, 0x22, sizeof(ret.bytes));
        return ret;
    }

    fake_chain_rpc::fake_chain_rpc(buffer code) : m_code(std::move(code)) {}

    auto fake_chain_rpc::should_fail() -> bool {
        std::chrono::milliseconds delay{};
        bool fail{};
        {
            std::unique_lock<std::mutex> l(m_mut);
            delay = m_delay;
            fail = m_fail_always;
            if(!fail && m_fail_next > 0) {
                m_fail_next--;
                fail = true;
            }
        }
        if(delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return fail;
    }

    auto fake_chain_rpc::get_code(const evmc::address& /* addr */)
        -> code_return_type {
        m_code_calls++;
        if(should_fail()) {
            return chain::rpc_failure{"connection refused"};
        }
        std::unique_lock<std::mutex> l(m_mut);
        return m_code;
    }

    auto fake_chain_rpc::get_transaction(const evmc::bytes32& /* tx_hash */)
        -> transaction_return_type {
        m_tx_calls++;
        if(should_fail()) {
            return chain::rpc_failure{"connection refused"};
        }
        std::unique_lock<std::mutex> l(m_mut);
        return m_tx;
    }

    void fake_chain_rpc::fail_next(size_t n) {
        std::unique_lock<std::mutex> l(m_mut);
        m_fail_next = n;
    }

    void fake_chain_rpc::fail_always() {
        std::unique_lock<std::mutex> l(m_mut);
        m_fail_always = true;
    }

    void fake_chain_rpc::set_transaction(std::optional<chain::transaction> tx) {
        std::unique_lock<std::mutex> l(m_mut);
        m_tx = std::move(tx);
    }

    void fake_chain_rpc::set_delay(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> l(m_mut);
        m_delay = delay;
    }

    auto fake_chain_rpc::code_calls() const -> size_t {
        return m_code_calls;
    }

    auto fake_chain_rpc::tx_calls() const -> size_t {
        return m_tx_calls;
    }

    auto fake_source_control::clone(const std::string& url,
                                    const std::filesystem::path& dir)
        -> std::optional<artifact::build_failure> {
        m_calls.push_back("clone " + url);
        m_dir = dir;
        m_parent_existed = std::filesystem::is_directory(dir.parent_path());
        if(m_clone_error.has_value()) {
            return m_clone_error;
        }
        std::filesystem::create_directories(dir);
        return std::nullopt;
    }

    auto fake_source_control::checkout(const std::filesystem::path& /* dir */,
                                       const std::string& commit)
        -> std::optional<artifact::build_failure> {
        m_calls.push_back("checkout " + commit);
        return m_checkout_error;
    }

    auto fake_build_tool::profiles(const std::filesystem::path& /* dir */)
        -> artifact::build_tool::profiles_return_type {
        if(m_profiles_error.has_value()) {
            return m_profiles_error.value();
        }
        return m_profiles;
    }

    auto fake_build_tool::compile(const std::filesystem::path& /* dir */,
                                  const std::string& profile)
        -> artifact::build_tool::compile_return_type {
        m_compiled_profiles.push_back(profile);
        return m_output;
    }

    auto recording_decompiler::decompile(const buffer& code,
                                         const Json::Value& /* known_abi */)
        -> std::optional<decompiler::decompilation> {
        m_calls++;
        std::unique_lock<std::mutex> l(m_mut);
        m_last_code = code;
        return m_result;
    }

    auto recording_decompiler::calls() const -> size_t {
        return m_calls;
    }

    auto recording_decompiler::last_code() -> buffer {
        std::unique_lock<std::mutex> l(m_mut);
        return m_last_code;
    }
}
