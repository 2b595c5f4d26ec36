// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/subprocess.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <thread>

TEST(subprocess_test, captures_output_and_status) {
    auto res = codeproof::subprocess::run(
        {"sh", "-c", "echo out; echo err 1>&2; exit 3"});
    ASSERT_TRUE(std::holds_alternative<codeproof::subprocess::result>(res));
    auto& out = std::get<codeproof::subprocess::result>(res);
    ASSERT_EQ(out.m_exit_code, 3);
    ASSERT_FALSE(out.success());
    ASSERT_NE(out.m_output.find("out"), std::string::npos);
    ASSERT_NE(out.m_output.find("err"), std::string::npos);
}

TEST(subprocess_test, applies_cwd_and_env) {
    auto res = codeproof::subprocess::run({"sh", "-c", "pwd; echo $CP_VAR"},
                                          "/",
                                          {{"CP_VAR", "hello"}});
    ASSERT_TRUE(std::holds_alternative<codeproof::subprocess::result>(res));
    auto& out = std::get<codeproof::subprocess::result>(res);
    ASSERT_TRUE(out.success());
    ASSERT_EQ(out.m_output, "/\nhello\n");
}

TEST(subprocess_test, missing_executable) {
    auto res
        = codeproof::subprocess::run({"codeproof-no-such-program-xyz"});
    ASSERT_TRUE(std::holds_alternative<std::string>(res));
}

TEST(subprocess_test, concurrent_runs_do_not_share_pipes) {
    auto slow = std::thread([]() {
        auto res = codeproof::subprocess::run({"sh", "-c", "sleep 1"});
        EXPECT_TRUE(std::holds_alternative<codeproof::subprocess::result>(res));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // Lists every descriptor above stderr that the child inherited.
    auto res = codeproof::subprocess::run(
        {"sh",
         "-c",
         "for f in /proc/$$/fd/*; do n=${f##*/}; "
         "if [ \"$n\" -gt 2 ]; then readlink \"$f\"; fi; done; true"});
    slow.join();
    ASSERT_TRUE(std::holds_alternative<codeproof::subprocess::result>(res));
    auto& out = std::get<codeproof::subprocess::result>(res);
    ASSERT_TRUE(out.success());
    ASSERT_EQ(out.m_output.find("pipe:"), std::string::npos) << out.m_output;
}
