// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CODEPROOF_SRC_VERIFIER_VERIFIER_H_
#define CODEPROOF_SRC_VERIFIER_VERIFIER_H_

#include "artifact/builder.hpp"
#include "orchestrator/orchestrator.hpp"
#include "result.hpp"
#include "util/common/config.hpp"

#include <chrono>
#include <memory>

namespace codeproof::verifier {
    /// Return type from verifier::verify.
    using verify_return_type
        = std::variant<verification_result, verification_error>;

    /// Verifies that a contract's source builds to the code deployed on
    /// each target chain.
    class verifier {
      public:
        /// Constructor.
        /// \param builder builds the artifact of a request's source.
        /// \param orchestrator runs the per-chain pipelines.
        /// \param request_timeout time allowed for the chain stage of a
        ///                        request, counted from the end of the
        ///                        build.
        /// \param log log instance.
        verifier(std::shared_ptr<artifact::builder> builder,
                 std::shared_ptr<orchestrator::orchestrator> orchestrator,
                 std::chrono::milliseconds request_timeout,
                 std::shared_ptr<logging::log> log);

        /// \brief Verifies a request.
        ///
        /// Request and build errors fail the whole request before any chain
        /// is contacted. Chain-level problems are recorded in that chain's
        /// result and never fail the request.
        /// \param req request to verify.
        /// \return per-chain results, or the request-level error.
        auto verify(const verification_request& req) -> verify_return_type;

      private:
        std::shared_ptr<artifact::builder> m_builder;
        std::shared_ptr<orchestrator::orchestrator> m_orchestrator;
        std::chrono::milliseconds m_request_timeout;
        std::shared_ptr<logging::log> m_log;
    };

    /// Creates a verifier using git, forge, JSON-RPC over HTTP and the
    /// configured decompiler.
    /// \param opts validated configuration.
    /// \param log log instance.
    /// \return production verifier.
    auto make_verifier(const config::options& opts,
                       std::shared_ptr<logging::log> log)
        -> std::unique_ptr<verifier>;
}

#endif // CODEPROOF_SRC_VERIFIER_VERIFIER_H_
