#pragma once

#include <optional>
#include <vector>

#include <keyreg/host/request.hpp>
#include <keyreg/registry/key_registry.hpp>

namespace keyreg::host {

    /// Outcome of one executed request
    struct ExecutionResult {
        InstructionKind kind{InstructionKind::RegisterKey};
        Pubkey slot;                  // Slot the instruction ran against
        std::optional<bool> matches;  // Set for VerifyKey only
    };

    /// Authenticates signed requests and hands them to the registry.
    ///
    /// The registry never sees an unauthenticated signer: submit() checks the Ed25519 signature
    /// over the request message first, then refuses any signature it has already processed.
    /// Processed signatures are journaled in the registry's slot store, so a persistent store keeps
    /// refusing replays after the runtime is rebuilt.
    class Runtime {
      public:
        explicit Runtime(registry::KeyRegistry &registry);

        /// Verify, de-duplicate and execute a request
        dp::Result<ExecutionResult, dp::Error> submit(const SignedRequest &request);

        /// Decode a wire-encoded request, then submit it
        dp::Result<ExecutionResult, dp::Error> submitBytes(const std::vector<uint8_t> &data);

        bool isProcessed(const SignedRequest &request) const;

        dp::usize processedCount() const;

      private:
        dp::Result<ExecutionResult, dp::Error> dispatch(InstructionKind kind, const InvocationContext &ctx,
                                                        const Pubkey &slot, const Credential &argument);

        registry::KeyRegistry &registry_;
    };

} // namespace keyreg::host
