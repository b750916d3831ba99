#include <keyreg/host/runtime.hpp>

namespace keyreg::host {

    Runtime::Runtime(registry::KeyRegistry &registry) : registry_(registry) {}

    dp::Result<ExecutionResult, dp::Error> Runtime::submit(const SignedRequest &request) {
        using SubmitResult = dp::Result<ExecutionResult, dp::Error>;

        auto kind = request.getKind();
        if (!kind.is_ok()) {
            return SubmitResult::err(kind.error());
        }
        auto signer = request.getSigner();
        if (!signer.is_ok()) {
            return SubmitResult::err(signer.error());
        }
        auto slot = request.getSlot();
        if (!slot.is_ok()) {
            return SubmitResult::err(slot.error());
        }
        auto argument = request.getArgument();
        if (!argument.is_ok()) {
            return SubmitResult::err(argument.error());
        }

        auto signature = request.getSignature();
        if (!Keypair::verify(signer.value(), request.message(), signature)) {
            return SubmitResult::err(signature_invalid());
        }

        auto recorded = registry_.store().recordRequest(signature);
        if (!recorded.is_ok()) {
            return SubmitResult::err(recorded.error());
        }
        if (!recorded.value()) {
            return SubmitResult::err(duplicate_request());
        }

        InvocationContext ctx{signer.value()};
        return dispatch(kind.value(), ctx, slot.value(), argument.value());
    }

    dp::Result<ExecutionResult, dp::Error> Runtime::submitBytes(const std::vector<uint8_t> &data) {
        auto request = SignedRequest::fromBytes(data);
        if (!request.is_ok()) {
            return dp::Result<ExecutionResult, dp::Error>::err(request.error());
        }
        return submit(request.value());
    }

    bool Runtime::isProcessed(const SignedRequest &request) const {
        return registry_.store().hasRequest(request.getSignature());
    }

    dp::usize Runtime::processedCount() const { return registry_.store().requestCount(); }

    dp::Result<ExecutionResult, dp::Error> Runtime::dispatch(InstructionKind kind, const InvocationContext &ctx,
                                                             const Pubkey &slot, const Credential &argument) {
        using SubmitResult = dp::Result<ExecutionResult, dp::Error>;

        ExecutionResult result;
        result.kind = kind;
        result.slot = slot;

        switch (kind) {
        case InstructionKind::RegisterKey: {
            auto registered = registry_.registerKeyAt(ctx, slot, argument);
            if (!registered.is_ok()) {
                return SubmitResult::err(registered.error());
            }
            return SubmitResult::ok(result);
        }

        case InstructionKind::UpdateKey: {
            auto updated = registry_.updateKeyAt(ctx, slot, argument);
            if (!updated.is_ok()) {
                return SubmitResult::err(updated.error());
            }
            return SubmitResult::ok(result);
        }

        case InstructionKind::VerifyKey: {
            auto verified = registry_.verifyKeyAt(slot, argument);
            if (!verified.is_ok()) {
                return SubmitResult::err(verified.error());
            }
            result.matches = verified.value();
            return SubmitResult::ok(result);
        }
        }

        return SubmitResult::err(invalid_instruction());
    }

} // namespace keyreg::host
