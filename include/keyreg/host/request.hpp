#pragma once

#include <datapod/datapod.hpp>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include <keyreg/common/bytes.hpp>
#include <keyreg/host/keypair.hpp>

namespace keyreg::host {

    /// Registry instruction types
    enum class InstructionKind : dp::u8 {
        RegisterKey = 0,
        UpdateKey = 1,
        VerifyKey = 2,
    };

    /// What the runtime hands the program once a request is authenticated
    struct InvocationContext {
        Pubkey signer; // verified request signer
    };

    /// A registry instruction signed by the submitting wallet
    struct SignedRequest {
        dp::u8 kind{0};                // InstructionKind
        dp::Vector<dp::u8> slot;       // Target record slot (32 bytes)
        dp::Vector<dp::u8> argument;   // Credential (32 bytes)
        dp::u64 nonce{0};              // Distinguishes otherwise identical requests
        dp::Vector<dp::u8> signer;     // Wallet public key (32 bytes)
        dp::Vector<dp::u8> signature;  // Ed25519 over message()

        SignedRequest() = default;

        /// Build and sign a request
        inline static dp::Result<SignedRequest, dp::Error> create(const Keypair &wallet, InstructionKind kind,
                                                                  const Pubkey &slot, const Credential &argument,
                                                                  dp::u64 nonce) {
            SignedRequest request;
            request.kind = static_cast<dp::u8>(kind);
            request.slot = dp::Vector<dp::u8>(slot.bytes().begin(), slot.bytes().end());
            request.argument = dp::Vector<dp::u8>(argument.begin(), argument.end());
            request.nonce = nonce;
            auto signer_key = wallet.pubkey();
            request.signer = dp::Vector<dp::u8>(signer_key.bytes().begin(), signer_key.bytes().end());

            auto signature = wallet.sign(request.message());
            if (!signature.is_ok()) {
                return dp::Result<SignedRequest, dp::Error>::err(signature.error());
            }
            request.signature = dp::Vector<dp::u8>(signature.value().begin(), signature.value().end());
            return dp::Result<SignedRequest, dp::Error>::ok(request);
        }

        /// Bytes covered by the signature: kind || slot || argument || nonce (LE) || signer
        inline std::vector<uint8_t> message() const {
            std::vector<uint8_t> msg;
            msg.reserve(1 + slot.size() + argument.size() + 8 + signer.size());
            msg.push_back(kind);
            msg.insert(msg.end(), slot.begin(), slot.end());
            msg.insert(msg.end(), argument.begin(), argument.end());
            for (int i = 0; i < 8; ++i) {
                msg.push_back(static_cast<uint8_t>((nonce >> (8 * i)) & 0xFF));
            }
            msg.insert(msg.end(), signer.begin(), signer.end());
            return msg;
        }

        inline dp::Result<InstructionKind, dp::Error> getKind() const {
            if (kind > static_cast<dp::u8>(InstructionKind::VerifyKey)) {
                return dp::Result<InstructionKind, dp::Error>::err(invalid_instruction("Unknown instruction"));
            }
            return dp::Result<InstructionKind, dp::Error>::ok(static_cast<InstructionKind>(kind));
        }

        inline dp::Result<Pubkey, dp::Error> getSlot() const {
            return Pubkey::fromBytes(std::vector<uint8_t>(slot.begin(), slot.end()));
        }

        inline dp::Result<Pubkey, dp::Error> getSigner() const {
            return Pubkey::fromBytes(std::vector<uint8_t>(signer.begin(), signer.end()));
        }

        inline dp::Result<Credential, dp::Error> getArgument() const {
            return credentialFromBytes(std::vector<uint8_t>(argument.begin(), argument.end()));
        }

        inline std::vector<uint8_t> getSignature() const {
            return std::vector<uint8_t>(signature.begin(), signature.end());
        }

        /// Wire encoding
        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<SignedRequest &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        /// Deserialize from bytes
        inline static dp::Result<SignedRequest, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, SignedRequest>(buf);
                return dp::Result<SignedRequest, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<SignedRequest, dp::Error>::err(invalid_instruction(dp::String(e.what())));
            }
        }

        /// Serialization
        auto members() { return std::tie(kind, slot, argument, nonce, signer, signature); }
        auto members() const { return std::tie(kind, slot, argument, nonce, signer, signature); }
    };

} // namespace keyreg::host
