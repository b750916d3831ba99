#pragma once

#include <datapod/datapod.hpp>

namespace keyreg {

    // ===========================================
    // keyreg-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_ALREADY_REGISTERED = 100;
    constexpr dp::u32 ERR_NOT_FOUND = 101;
    constexpr dp::u32 ERR_UNAUTHORIZED = 102;
    constexpr dp::u32 ERR_ADDRESS_EXHAUSTED = 103;
    constexpr dp::u32 ERR_SEEDS_MISMATCH = 104;
    constexpr dp::u32 ERR_INVALID_SEEDS = 105;
    constexpr dp::u32 ERR_INVALID_CREDENTIAL = 106;
    constexpr dp::u32 ERR_INVALID_ADDRESS = 107;
    constexpr dp::u32 ERR_SIGNATURE_INVALID = 108;
    constexpr dp::u32 ERR_DUPLICATE_REQUEST = 109;
    constexpr dp::u32 ERR_INVALID_INSTRUCTION = 110;
    constexpr dp::u32 ERR_ACCOUNT_DATA_MISMATCH = 111;
    constexpr dp::u32 ERR_WRITE_CONFLICT = 112;
    constexpr dp::u32 ERR_SLOT_OCCUPIED = 113;
    constexpr dp::u32 ERR_SLOT_MISSING = 114;
    constexpr dp::u32 ERR_STORAGE_FAILED = 115;
    constexpr dp::u32 ERR_HASH_FAILED = 116;
    constexpr dp::u32 ERR_SIGNING_FAILED = 117;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error already_registered(const dp::String &msg = "Key record already registered for this owner") {
        return dp::Error{ERR_ALREADY_REGISTERED, msg};
    }

    inline dp::Error not_found(const dp::String &msg = "No key record registered for this owner") {
        return dp::Error{ERR_NOT_FOUND, msg};
    }

    inline dp::Error unauthorized(const dp::String &msg = "Unauthorized: You are not the owner of this key record") {
        return dp::Error{ERR_UNAUTHORIZED, msg};
    }

    inline dp::Error address_exhausted(const dp::String &msg = "Unable to find a valid derived address") {
        return dp::Error{ERR_ADDRESS_EXHAUSTED, msg};
    }

    inline dp::Error seeds_mismatch(const dp::String &msg = "Slot does not match the derived address") {
        return dp::Error{ERR_SEEDS_MISMATCH, msg};
    }

    inline dp::Error invalid_seeds(const dp::String &msg = "Invalid derivation seeds") {
        return dp::Error{ERR_INVALID_SEEDS, msg};
    }

    inline dp::Error invalid_credential(const dp::String &msg = "Ed25519 public key must be 32 bytes") {
        return dp::Error{ERR_INVALID_CREDENTIAL, msg};
    }

    inline dp::Error invalid_address(const dp::String &msg = "Invalid address") {
        return dp::Error{ERR_INVALID_ADDRESS, msg};
    }

    inline dp::Error signature_invalid(const dp::String &msg = "Request signature verification failed") {
        return dp::Error{ERR_SIGNATURE_INVALID, msg};
    }

    inline dp::Error duplicate_request(const dp::String &msg = "Request already processed") {
        return dp::Error{ERR_DUPLICATE_REQUEST, msg};
    }

    inline dp::Error invalid_instruction(const dp::String &msg = "Invalid instruction") {
        return dp::Error{ERR_INVALID_INSTRUCTION, msg};
    }

    inline dp::Error account_data_mismatch(const dp::String &msg = "Account data does not hold a key record") {
        return dp::Error{ERR_ACCOUNT_DATA_MISMATCH, msg};
    }

    inline dp::Error write_conflict(const dp::String &msg = "Slot was modified concurrently") {
        return dp::Error{ERR_WRITE_CONFLICT, msg};
    }

    inline dp::Error slot_occupied(const dp::String &msg = "Slot already allocated") {
        return dp::Error{ERR_SLOT_OCCUPIED, msg};
    }

    inline dp::Error slot_missing(const dp::String &msg = "Slot not allocated") {
        return dp::Error{ERR_SLOT_MISSING, msg};
    }

    inline dp::Error storage_failed(const dp::String &msg = "Storage operation failed") {
        return dp::Error{ERR_STORAGE_FAILED, msg};
    }

    inline dp::Error hash_failed(const dp::String &msg = "Hash computation failed") {
        return dp::Error{ERR_HASH_FAILED, msg};
    }

    inline dp::Error signing_failed(const dp::String &msg = "Signing operation failed") {
        return dp::Error{ERR_SIGNING_FAILED, msg};
    }

} // namespace keyreg
