/// Impersonation Defense Demo
/// Shows that an attacker cannot register or replace another wallet's key,
/// and that a stolen key registered under the attacker's own wallet stays bound to the attacker.

#include <iostream>
#include <keyreg.hpp>

using namespace keyreg;

static void report(const std::string &attempt, const dp::Result<void, dp::Error> &result) {
    if (result.is_ok()) {
        std::cout << "  [!] " << attempt << ": ACCEPTED" << std::endl;
    } else {
        std::cout << "  [ok] " << attempt << ": rejected (" << result.error().message.c_str() << ")" << std::endl;
    }
}

static dp::Result<void, dp::Error> submit(host::Runtime &runtime, const host::Keypair &signer,
                                          host::InstructionKind kind, const Pubkey &slot,
                                          const std::vector<uint8_t> &key, dp::u64 nonce) {
    auto credential = credentialFromBytes(key);
    if (!credential.is_ok()) {
        return dp::Result<void, dp::Error>::err(credential.error());
    }
    auto request = host::SignedRequest::create(signer, kind, slot, credential.value(), nonce);
    if (!request.is_ok()) {
        return dp::Result<void, dp::Error>::err(request.error());
    }
    auto executed = runtime.submit(request.value());
    if (!executed.is_ok()) {
        return dp::Result<void, dp::Error>::err(executed.error());
    }
    return dp::Result<void, dp::Error>::ok();
}

int main() {
    std::cout << "=== keyreg Impersonation Defense Demo ===" << std::endl;
    std::cout << std::endl;

    storage::MemorySlotStore store;
    host::StdoutLogSink log;
    RegistryConfig config;
    registry::KeyRegistry key_registry(store, config, log);
    host::Runtime runtime(key_registry);
    registry::RegistryClient client(runtime, key_registry);

    auto alice_result = host::Keypair::generate();
    auto mallory_result = host::Keypair::generate();
    if (!alice_result.is_ok() || !mallory_result.is_ok()) {
        std::cerr << "Failed to generate wallets" << std::endl;
        return 1;
    }
    auto alice = alice_result.value();
    auto mallory = mallory_result.value();

    auto alice_slot = key_registry.deriveSlot(alice.pubkey());
    auto mallory_slot = key_registry.deriveSlot(mallory.pubkey());
    if (!alice_slot.is_ok() || !mallory_slot.is_ok()) {
        std::cerr << "Failed to derive record addresses" << std::endl;
        return 1;
    }

    std::cout << "Alice:   " << alice.pubkey().toBase58() << std::endl;
    std::cout << "Mallory: " << mallory.pubkey().toBase58() << std::endl;
    std::cout << std::endl;

    // === Attack 1: register first, into Alice's slot ===
    std::cout << "--- Attack 1: Mallory registers into Alice's slot ---" << std::endl;
    report("Mallory -> Alice's slot", submit(runtime, mallory, host::InstructionKind::RegisterKey,
                                             alice_slot.value().address, mallory.publicKeyBytes(), 1));
    std::cout << std::endl;

    // === Alice registers ===
    std::cout << "--- Alice registers a key ---" << std::endl;
    auto registered = client.registerKey(alice, alice.publicKeyBytes());
    if (!registered.is_ok()) {
        std::cerr << "Registration failed: " << registered.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << std::endl;

    // === Attack 2: overwrite Alice's key ===
    std::cout << "--- Attack 2: Mallory updates Alice's record ---" << std::endl;
    report("Mallory update on Alice's slot", submit(runtime, mallory, host::InstructionKind::UpdateKey,
                                                    alice_slot.value().address, mallory.publicKeyBytes(), 2));
    std::cout << std::endl;

    // === Attack 3: forge Alice as signer ===
    std::cout << "--- Attack 3: Mallory forges Alice as the signer ---" << std::endl;
    {
        auto credential = credentialFromBytes(mallory.publicKeyBytes());
        if (!credential.is_ok()) {
            return 1;
        }
        auto request = host::SignedRequest::create(mallory, host::InstructionKind::UpdateKey,
                                                   alice_slot.value().address, credential.value(), 3);
        if (!request.is_ok()) {
            return 1;
        }
        auto forged = request.value();
        auto alice_key = alice.pubkey();
        forged.signer = dp::Vector<dp::u8>(alice_key.bytes().begin(), alice_key.bytes().end());
        auto result = runtime.submit(forged);
        report("Forged signer", result.is_ok() ? dp::Result<void, dp::Error>::ok()
                                               : dp::Result<void, dp::Error>::err(result.error()));
    }
    std::cout << std::endl;

    // === Attack 4: stolen key under Mallory's own identity ===
    std::cout << "--- Attack 4: Mallory registers Alice's key under Mallory's wallet ---" << std::endl;
    report("Mallory registers Alice's key", submit(runtime, mallory, host::InstructionKind::RegisterKey,
                                                   mallory_slot.value().address, alice.publicKeyBytes(), 4));
    auto record = client.fetchRecord(mallory.pubkey());
    if (record.is_ok()) {
        std::cout << "  Record owner is Mallory: " << (record.value().owner == mallory.pubkey() ? "yes" : "no")
                  << std::endl;
    }
    std::cout << std::endl;

    // === Outcome ===
    std::cout << "--- Outcome ---" << std::endl;
    auto genuine = client.verifyKey(alice.pubkey().toBase58(), alice.publicKeyBytes());
    auto attacker = client.verifyKey(alice.pubkey().toBase58(), mallory.publicKeyBytes());
    if (!genuine.is_ok() || !attacker.is_ok()) {
        std::cerr << "Verification failed" << std::endl;
        return 1;
    }
    std::cout << "Alice's key verifies for Alice:   " << (genuine.value() ? "yes" : "no") << std::endl;
    std::cout << "Mallory's key verifies for Alice: " << (attacker.value() ? "yes" : "no") << std::endl;

    std::cout << std::endl;
    std::cout << "=== Demo Complete ===" << std::endl;
    return 0;
}
