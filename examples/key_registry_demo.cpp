/// Key Registry Demo
/// Demonstrates registering, updating and verifying a wallet's public key

#include <iostream>
#include <keyreg.hpp>

using namespace keyreg;

int main() {
    std::cout << "=== keyreg Key Registry Demo ===" << std::endl;
    std::cout << std::endl;

    storage::MemorySlotStore store;
    host::StdoutLogSink log;
    RegistryConfig config;
    registry::KeyRegistry key_registry(store, config, log);
    host::Runtime runtime(key_registry);
    registry::RegistryClient client(runtime, key_registry);

    // === Part 1: Wallet and record address ===
    std::cout << "--- Part 1: Deriving the record address ---" << std::endl;

    auto wallet_result = host::Keypair::generate();
    if (!wallet_result.is_ok()) {
        std::cerr << "Failed to generate wallet" << std::endl;
        return 1;
    }
    auto wallet = wallet_result.value();

    auto derived = client.deriveRecordAddress(wallet.pubkey());
    if (!derived.is_ok()) {
        std::cerr << "Failed to derive address: " << derived.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "Wallet:         " << wallet.pubkey().toBase58() << std::endl;
    std::cout << "Record address: " << derived.value().address.toBase58() << std::endl;
    std::cout << "Bump:           " << static_cast<int>(derived.value().bump) << std::endl;
    std::cout << std::endl;

    // === Part 2: Register ===
    std::cout << "--- Part 2: Registering the wallet key ---" << std::endl;

    auto registered = client.registerKey(wallet, wallet.publicKeyBytes());
    if (!registered.is_ok()) {
        std::cerr << "Registration failed: " << registered.error().message.c_str() << std::endl;
        return 1;
    }

    auto again = client.registerKey(wallet, wallet.publicKeyBytes());
    std::cout << "Second registration: " << (again.is_ok() ? "accepted" : again.error().message.c_str())
              << std::endl;
    std::cout << std::endl;

    // === Part 3: Verify ===
    std::cout << "--- Part 3: Verifying ---" << std::endl;

    auto verified = client.verifyKey(wallet.pubkey().toBase58(), wallet.publicKeyBytes());
    if (!verified.is_ok()) {
        std::cerr << "Verification failed: " << verified.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "Registered key verifies: " << (verified.value() ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    // === Part 4: Rotate ===
    std::cout << "--- Part 4: Rotating to a new key ---" << std::endl;

    auto next_result = host::Keypair::generate();
    if (!next_result.is_ok()) {
        std::cerr << "Failed to generate key" << std::endl;
        return 1;
    }
    auto next = next_result.value();

    auto updated = client.updateKey(wallet, next.publicKeyBytes());
    if (!updated.is_ok()) {
        std::cerr << "Update failed: " << updated.error().message.c_str() << std::endl;
        return 1;
    }

    auto old_key = client.verifyKey(wallet.pubkey().toBase58(), wallet.publicKeyBytes());
    auto new_key = client.verifyKey(wallet.pubkey().toBase58(), next.publicKeyBytes());
    if (!old_key.is_ok() || !new_key.is_ok()) {
        std::cerr << "Verification failed" << std::endl;
        return 1;
    }
    std::cout << "Old key verifies: " << (old_key.value() ? "yes" : "no") << std::endl;
    std::cout << "New key verifies: " << (new_key.value() ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    // === Summary ===
    auto record = client.fetchRecord(wallet.pubkey());
    if (record.is_ok()) {
        std::cout << "Stored record:" << std::endl;
        std::cout << "  Owner:      " << record.value().owner.toBase58() << std::endl;
        std::cout << "  Credential: " << toHex(record.value().credential) << std::endl;
        std::cout << "  Bump:       " << static_cast<int>(record.value().bump) << std::endl;
    }
    std::cout << "Requests processed: " << runtime.processedCount() << std::endl;

    std::cout << std::endl;
    std::cout << "=== Demo Complete ===" << std::endl;
    return 0;
}
