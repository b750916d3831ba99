/**
 * Example: Persisting the key registry in SQLite
 *
 * This demo shows how to:
 * 1. Configure the registry with the SQLite backend
 * 2. Register and rotate a key through signed requests
 * 3. Reopen the database and verify the record survived
 */

#include <filesystem>
#include <iostream>
#include <keyreg.hpp>

using namespace keyreg;

static void cleanup(const std::string &path) {
    for (const auto &file : {path, path + "-wal", path + "-shm"}) {
        if (std::filesystem::exists(file)) {
            std::filesystem::remove(file);
        }
    }
}

int main() {
    std::cout << "=== keyreg SQLite Persistence Demo ===" << std::endl;
    std::cout << std::endl;

    RegistryConfig config;
    config.backend = StorageBackend::Sqlite;
    config.path = "keyreg_demo.db";
    config.options.sync_mode = storage::OpenOptions::Synchronous::FULL;
    cleanup(config.path);

    auto wallet_result = host::Keypair::generate();
    auto rotated_result = host::Keypair::generate();
    if (!wallet_result.is_ok() || !rotated_result.is_ok()) {
        std::cerr << "Failed to generate keys" << std::endl;
        return 1;
    }
    auto wallet = wallet_result.value();
    auto rotated = rotated_result.value();

    // === Session 1: register and rotate ===
    std::cout << "--- Session 1: writing ---" << std::endl;
    {
        auto store = openSlotStore(config);
        if (!store.is_ok()) {
            std::cerr << "Failed to open store: " << store.error().message.c_str() << std::endl;
            return 1;
        }

        host::StdoutLogSink log;
        registry::KeyRegistry key_registry(*store.value(), config, log);
        host::Runtime runtime(key_registry);
        registry::RegistryClient client(runtime, key_registry);

        auto registered = client.registerKey(wallet, wallet.publicKeyBytes());
        if (!registered.is_ok()) {
            std::cerr << "Registration failed: " << registered.error().message.c_str() << std::endl;
            return 1;
        }
        std::cout << "Record stored at " << registered.value().toBase58() << std::endl;

        auto updated = client.updateKey(wallet, rotated.publicKeyBytes());
        if (!updated.is_ok()) {
            std::cerr << "Update failed: " << updated.error().message.c_str() << std::endl;
            return 1;
        }
        std::cout << "Slots in database: " << store.value()->size() << std::endl;
    }
    std::cout << std::endl;

    // === Session 2: reopen and verify ===
    std::cout << "--- Session 2: reopening ---" << std::endl;
    {
        auto store = openSlotStore(config);
        if (!store.is_ok()) {
            std::cerr << "Failed to reopen store: " << store.error().message.c_str() << std::endl;
            return 1;
        }

        host::StdoutLogSink log;
        registry::KeyRegistry key_registry(*store.value(), config, log);

        auto record = key_registry.getRecord(wallet.pubkey());
        if (!record.is_ok()) {
            std::cerr << "Record lost: " << record.error().message.c_str() << std::endl;
            return 1;
        }
        std::cout << "Owner:      " << record.value().owner.toBase58() << std::endl;
        std::cout << "Credential: " << toHex(record.value().credential) << std::endl;

        auto current = credentialFromBytes(rotated.publicKeyBytes());
        if (!current.is_ok()) {
            return 1;
        }
        auto verified = key_registry.verifyKey(wallet.pubkey(), current.value());
        if (!verified.is_ok()) {
            std::cerr << "Verification failed: " << verified.error().message.c_str() << std::endl;
            return 1;
        }
        std::cout << "Rotated key verifies after reopen: " << (verified.value() ? "yes" : "no") << std::endl;
    }

    cleanup(config.path);

    std::cout << std::endl;
    std::cout << "=== Demo Complete ===" << std::endl;
    return 0;
}
