#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <filesystem>
#include <keyreg/storage/sqlite_slot_store.hpp>

using namespace keyreg;
using namespace keyreg::storage;

// Test helper: cleanup database file
struct TestDB {
    std::string path;
    SqliteSlotStore store;

    explicit TestDB(const std::string &name) : path(name + ".db") { cleanup(); }

    ~TestDB() {
        store.close();
        cleanup();
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove(path);
        }
        if (std::filesystem::exists(path + "-wal")) {
            std::filesystem::remove(path + "-wal");
        }
        if (std::filesystem::exists(path + "-shm")) {
            std::filesystem::remove(path + "-shm");
        }
    }
};

static Pubkey slotAddress(uint8_t tag) {
    Bytes32 raw{};
    raw.fill(tag);
    return Pubkey(raw);
}

// ===========================================
// Connection and schema
// ===========================================

TEST_CASE("Database opening and schema") {
    TestDB db("test_slots_open");

    SUBCASE("Open and initialize") {
        REQUIRE(db.store.open(db.path).is_ok());
        CHECK(db.store.isOpen());
        CHECK(db.store.schemaVersion() == 0);

        REQUIRE(db.store.initializeSchema().is_ok());
        CHECK(db.store.schemaVersion() == 2);
        CHECK(db.store.quickCheck());
    }

    SUBCASE("Initialize twice is harmless") {
        REQUIRE(db.store.open(db.path).is_ok());
        REQUIRE(db.store.initializeSchema().is_ok());
        REQUIRE(db.store.initializeSchema().is_ok());
        CHECK(db.store.schemaVersion() == 2);
    }

    SUBCASE("Open twice fails") {
        REQUIRE(db.store.open(db.path).is_ok());
        CHECK(db.store.open(db.path).is_err());
    }

    SUBCASE("Operations on a closed store fail") {
        CHECK_FALSE(db.store.isOpen());
        CHECK(db.store.load(slotAddress(1)).is_err());
        CHECK(db.store.allocate(slotAddress(1), {1}).is_err());
        CHECK(db.store.initializeSchema().is_err());
    }

    SUBCASE("In-memory database") {
        SqliteSlotStore mem;
        REQUIRE(mem.open(":memory:").is_ok());
        REQUIRE(mem.initializeSchema().is_ok());
        REQUIRE(mem.allocate(slotAddress(9), {9}).is_ok());
        CHECK(mem.size() == 1);
    }
}

// ===========================================
// Slot operations
// ===========================================

TEST_CASE("Slot allocation") {
    TestDB db("test_slots_allocate");
    REQUIRE(db.store.open(db.path).is_ok());
    REQUIRE(db.store.initializeSchema().is_ok());

    auto addr = slotAddress(1);

    auto missing = db.store.load(addr);
    REQUIRE(missing.is_ok());
    CHECK_FALSE(missing.value().has_value());

    REQUIRE(db.store.allocate(addr, {1, 2, 3}).is_ok());
    CHECK(db.store.exists(addr));
    CHECK(db.store.size() == 1);

    auto loaded = db.store.load(addr);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().has_value());
    CHECK(*loaded.value() == std::vector<uint8_t>{1, 2, 3});

    auto again = db.store.allocate(addr, {4});
    REQUIRE(again.is_err());
    CHECK(again.error().code == ERR_SLOT_OCCUPIED);
    CHECK(*db.store.load(addr).value() == std::vector<uint8_t>{1, 2, 3});
}

TEST_CASE("Slot compare and swap") {
    TestDB db("test_slots_cas");
    REQUIRE(db.store.open(db.path).is_ok());
    REQUIRE(db.store.initializeSchema().is_ok());

    auto addr = slotAddress(2);

    SUBCASE("Missing slot") {
        auto result = db.store.compareAndSwap(addr, {1}, {2});
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_SLOT_MISSING);
    }

    SUBCASE("Swap then stale swap") {
        REQUIRE(db.store.allocate(addr, {1}).is_ok());
        REQUIRE(db.store.compareAndSwap(addr, {1}, {2}).is_ok());

        auto stale = db.store.compareAndSwap(addr, {1}, {3});
        REQUIRE(stale.is_err());
        CHECK(stale.error().code == ERR_WRITE_CONFLICT);
        CHECK(*db.store.load(addr).value() == std::vector<uint8_t>{2});
    }
}

TEST_CASE("Transaction guard rolls back") {
    TestDB db("test_slots_tx");
    REQUIRE(db.store.open(db.path).is_ok());
    REQUIRE(db.store.initializeSchema().is_ok());
    REQUIRE(db.store.allocate(slotAddress(1), {1}).is_ok());

    // A failed allocation must not leave a partial row or an open transaction behind
    CHECK(db.store.allocate(slotAddress(1), {2}).is_err());
    REQUIRE(db.store.allocate(slotAddress(2), {2}).is_ok());
    CHECK(db.store.size() == 2);
}

TEST_CASE("Persistence across reopen") {
    TestDB db("test_slots_persist");
    auto addr = slotAddress(7);

    {
        SqliteSlotStore writer;
        REQUIRE(writer.open(db.path).is_ok());
        REQUIRE(writer.initializeSchema().is_ok());
        REQUIRE(writer.allocate(addr, {7, 7, 7}).is_ok());
        REQUIRE(writer.compareAndSwap(addr, {7, 7, 7}, {8, 8}).is_ok());
    }

    REQUIRE(db.store.open(db.path).is_ok());
    REQUIRE(db.store.initializeSchema().is_ok());
    CHECK(db.store.schemaVersion() == 2);

    auto loaded = db.store.load(addr);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().has_value());
    CHECK(*loaded.value() == std::vector<uint8_t>{8, 8});
}

// ===========================================
// Request journal
// ===========================================

TEST_CASE("Request journal") {
    TestDB db("test_slots_requests");
    std::vector<uint8_t> first(64, 0x01);
    std::vector<uint8_t> second(64, 0x02);

    {
        SqliteSlotStore writer;
        REQUIRE(writer.open(db.path).is_ok());
        REQUIRE(writer.initializeSchema().is_ok());

        auto recorded = writer.recordRequest(first);
        REQUIRE(recorded.is_ok());
        CHECK(recorded.value());

        auto again = writer.recordRequest(first);
        REQUIRE(again.is_ok());
        CHECK_FALSE(again.value());

        CHECK(writer.hasRequest(first));
        CHECK_FALSE(writer.hasRequest(second));
        CHECK(writer.requestCount() == 1);
    }

    // Survives reopening
    REQUIRE(db.store.open(db.path).is_ok());
    REQUIRE(db.store.initializeSchema().is_ok());
    CHECK(db.store.hasRequest(first));
    CHECK(db.store.requestCount() == 1);

    auto replay = db.store.recordRequest(first);
    REQUIRE(replay.is_ok());
    CHECK_FALSE(replay.value());

    auto fresh = db.store.recordRequest(second);
    REQUIRE(fresh.is_ok());
    CHECK(fresh.value());
    CHECK(db.store.requestCount() == 2);
}

TEST_CASE("Request journal on a closed store") {
    SqliteSlotStore store;
    CHECK(store.recordRequest(std::vector<uint8_t>(64, 1)).is_err());
    CHECK_FALSE(store.hasRequest(std::vector<uint8_t>(64, 1)));
    CHECK(store.requestCount() == 0);
}
