#include <doctest/doctest.h>

#include <set>

#include <keyreg/address/derivation.hpp>
#include <keyreg/config.hpp>
#include <keyreg/host/keypair.hpp>

using namespace keyreg;
using namespace keyreg::address;

namespace {

    Pubkey ownerFromIndex(uint32_t index) {
        Bytes32 raw{};
        raw[0] = static_cast<uint8_t>(index & 0xFF);
        raw[1] = static_cast<uint8_t>((index >> 8) & 0xFF);
        raw[2] = static_cast<uint8_t>((index >> 16) & 0xFF);
        raw[31] = 0xA5;
        return Pubkey(raw);
    }

    std::vector<Seed> recordSeeds(const Pubkey &owner) {
        return {seedFromString(DEFAULT_DOMAIN_TAG), seedFromKey(owner)};
    }

} // namespace

TEST_SUITE("Address derivation") {

    TEST_CASE("Derivation is deterministic") {
        AddressDeriver deriver(defaultProgramId());
        auto owner = ownerFromIndex(42);

        auto first = deriver.find(recordSeeds(owner));
        auto second = deriver.find(recordSeeds(owner));
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        CHECK(first.value() == second.value());

        AddressDeriver other_instance(defaultProgramId());
        auto third = other_instance.find(recordSeeds(owner));
        REQUIRE(third.is_ok());
        CHECK(third.value() == first.value());
    }

    TEST_CASE("Derived addresses are off the curve") {
        AddressDeriver deriver(defaultProgramId());
        for (uint32_t i = 0; i < 32; ++i) {
            auto derived = deriver.find(recordSeeds(ownerFromIndex(i)));
            REQUIRE(derived.is_ok());
            CHECK_FALSE(isOnCurve(derived.value().address));
        }
    }

    TEST_CASE("Distinct owners get distinct slots") {
        AddressDeriver deriver(defaultProgramId());
        std::set<Pubkey> slots;
        for (uint32_t i = 0; i < 500; ++i) {
            auto derived = deriver.find(recordSeeds(ownerFromIndex(i)));
            REQUIRE(derived.is_ok());
            slots.insert(derived.value().address);
        }
        CHECK(slots.size() == 500);
    }

    TEST_CASE("Program id and domain tag separate address spaces") {
        auto owner = ownerFromIndex(7);
        AddressDeriver registry(defaultProgramId());

        Bytes32 other_raw{};
        other_raw.fill(0x11);
        AddressDeriver other_program((Pubkey(other_raw)));

        auto a = registry.find(recordSeeds(owner));
        auto b = other_program.find(recordSeeds(owner));
        auto c = registry.find({seedFromString("other_tag"), seedFromKey(owner)});
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        REQUIRE(c.is_ok());
        CHECK(a.value().address != b.value().address);
        CHECK(a.value().address != c.value().address);
    }

    TEST_CASE("Canonical bump") {
        AddressDeriver deriver(defaultProgramId());
        auto seeds = recordSeeds(ownerFromIndex(3));
        auto derived = deriver.find(seeds);
        REQUIRE(derived.is_ok());

        SUBCASE("create() reproduces the found address") {
            auto created = deriver.create(seeds, derived.value().bump);
            REQUIRE(created.is_ok());
            CHECK(created.value() == derived.value().address);
        }

        SUBCASE("Every higher bump was rejected") {
            for (int bump = 255; bump > derived.value().bump; --bump) {
                auto created = deriver.create(seeds, static_cast<dp::u8>(bump));
                CHECK(created.is_err());
            }
        }

        SUBCASE("confirm() accepts the canonical pair only") {
            CHECK(deriver.confirm(seeds, derived.value().bump, derived.value().address).is_ok());

            auto wrong_slot = deriver.confirm(seeds, derived.value().bump, ownerFromIndex(99));
            REQUIRE(wrong_slot.is_err());
            CHECK(wrong_slot.error().code == ERR_SEEDS_MISMATCH);

            auto other_seeds = recordSeeds(ownerFromIndex(4));
            auto wrong_seeds = deriver.confirm(other_seeds, derived.value().bump, derived.value().address);
            REQUIRE(wrong_seeds.is_err());
            CHECK(wrong_seeds.error().code == ERR_SEEDS_MISMATCH);
        }
    }

    TEST_CASE("Bump search order") {
        SUBCASE("Accept-all predicate takes bump 255") {
            AddressDeriver deriver(defaultProgramId(), [](const Pubkey &) { return true; });
            auto derived = deriver.find(recordSeeds(ownerFromIndex(1)));
            REQUIRE(derived.is_ok());
            CHECK(derived.value().bump == 255);
        }

        SUBCASE("Bump 0 is still searched") {
            AddressDeriver accept_all(defaultProgramId(), [](const Pubkey &) { return true; });
            auto seeds = recordSeeds(ownerFromIndex(1));
            auto last = accept_all.create(seeds, 0);
            REQUIRE(last.is_ok());

            Pubkey only = last.value();
            AddressDeriver deriver(defaultProgramId(), [only](const Pubkey &candidate) { return candidate == only; });
            auto derived = deriver.find(seeds);
            REQUIRE(derived.is_ok());
            CHECK(derived.value().bump == 0);
            CHECK(derived.value().address == only);
        }

        SUBCASE("No acceptable bump") {
            AddressDeriver deriver(defaultProgramId(), [](const Pubkey &) { return false; });
            auto derived = deriver.find(recordSeeds(ownerFromIndex(1)));
            REQUIRE(derived.is_err());
            CHECK(derived.error().code == ERR_ADDRESS_EXHAUSTED);
        }
    }

    TEST_CASE("Seed limits") {
        AddressDeriver deriver(defaultProgramId());

        SUBCASE("Seed longer than 32 bytes") {
            auto derived = deriver.find({Seed(33, 1)});
            REQUIRE(derived.is_err());
            CHECK(derived.error().code == ERR_INVALID_SEEDS);
        }

        SUBCASE("32-byte seeds are allowed") {
            CHECK(deriver.find({Seed(32, 1), Seed(32, 2)}).is_ok());
        }

        SUBCASE("At most 15 seeds plus the bump") {
            CHECK(deriver.find(std::vector<Seed>(15, Seed{1})).is_ok());

            auto too_many = deriver.find(std::vector<Seed>(16, Seed{1}));
            REQUIRE(too_many.is_err());
            CHECK(too_many.error().code == ERR_INVALID_SEEDS);
        }

        SUBCASE("confirm() reports bad seeds as a mismatch") {
            auto confirmed = deriver.confirm({Seed(40, 1)}, 255, ownerFromIndex(1));
            REQUIRE(confirmed.is_err());
            CHECK(confirmed.error().code == ERR_SEEDS_MISMATCH);
        }
    }
}
