#include <doctest/doctest.h>

#include <keyreg/registry/key_record.hpp>

using namespace keyreg;

namespace {

    KeyRecord sampleRecord() {
        Bytes32 owner{};
        owner.fill(0x01);
        Credential credential{};
        credential.fill(0x02);
        return KeyRecord(Pubkey(owner), credential, 254);
    }

} // namespace

TEST_SUITE("Key record layout") {

    TEST_CASE("Sizes") {
        CHECK(KeyRecord::DISCRIMINATOR_LEN == 8);
        CHECK(KeyRecord::LEN == 65);
        CHECK(KeyRecord::SPACE == 73);
    }

    TEST_CASE("Discriminator is the prefix of SHA-256(\"account:KeyRecord\")") {
        const std::string tag = "account:KeyRecord";
        auto digest = sha256(std::vector<uint8_t>(tag.begin(), tag.end()));
        REQUIRE(digest.is_ok());

        auto disc = KeyRecord::discriminator();
        REQUIRE(disc.is_ok());
        CHECK(std::equal(disc.value().begin(), disc.value().end(), digest.value().begin()));
    }

    TEST_CASE("Field offsets") {
        auto record = sampleRecord();
        auto data = record.serialize();
        REQUIRE(data.is_ok());

        const auto &bytes = data.value();
        REQUIRE(bytes.size() == KeyRecord::SPACE);
        CHECK(bytes[8] == 0x01);
        CHECK(bytes[39] == 0x01);
        CHECK(bytes[40] == 0x02);
        CHECK(bytes[71] == 0x02);
        CHECK(bytes[72] == 254);

        auto decoded = KeyRecord::deserialize(bytes);
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == record);
    }

    TEST_CASE("Rejects foreign account data") {
        auto data = sampleRecord().serialize();
        REQUIRE(data.is_ok());

        SUBCASE("Wrong size") {
            auto truncated = data.value();
            truncated.pop_back();
            auto decoded = KeyRecord::deserialize(truncated);
            REQUIRE(decoded.is_err());
            CHECK(decoded.error().code == ERR_ACCOUNT_DATA_MISMATCH);

            auto padded = data.value();
            padded.push_back(0);
            CHECK(KeyRecord::deserialize(padded).is_err());
        }

        SUBCASE("Wrong type tag") {
            auto tampered = data.value();
            tampered[0] ^= 0xFF;
            auto decoded = KeyRecord::deserialize(tampered);
            REQUIRE(decoded.is_err());
            CHECK(decoded.error().code == ERR_ACCOUNT_DATA_MISMATCH);
        }
    }
}
