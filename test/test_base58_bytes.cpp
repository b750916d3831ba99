#include <doctest/doctest.h>

#include <keyreg/common/base58.hpp>
#include <keyreg/common/bytes.hpp>

using namespace keyreg;

TEST_SUITE("Base58 and byte helpers") {

    TEST_CASE("Base58 known vectors") {
        std::string hello = "Hello World!";
        CHECK(base58Encode(std::vector<uint8_t>(hello.begin(), hello.end())) == "2NEpo7TZRRrLZSi2U");

        CHECK(base58Encode({}) == "");
        CHECK(base58Encode({0x00, 0x00, 0x01}) == "112");
        CHECK(base58Encode(std::vector<uint8_t>(32, 0)) == "11111111111111111111111111111111");
    }

    TEST_CASE("Base58 decode") {
        SUBCASE("Leading ones become zero bytes") {
            auto decoded = base58Decode("112");
            REQUIRE(decoded.is_ok());
            CHECK(decoded.value() == std::vector<uint8_t>{0x00, 0x00, 0x01});
        }

        SUBCASE("Program address decodes to 32 bytes") {
            const std::string token_program = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";
            auto decoded = base58Decode(token_program);
            REQUIRE(decoded.is_ok());
            CHECK(decoded.value().size() == 32);
            CHECK(base58Encode(decoded.value()) == token_program);
        }

        SUBCASE("Characters outside the alphabet are rejected") {
            for (const std::string bad : {"0abc", "Olive", "Ibis", "lamp", "abc!"}) {
                auto decoded = base58Decode(bad);
                CHECK(decoded.is_err());
                CHECK(decoded.error().code == ERR_INVALID_ADDRESS);
            }
        }
    }

    TEST_CASE("SHA-256 digest") {
        std::string abc = "abc";
        auto digest = sha256(std::vector<uint8_t>(abc.begin(), abc.end()));
        REQUIRE(digest.is_ok());
        CHECK(digest.value()[0] == 0xba);
        CHECK(digest.value()[1] == 0x78);
        CHECK(digest.value()[31] == 0xad);

        auto again = sha256(std::vector<uint8_t>(abc.begin(), abc.end()));
        REQUIRE(again.is_ok());
        CHECK(again.value() == digest.value());
    }

    TEST_CASE("Credential length check") {
        CHECK(credentialFromBytes(std::vector<uint8_t>(32, 7)).is_ok());

        for (size_t len : {0, 16, 31, 33, 64}) {
            auto credential = credentialFromBytes(std::vector<uint8_t>(len, 7));
            CHECK(credential.is_err());
            CHECK(credential.error().code == ERR_INVALID_CREDENTIAL);
        }
    }

    TEST_CASE("Pubkey") {
        SUBCASE("fromBytes requires 32 bytes") {
            CHECK(Pubkey::fromBytes(std::vector<uint8_t>(32, 1)).is_ok());
            auto short_key = Pubkey::fromBytes(std::vector<uint8_t>(31, 1));
            CHECK(short_key.is_err());
            CHECK(short_key.error().code == ERR_INVALID_ADDRESS);
        }

        SUBCASE("Base58 form") {
            std::vector<uint8_t> raw(32);
            for (size_t i = 0; i < raw.size(); ++i) {
                raw[i] = static_cast<uint8_t>(i * 7 + 3);
            }
            auto key = Pubkey::fromBytes(raw);
            REQUIRE(key.is_ok());

            auto parsed = Pubkey::fromBase58(key.value().toBase58());
            REQUIRE(parsed.is_ok());
            CHECK(parsed.value() == key.value());
        }

        SUBCASE("Base58 that is not 32 bytes is not an address") {
            CHECK(Pubkey::fromBase58("2NEpo7TZRRrLZSi2U").is_err());
            CHECK(Pubkey::fromBase58("not-base58").is_err());
        }

        SUBCASE("Zero key") {
            Pubkey zero;
            CHECK(zero.isZero());
            CHECK(zero.toBase58() == "11111111111111111111111111111111");
            CHECK(zero.toHex().size() == 64);
        }

        SUBCASE("Ordering and hashing") {
            Bytes32 a{};
            Bytes32 b{};
            b[31] = 1;
            CHECK(Pubkey(a) < Pubkey(b));
            CHECK(Pubkey(a) != Pubkey(b));
            CHECK(std::hash<Pubkey>{}(Pubkey(b)) == std::hash<Pubkey>{}(Pubkey(b)));
        }
    }
}
