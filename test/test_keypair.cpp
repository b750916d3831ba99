#include <doctest/doctest.h>

#include <keyreg/host/keypair.hpp>

using namespace keyreg;
using namespace keyreg::host;

TEST_SUITE("Wallet keypair") {

    TEST_CASE("Generate") {
        auto wallet = Keypair::generate();
        REQUIRE(wallet.is_ok());
        CHECK(wallet.value().publicKeyBytes().size() == 32);
        CHECK_FALSE(wallet.value().pubkey().isZero());

        auto other = Keypair::generate();
        REQUIRE(other.is_ok());
        CHECK(wallet.value() != other.value());
    }

    TEST_CASE("Sign and verify") {
        auto wallet = Keypair::generate();
        REQUIRE(wallet.is_ok());

        std::vector<uint8_t> message = {'r', 'e', 'g', 'i', 's', 't', 'e', 'r'};
        auto signature = wallet.value().sign(message);
        REQUIRE(signature.is_ok());
        CHECK(signature.value().size() == 64);

        CHECK(Keypair::verify(wallet.value().pubkey(), message, signature.value()));

        SUBCASE("Tampered message") {
            auto tampered = message;
            tampered[0] = 'R';
            CHECK_FALSE(Keypair::verify(wallet.value().pubkey(), tampered, signature.value()));
        }

        SUBCASE("Wrong signer") {
            auto mallory = Keypair::generate();
            REQUIRE(mallory.is_ok());
            CHECK_FALSE(Keypair::verify(mallory.value().pubkey(), message, signature.value()));
        }

        SUBCASE("Malformed signature") {
            CHECK_FALSE(Keypair::verify(wallet.value().pubkey(), message, {}));
            CHECK_FALSE(Keypair::verify(wallet.value().pubkey(), message, std::vector<uint8_t>(63, 0)));
        }
    }

    TEST_CASE("Load from key bytes") {
        CHECK(Keypair::fromKeypair(std::vector<uint8_t>(31, 1), std::vector<uint8_t>(32, 1)).is_err());
        CHECK(Keypair::fromKeypair(std::vector<uint8_t>(32, 1), std::vector<uint8_t>(10, 1)).is_err());

        auto wallet = Keypair::generate();
        REQUIRE(wallet.is_ok());
        auto pub = wallet.value().publicKeyBytes();

        auto public_only = Keypair::fromKeypair(pub, std::vector<uint8_t>(32, 0));
        REQUIRE(public_only.is_ok());
        CHECK(public_only.value() == wallet.value());
        CHECK(public_only.value().pubkey() == wallet.value().pubkey());
    }
}
