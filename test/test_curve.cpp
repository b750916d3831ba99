#include <doctest/doctest.h>

#include <keyreg/address/curve.hpp>
#include <keyreg/host/keypair.hpp>

using namespace keyreg;
using namespace keyreg::address;

TEST_SUITE("Curve predicate") {

    TEST_CASE("Known curve points") {
        SUBCASE("Ed25519 base point") {
            Bytes32 base{};
            base.fill(0x66);
            base[0] = 0x58;
            CHECK(isOnCurve(base));
        }

        SUBCASE("Neutral element (y = 1)") {
            Bytes32 identity{};
            identity[0] = 0x01;
            CHECK(isOnCurve(identity));
        }

        SUBCASE("Sign bit does not change membership of the base point") {
            Bytes32 base{};
            base.fill(0x66);
            base[0] = 0x58;
            base[31] |= 0x80;
            CHECK(isOnCurve(base));
        }
    }

    TEST_CASE("Wallet public keys are curve points") {
        for (int i = 0; i < 8; ++i) {
            auto wallet = host::Keypair::generate();
            REQUIRE(wallet.is_ok());
            CHECK(isOnCurve(wallet.value().pubkey()));
            CHECK_FALSE(isOffCurve(wallet.value().pubkey()));
        }
    }

    TEST_CASE("Hash outputs fall on both sides") {
        int on = 0;
        int off = 0;
        for (uint8_t i = 0; i < 64; ++i) {
            auto digest = sha256({i});
            REQUIRE(digest.is_ok());
            if (isOnCurve(digest.value())) {
                ++on;
            } else {
                ++off;
            }
        }
        CHECK(on > 0);
        CHECK(off > 0);
        CHECK(on + off == 64);
    }
}
