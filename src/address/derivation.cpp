#include <cstring>
#include <keyreg/address/derivation.hpp>
#include <utility>

namespace keyreg::address {

    AddressDeriver::AddressDeriver(const Pubkey &program_id, AddressPredicate predicate)
        : program_id_(program_id), predicate_(std::move(predicate)) {}

    dp::Result<Pubkey, dp::Error> AddressDeriver::hashCandidate(const std::vector<Seed> &seeds, dp::u8 bump) const {
        // The bump counts as one more seed
        if (seeds.size() + 1 > MAX_SEEDS) {
            return dp::Result<Pubkey, dp::Error>::err(invalid_seeds("Too many derivation seeds"));
        }

        std::vector<uint8_t> preimage;
        for (const auto &seed : seeds) {
            if (seed.size() > MAX_SEED_LEN) {
                return dp::Result<Pubkey, dp::Error>::err(invalid_seeds("Derivation seed exceeds 32 bytes"));
            }
            preimage.insert(preimage.end(), seed.begin(), seed.end());
        }
        preimage.push_back(bump);

        const auto &program = program_id_.bytes();
        preimage.insert(preimage.end(), program.begin(), program.end());
        preimage.insert(preimage.end(), PDA_MARKER, PDA_MARKER + std::strlen(PDA_MARKER));

        auto digest = sha256(preimage);
        if (!digest.is_ok()) {
            return dp::Result<Pubkey, dp::Error>::err(digest.error());
        }
        return dp::Result<Pubkey, dp::Error>::ok(Pubkey(digest.value()));
    }

    dp::Result<Pubkey, dp::Error> AddressDeriver::create(const std::vector<Seed> &seeds, dp::u8 bump) const {
        auto candidate = hashCandidate(seeds, bump);
        if (!candidate.is_ok()) {
            return candidate;
        }

        if (!predicate_(candidate.value())) {
            return dp::Result<Pubkey, dp::Error>::err(invalid_seeds("Derived address is not a valid slot address"));
        }
        return candidate;
    }

    dp::Result<DerivedAddress, dp::Error> AddressDeriver::find(const std::vector<Seed> &seeds) const {
        for (int bump = 255; bump >= 0; --bump) {
            auto candidate = hashCandidate(seeds, static_cast<dp::u8>(bump));
            if (!candidate.is_ok()) {
                return dp::Result<DerivedAddress, dp::Error>::err(candidate.error());
            }

            if (predicate_(candidate.value())) {
                DerivedAddress derived;
                derived.address = candidate.value();
                derived.bump = static_cast<dp::u8>(bump);
                return dp::Result<DerivedAddress, dp::Error>::ok(derived);
            }
        }

        return dp::Result<DerivedAddress, dp::Error>::err(address_exhausted());
    }

    dp::Result<void, dp::Error> AddressDeriver::confirm(const std::vector<Seed> &seeds, dp::u8 bump,
                                                        const Pubkey &claimed) const {
        auto expected = create(seeds, bump);
        if (!expected.is_ok()) {
            if (expected.error().code == ERR_HASH_FAILED) {
                return dp::Result<void, dp::Error>::err(expected.error());
            }
            return dp::Result<void, dp::Error>::err(seeds_mismatch());
        }
        if (expected.value() != claimed) {
            return dp::Result<void, dp::Error>::err(seeds_mismatch());
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace keyreg::address
