#pragma once

#include <functional>
#include <string>
#include <vector>

#include <keyreg/address/curve.hpp>
#include <keyreg/common/bytes.hpp>

namespace keyreg::address {

    constexpr dp::usize MAX_SEED_LEN = 32;
    constexpr dp::usize MAX_SEEDS = 16;

    /// Suffix appended to every derivation preimage
    constexpr const char *PDA_MARKER = "ProgramDerivedAddress";

    using Seed = std::vector<uint8_t>;

    /// Decides whether a hashed candidate may be used as a slot address
    using AddressPredicate = std::function<bool(const Pubkey &)>;

    inline Seed seedFromString(const std::string &text) { return Seed(text.begin(), text.end()); }

    inline Seed seedFromKey(const Pubkey &key) { return key.toVector(); }

    /// Slot address and the bump byte that produced it
    struct DerivedAddress {
        Pubkey address;
        dp::u8 bump{0};

        inline bool operator==(const DerivedAddress &other) const {
            return address == other.address && bump == other.bump;
        }
        inline bool operator!=(const DerivedAddress &other) const { return !(*this == other); }
    };

    /// Deterministic slot addressing for one program identity.
    ///
    /// create(): SHA-256(seeds || bump || program_id || "ProgramDerivedAddress"), accepted only if the
    /// validity predicate holds (off-curve by default).
    /// find(): searches the bump from 255 down to 0 and returns the first accepted candidate.
    class AddressDeriver {
      public:
        explicit AddressDeriver(const Pubkey &program_id, AddressPredicate predicate = isOffCurve);

        /// Derive the address for an explicit bump
        dp::Result<Pubkey, dp::Error> create(const std::vector<Seed> &seeds, dp::u8 bump) const;

        /// Search for the canonical bump. Fails with address_exhausted if no bump is accepted.
        dp::Result<DerivedAddress, dp::Error> find(const std::vector<Seed> &seeds) const;

        /// Recompute from seeds and bump and compare against a claimed address
        dp::Result<void, dp::Error> confirm(const std::vector<Seed> &seeds, dp::u8 bump, const Pubkey &claimed) const;

        inline const Pubkey &programId() const { return program_id_; }

      private:
        dp::Result<Pubkey, dp::Error> hashCandidate(const std::vector<Seed> &seeds, dp::u8 bump) const;

        Pubkey program_id_;
        AddressPredicate predicate_;
    };

} // namespace keyreg::address
