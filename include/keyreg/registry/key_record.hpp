#pragma once

#include <array>
#include <string>
#include <vector>

#include <keyreg/common/bytes.hpp>

namespace keyreg {

    using Discriminator = std::array<dp::u8, 8>;

    /// Persisted key record: owner(32) + credential(32) + bump(1), behind an 8-byte type tag
    struct KeyRecord {
        static constexpr dp::usize DISCRIMINATOR_LEN = 8;
        static constexpr dp::usize LEN = 32 + 32 + 1; // owner + credential + bump
        static constexpr dp::usize SPACE = DISCRIMINATOR_LEN + LEN;

        Pubkey owner;
        Credential credential{};
        dp::u8 bump{0};

        KeyRecord() = default;

        KeyRecord(const Pubkey &owner_key, const Credential &key, dp::u8 bump_seed)
            : owner(owner_key), credential(key), bump(bump_seed) {}

        /// First 8 bytes of SHA-256("account:KeyRecord")
        inline static dp::Result<Discriminator, dp::Error> discriminator() {
            const std::string tag = "account:KeyRecord";
            auto digest = sha256(std::vector<uint8_t>(tag.begin(), tag.end()));
            if (!digest.is_ok()) {
                return dp::Result<Discriminator, dp::Error>::err(digest.error());
            }

            Discriminator disc{};
            std::copy(digest.value().begin(), digest.value().begin() + DISCRIMINATOR_LEN, disc.begin());
            return dp::Result<Discriminator, dp::Error>::ok(disc);
        }

        /// Serialize to the fixed SPACE-byte layout
        inline dp::Result<std::vector<uint8_t>, dp::Error> serialize() const {
            auto disc = discriminator();
            if (!disc.is_ok()) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(disc.error());
            }

            std::vector<uint8_t> data;
            data.reserve(SPACE);
            data.insert(data.end(), disc.value().begin(), disc.value().end());
            data.insert(data.end(), owner.bytes().begin(), owner.bytes().end());
            data.insert(data.end(), credential.begin(), credential.end());
            data.push_back(bump);
            return dp::Result<std::vector<uint8_t>, dp::Error>::ok(data);
        }

        /// Deserialize, checking size and type tag
        inline static dp::Result<KeyRecord, dp::Error> deserialize(const std::vector<uint8_t> &data) {
            if (data.size() != SPACE) {
                return dp::Result<KeyRecord, dp::Error>::err(account_data_mismatch("Key record must be 73 bytes"));
            }

            auto disc = discriminator();
            if (!disc.is_ok()) {
                return dp::Result<KeyRecord, dp::Error>::err(disc.error());
            }
            if (!std::equal(disc.value().begin(), disc.value().end(), data.begin())) {
                return dp::Result<KeyRecord, dp::Error>::err(account_data_mismatch("Key record type tag mismatch"));
            }

            size_t offset = DISCRIMINATOR_LEN;

            Bytes32 owner_bytes{};
            std::copy(data.begin() + offset, data.begin() + offset + 32, owner_bytes.begin());
            offset += 32;

            Credential key{};
            std::copy(data.begin() + offset, data.begin() + offset + 32, key.begin());
            offset += 32;

            return dp::Result<KeyRecord, dp::Error>::ok(KeyRecord(Pubkey(owner_bytes), key, data[offset]));
        }

        inline bool operator==(const KeyRecord &other) const {
            return owner == other.owner && credential == other.credential && bump == other.bump;
        }

        inline bool operator!=(const KeyRecord &other) const { return !(*this == other); }
    };

} // namespace keyreg
