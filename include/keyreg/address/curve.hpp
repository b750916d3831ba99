#pragma once

#include <keyreg/common/bytes.hpp>

namespace keyreg::address {

    /// Check whether 32 bytes are the compressed encoding of an edwards25519 point.
    /// Follows the usual decompression rule: the top bit is the sign of x, the remaining
    /// 255 bits are y (non-canonical y is reduced mod p), and the bytes are on the curve
    /// iff (y^2 - 1) / (d*y^2 + 1) is a square.
    bool isOnCurve(const Bytes32 &compressed);

    inline bool isOnCurve(const Pubkey &key) { return isOnCurve(key.bytes()); }

    /// Default address validity predicate: derived addresses must have no private key,
    /// so they must not be curve points.
    inline bool isOffCurve(const Pubkey &key) { return !isOnCurve(key.bytes()); }

} // namespace keyreg::address
