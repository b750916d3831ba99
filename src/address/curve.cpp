#include <keyreg/address/curve.hpp>

namespace keyreg::address {

    namespace {

        using u64 = std::uint64_t;
        using u128 = unsigned __int128;

        constexpr u64 LOW_51_BITS = (u64(1) << 51) - 1;

        // 16p, limb-wise, so subtraction never underflows on reduced inputs
        constexpr u64 SIXTEEN_P_LIMB0 = 36028797018963664ULL;
        constexpr u64 SIXTEEN_P_LIMBS = 36028797018963952ULL;

        /// Element of GF(2^255 - 19), five 51-bit limbs, little-endian
        struct FieldElement {
            u64 limbs[5];
        };

        inline FieldElement feFromU64(u64 value) { return FieldElement{{value, 0, 0, 0, 0}}; }

        inline u64 load64(const Bytes32 &bytes, size_t offset) {
            u64 result = 0;
            for (size_t i = 0; i < 8; ++i) {
                result |= static_cast<u64>(bytes[offset + i]) << (8 * i);
            }
            return result;
        }

        // Top bit is ignored (it carries the sign of x in a point encoding)
        inline FieldElement feFromBytes(const Bytes32 &bytes) {
            return FieldElement{{
                load64(bytes, 0) & LOW_51_BITS,
                (load64(bytes, 6) >> 3) & LOW_51_BITS,
                (load64(bytes, 12) >> 6) & LOW_51_BITS,
                (load64(bytes, 19) >> 1) & LOW_51_BITS,
                (load64(bytes, 24) >> 12) & LOW_51_BITS,
            }};
        }

        inline FieldElement feReduce(const FieldElement &a) {
            u64 l[5] = {a.limbs[0], a.limbs[1], a.limbs[2], a.limbs[3], a.limbs[4]};

            u64 c0 = l[0] >> 51;
            u64 c1 = l[1] >> 51;
            u64 c2 = l[2] >> 51;
            u64 c3 = l[3] >> 51;
            u64 c4 = l[4] >> 51;

            l[0] &= LOW_51_BITS;
            l[1] &= LOW_51_BITS;
            l[2] &= LOW_51_BITS;
            l[3] &= LOW_51_BITS;
            l[4] &= LOW_51_BITS;

            // 2^255 = 19 mod p
            l[0] += c4 * 19;
            l[1] += c0;
            l[2] += c1;
            l[3] += c2;
            l[4] += c3;

            return FieldElement{{l[0], l[1], l[2], l[3], l[4]}};
        }

        inline FieldElement feAdd(const FieldElement &a, const FieldElement &b) {
            FieldElement sum;
            for (int i = 0; i < 5; ++i) {
                sum.limbs[i] = a.limbs[i] + b.limbs[i];
            }
            return feReduce(sum);
        }

        inline FieldElement feSub(const FieldElement &a, const FieldElement &b) {
            FieldElement diff;
            diff.limbs[0] = (a.limbs[0] + SIXTEEN_P_LIMB0) - b.limbs[0];
            for (int i = 1; i < 5; ++i) {
                diff.limbs[i] = (a.limbs[i] + SIXTEEN_P_LIMBS) - b.limbs[i];
            }
            return feReduce(diff);
        }

        inline FieldElement feNeg(const FieldElement &a) { return feSub(feFromU64(0), a); }

        inline u128 m(u64 x, u64 y) { return static_cast<u128>(x) * static_cast<u128>(y); }

        FieldElement feMul(const FieldElement &x, const FieldElement &y) {
            const u64 *a = x.limbs;
            const u64 *b = y.limbs;

            u64 b1_19 = b[1] * 19;
            u64 b2_19 = b[2] * 19;
            u64 b3_19 = b[3] * 19;
            u64 b4_19 = b[4] * 19;

            u128 c0 = m(a[0], b[0]) + m(a[4], b1_19) + m(a[3], b2_19) + m(a[2], b3_19) + m(a[1], b4_19);
            u128 c1 = m(a[1], b[0]) + m(a[0], b[1]) + m(a[4], b2_19) + m(a[3], b3_19) + m(a[2], b4_19);
            u128 c2 = m(a[2], b[0]) + m(a[1], b[1]) + m(a[0], b[2]) + m(a[4], b3_19) + m(a[3], b4_19);
            u128 c3 = m(a[3], b[0]) + m(a[2], b[1]) + m(a[1], b[2]) + m(a[0], b[3]) + m(a[4], b4_19);
            u128 c4 = m(a[4], b[0]) + m(a[3], b[1]) + m(a[2], b[2]) + m(a[1], b[3]) + m(a[0], b[4]);

            FieldElement out;
            c1 += static_cast<u64>(c0 >> 51);
            out.limbs[0] = static_cast<u64>(c0) & LOW_51_BITS;

            c2 += static_cast<u64>(c1 >> 51);
            out.limbs[1] = static_cast<u64>(c1) & LOW_51_BITS;

            c3 += static_cast<u64>(c2 >> 51);
            out.limbs[2] = static_cast<u64>(c2) & LOW_51_BITS;

            c4 += static_cast<u64>(c3 >> 51);
            out.limbs[3] = static_cast<u64>(c3) & LOW_51_BITS;

            u64 carry = static_cast<u64>(c4 >> 51);
            out.limbs[4] = static_cast<u64>(c4) & LOW_51_BITS;

            out.limbs[0] += carry * 19;
            out.limbs[1] += out.limbs[0] >> 51;
            out.limbs[0] &= LOW_51_BITS;

            return out;
        }

        inline FieldElement feSquare(const FieldElement &a) { return feMul(a, a); }

        /// a^e, e given as 32 little-endian bytes
        FieldElement fePow(const FieldElement &a, const Bytes32 &exponent) {
            FieldElement result = feFromU64(1);
            for (int bit = 255; bit >= 0; --bit) {
                result = feSquare(result);
                if ((exponent[static_cast<size_t>(bit / 8)] >> (bit % 8)) & 1) {
                    result = feMul(result, a);
                }
            }
            return result;
        }

        /// Fully reduced limbs, unique per field element
        FieldElement feCanonical(const FieldElement &a) {
            FieldElement h = feReduce(a);
            u64 *l = h.limbs;

            u64 q = (l[0] + 19) >> 51;
            q = (l[1] + q) >> 51;
            q = (l[2] + q) >> 51;
            q = (l[3] + q) >> 51;
            q = (l[4] + q) >> 51;

            l[0] += 19 * q;

            l[1] += l[0] >> 51;
            l[0] &= LOW_51_BITS;
            l[2] += l[1] >> 51;
            l[1] &= LOW_51_BITS;
            l[3] += l[2] >> 51;
            l[2] &= LOW_51_BITS;
            l[4] += l[3] >> 51;
            l[3] &= LOW_51_BITS;
            l[4] &= LOW_51_BITS;

            return h;
        }

        bool feEqual(const FieldElement &a, const FieldElement &b) {
            auto ca = feCanonical(a);
            auto cb = feCanonical(b);
            for (int i = 0; i < 5; ++i) {
                if (ca.limbs[i] != cb.limbs[i])
                    return false;
            }
            return true;
        }

        Bytes32 makeExponent(dp::u8 low, dp::u8 high) {
            Bytes32 exponent;
            exponent.fill(0xFF);
            exponent[0] = low;
            exponent[31] = high;
            return exponent;
        }

        // p - 2, for inversion
        const Bytes32 &pMinus2() {
            static const Bytes32 exponent = makeExponent(0xEB, 0x7F);
            return exponent;
        }

        // (p - 5) / 8 = 2^252 - 3, for the square-root ratio
        const Bytes32 &pMinus5Over8() {
            static const Bytes32 exponent = makeExponent(0xFD, 0x0F);
            return exponent;
        }

        // d = -121665 / 121666
        const FieldElement &edwardsD() {
            static const FieldElement d = feMul(feNeg(feFromU64(121665)), fePow(feFromU64(121666), pMinus2()));
            return d;
        }

    } // namespace

    bool isOnCurve(const Bytes32 &compressed) {
        const FieldElement one = feFromU64(1);

        FieldElement y = feFromBytes(compressed);
        FieldElement yy = feSquare(y);
        FieldElement u = feSub(yy, one);
        FieldElement v = feAdd(feMul(yy, edwardsD()), one);

        // r = u * v^3 * (u * v^7)^((p-5)/8)
        FieldElement v3 = feMul(feSquare(v), v);
        FieldElement v7 = feMul(feSquare(v3), v);
        FieldElement r = feMul(feMul(fePow(feMul(u, v7), pMinus5Over8()), u), v3);

        // x^2 = u/v has a root iff v * r^2 is u or -u
        FieldElement check = feMul(v, feSquare(r));
        return feEqual(check, u) || feEqual(check, feNeg(u));
    }

} // namespace keyreg::address
