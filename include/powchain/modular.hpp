#pragma once

#include "powchain/errors.hpp"
#include <openssl/bn.h>
#include <memory>
#include <string>

namespace powchain::crypto {

/**
 * @brief Arbitrary-precision signed integer backed by an OpenSSL BIGNUM
 *
 * Division truncates toward zero and the remainder takes the sign of the
 * dividend, matching the built-in integer operators. Use modulo() for the
 * mathematical residue.
 */
class BigInt {
public:
    BigInt();
    BigInt(long long value);

    BigInt(const BigInt& other);
    BigInt(BigInt&& other) noexcept = default;
    BigInt& operator=(const BigInt& other);
    BigInt& operator=(BigInt&& other) noexcept = default;
    ~BigInt() = default;

    /// Parse a decimal string, optionally prefixed with '-'
    static BigInt from_dec(const std::string& text);

    /// Parse a hex string (no 0x prefix), optionally prefixed with '-'
    static BigInt from_hex(const std::string& text);

    std::string to_dec() const;
    std::string to_hex() const;

    bool is_zero() const;
    bool is_one() const;
    bool is_negative() const;

    /// Number of significant bits of the magnitude
    int num_bits() const;

    /// Three-way comparison: negative, zero or positive
    int compare(const BigInt& other) const;

    BigInt& operator+=(const BigInt& rhs);
    BigInt& operator-=(const BigInt& rhs);
    BigInt& operator*=(const BigInt& rhs);

    friend BigInt operator+(BigInt lhs, const BigInt& rhs) { return lhs += rhs; }
    friend BigInt operator-(BigInt lhs, const BigInt& rhs) { return lhs -= rhs; }
    friend BigInt operator*(BigInt lhs, const BigInt& rhs) { return lhs *= rhs; }
    friend BigInt operator/(const BigInt& lhs, const BigInt& rhs);
    friend BigInt operator%(const BigInt& lhs, const BigInt& rhs);
    BigInt operator-() const;

    friend bool operator==(const BigInt& a, const BigInt& b) { return a.compare(b) == 0; }
    friend bool operator!=(const BigInt& a, const BigInt& b) { return a.compare(b) != 0; }
    friend bool operator<(const BigInt& a, const BigInt& b) { return a.compare(b) < 0; }
    friend bool operator<=(const BigInt& a, const BigInt& b) { return a.compare(b) <= 0; }
    friend bool operator>(const BigInt& a, const BigInt& b) { return a.compare(b) > 0; }
    friend bool operator>=(const BigInt& a, const BigInt& b) { return a.compare(b) >= 0; }

    const BIGNUM* get() const { return bn_.get(); }

private:
    struct BignumDeleter {
        void operator()(BIGNUM* bn) const { BN_free(bn); }
    };

    /// Take ownership of a BIGNUM allocated by OpenSSL
    static BigInt adopt(BIGNUM* bn);

    std::unique_ptr<BIGNUM, BignumDeleter> bn_;
};

/// Residue of x modulo m in [0, m), correct for negative x.
/// Throws DomainError when m is not positive.
BigInt modulo(const BigInt& x, const BigInt& m);

/// Modular multiplicative inverse of n modulo b via the iterative extended
/// Euclidean algorithm. The result t satisfies 0 <= t < b and
/// modulo(n * t, b) == 1.
/// Throws DomainError when b < 2 or gcd(n, b) != 1.
BigInt modular_inverse(const BigInt& n, const BigInt& b);

} // namespace powchain::crypto
