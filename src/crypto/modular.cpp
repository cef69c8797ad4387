#include "powchain/modular.hpp"
#include <openssl/crypto.h>
#include <stdexcept>

namespace powchain::crypto {

namespace {

struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

BnCtxPtr make_ctx() {
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to allocate BN_CTX");
    }
    return ctx;
}

BIGNUM* checked_new() {
    BIGNUM* bn = BN_new();
    if (!bn) {
        throw std::runtime_error("Failed to allocate BIGNUM");
    }
    return bn;
}

void check(int rc, const char* operation) {
    if (rc != 1) {
        throw std::runtime_error(std::string("BIGNUM operation failed: ") + operation);
    }
}

std::string take_openssl_string(char* text) {
    if (!text) {
        throw std::runtime_error("Failed to convert BIGNUM to string");
    }
    std::string result(text);
    OPENSSL_free(text);
    return result;
}

} // anonymous namespace

// BigInt implementation
BigInt::BigInt() : bn_(checked_new()) {}

BigInt BigInt::adopt(BIGNUM* bn) {
    BigInt result;
    result.bn_.reset(bn);
    return result;
}

BigInt::BigInt(long long value) : bn_(checked_new()) {
    unsigned long long magnitude = value < 0
        ? 0ULL - static_cast<unsigned long long>(value)
        : static_cast<unsigned long long>(value);
    check(BN_set_word(bn_.get(), static_cast<BN_ULONG>(magnitude)), "set_word");
    BN_set_negative(bn_.get(), value < 0 ? 1 : 0);
}

BigInt::BigInt(const BigInt& other) : bn_(BN_dup(other.bn_.get())) {
    if (!bn_) {
        throw std::runtime_error("Failed to copy BIGNUM");
    }
}

BigInt& BigInt::operator=(const BigInt& other) {
    if (this != &other) {
        BigInt copy(other);
        bn_ = std::move(copy.bn_);
    }
    return *this;
}

BigInt BigInt::from_dec(const std::string& text) {
    BIGNUM* bn = nullptr;
    int consumed = BN_dec2bn(&bn, text.c_str());
    if (consumed == 0 || static_cast<size_t>(consumed) != text.size()) {
        BN_free(bn);
        throw std::invalid_argument("Invalid decimal integer: " + text);
    }
    return adopt(bn);
}

BigInt BigInt::from_hex(const std::string& text) {
    BIGNUM* bn = nullptr;
    int consumed = BN_hex2bn(&bn, text.c_str());
    if (consumed == 0 || static_cast<size_t>(consumed) != text.size()) {
        BN_free(bn);
        throw std::invalid_argument("Invalid hex integer: " + text);
    }
    return adopt(bn);
}

std::string BigInt::to_dec() const {
    return take_openssl_string(BN_bn2dec(bn_.get()));
}

std::string BigInt::to_hex() const {
    return take_openssl_string(BN_bn2hex(bn_.get()));
}

bool BigInt::is_zero() const {
    return BN_is_zero(bn_.get());
}

bool BigInt::is_one() const {
    return BN_is_one(bn_.get());
}

bool BigInt::is_negative() const {
    return BN_is_negative(bn_.get());
}

int BigInt::num_bits() const {
    return BN_num_bits(bn_.get());
}

int BigInt::compare(const BigInt& other) const {
    return BN_cmp(bn_.get(), other.bn_.get());
}

BigInt& BigInt::operator+=(const BigInt& rhs) {
    check(BN_add(bn_.get(), bn_.get(), rhs.bn_.get()), "add");
    return *this;
}

BigInt& BigInt::operator-=(const BigInt& rhs) {
    check(BN_sub(bn_.get(), bn_.get(), rhs.bn_.get()), "sub");
    return *this;
}

BigInt& BigInt::operator*=(const BigInt& rhs) {
    auto ctx = make_ctx();
    check(BN_mul(bn_.get(), bn_.get(), rhs.bn_.get(), ctx.get()), "mul");
    return *this;
}

BigInt operator/(const BigInt& lhs, const BigInt& rhs) {
    if (rhs.is_zero()) {
        throw DomainError("Division by zero");
    }
    auto ctx = make_ctx();
    BigInt quotient;
    check(BN_div(quotient.bn_.get(), nullptr, lhs.bn_.get(), rhs.bn_.get(), ctx.get()), "div");
    return quotient;
}

BigInt operator%(const BigInt& lhs, const BigInt& rhs) {
    if (rhs.is_zero()) {
        throw DomainError("Division by zero");
    }
    auto ctx = make_ctx();
    BigInt remainder;
    check(BN_div(nullptr, remainder.bn_.get(), lhs.bn_.get(), rhs.bn_.get(), ctx.get()), "rem");
    return remainder;
}

BigInt BigInt::operator-() const {
    BigInt negated(*this);
    if (!negated.is_zero()) {
        BN_set_negative(negated.bn_.get(), is_negative() ? 0 : 1);
    }
    return negated;
}

// Modular arithmetic
BigInt modulo(const BigInt& x, const BigInt& m) {
    if (m.is_zero() || m.is_negative()) {
        throw DomainError("modulo requires a positive modulus, got " + m.to_dec());
    }
    return ((x % m) + m) % m;
}

BigInt modular_inverse(const BigInt& n, const BigInt& b) {
    if (b < BigInt(2)) {
        throw DomainError("modular_inverse requires a modulus greater than 1, got " + b.to_dec());
    }

    // Remainders: rn = t1 * n + t2 * b and rb = s1 * n + s2 * b at every step
    BigInt rn = modulo(n, b);
    BigInt rb = b;
    BigInt t1 = 1, t2 = 0;
    BigInt s1 = 0, s2 = 1;

    if (rn.is_zero()) {
        throw DomainError("modular_inverse: " + n.to_dec() + " has no inverse modulo " + b.to_dec());
    }

    // Euclid finishes in fewer than ~1.44 * bits steps
    const long max_steps = 2L * (rn.num_bits() + rb.num_bits()) + 8;

    for (long step = 0; step < max_steps; ++step) {
        if (rn < rb) {
            BigInt q = rb / rn;
            rb = modulo(rb, rn);
            s1 -= t1 * q;
            s2 -= t2 * q;
        } else {
            BigInt q = rn / rb;
            rn = modulo(rn, rb);
            t1 -= s1 * q;
            t2 -= s2 * q;
        }

        if (rb.is_zero()) {
            if (!rn.is_one()) {
                throw DomainError("modular_inverse: gcd(" + n.to_dec() + ", " + b.to_dec() +
                                  ") = " + rn.to_dec());
            }
            return modulo(t1, b);
        }
        if (rn.is_zero()) {
            if (!rb.is_one()) {
                throw DomainError("modular_inverse: gcd(" + n.to_dec() + ", " + b.to_dec() +
                                  ") = " + rb.to_dec());
            }
            return modulo(s1, b);
        }
    }

    throw DomainError("modular_inverse: step bound exceeded for modulus " + b.to_dec());
}

} // namespace powchain::crypto
