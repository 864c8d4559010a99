/**
 * @file field_example.cpp
 * @brief secp256k1 base field example
 */

#include "secpfield/secpfield.h"
#include <stdexcept>
#include <iostream>

using secpfield::Secp256K1Base;

int main() {
    std::cout << "=== secpfield Field Example ===" << std::endl;
    std::cout << "Library version: " << secpfield_version() << std::endl;

    std::cout << "p      = " << Secp256K1Base::order().to_decimal() << std::endl;
    std::cout << "-1     = " << Secp256K1Base::NEG_ONE << std::endl;
    std::cout << "g      = " << Secp256K1Base::MULTIPLICATIVE_GROUP_GENERATOR
              << (Secp256K1Base::is_multiplicative_generator(
                      Secp256K1Base::MULTIPLICATIVE_GROUP_GENERATOR) ? " (generator)" : "")
              << std::endl;

    Secp256K1Base a = Secp256K1Base::from_hex(
        "79BE667EF9DCBBAC55A06295CE870B07029BFCDB2DCE28D959F2815B16F81798");
    Secp256K1Base b = Secp256K1Base::from_canonical_u64(7);

    std::cout << "a      = " << a << std::endl;
    std::cout << "a + 7  = " << a + b << std::endl;
    std::cout << "a * 7  = " << a * b << std::endl;
    std::cout << "a / 7  = " << a / b << std::endl;
    std::cout << "a^-1   = " << a.inverse() << std::endl;

    try {
        std::cout << a / Secp256K1Base::ZERO << std::endl;
    } catch (const std::domain_error& e) {
        std::cout << "a / 0  -> " << e.what() << std::endl;
    }

    auto r = Secp256K1Base::rand();
    std::cout << "random = " << r << (r.is_canonical() ? " (canonical)" : "") << std::endl;
    return 0;
}
