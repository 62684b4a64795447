#pragma once

#include <a402/schema/primitives.hpp>

#include <optional>

namespace a402::crypto {

/// 32 random bytes for payForAccess's replay-protection argument.
/// std::nullopt when the system RNG cannot be seeded.
std::optional<a402::schema::hash32_t> try_make_payment_nonce();

/// As above; an RNG failure is fatal.
a402::schema::hash32_t make_payment_nonce();

}  // namespace a402::crypto
