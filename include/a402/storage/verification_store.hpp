#pragma once
#include <a402/schema/primitives.hpp>
#include <a402/schema/verification_record.hpp>
#include <optional>
#include <string_view>

namespace a402::storage {

/// Verification table keyed by normalized (lower-cased) transaction id.
/// Implementations must tolerate concurrent readers and writers.
template <typename Library>
struct verification_store {
  /// Stored record for `transaction_id`, or std::nullopt when missing.
  std::optional<a402::schema::verification_record_t> find(
      std::string_view transaction_id) const;

  /// Store `record` unless the key already holds one. Returns whichever
  /// record is stored after the call.
  a402::schema::verification_record_t insert(
      const a402::schema::verification_record_t& record);

  /// Any verified record paid by `payer`.
  std::optional<a402::schema::verification_record_t> find_verified_by_payer(
      const a402::schema::address_t& payer) const;

  std::size_t size() const;
};

template <typename Library>
verification_store<Library> make_verification_store();

}  // namespace a402::storage
