#pragma once

#include <a402/contract/vault.hpp>
#include <a402/rpc/chain_reader.hpp>
#include <a402/schema/primitives.hpp>
#include <a402/schema/verification_result.hpp>
#include <a402/storage/memory/verification_store.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace a402::verification {

using verification_store_t =
    a402::storage::verification_store<a402::storage::memory_store_tag>;

/// What a qualifying payment log must show.
struct verifier_options final {
  a402::schema::address_t contract{};
  a402::schema::address_t beneficiary{};
  a402::schema::amount_t price{};
  /// When set, logs whose topic 0 differs are skipped.
  std::optional<a402::schema::hash32_t> event_topic;
  /// When true, the event data must carry `resource_id` as its leading
  /// dynamic string.
  bool require_resource_match{false};
  std::string resource_id;
};

/// Turns an untrusted transaction id into a payment verdict.
///
/// Anything other than a verified result means "payment required". Only
/// verified outcomes are stored; every other outcome is recomputed on the
/// next call, so pending and transport failures can simply be retried.
class payment_verifier final {
 public:
  payment_verifier(const a402::rpc::chain_reader& reader,
                   verification_store_t& store,
                   verifier_options options);

  /// Never throws for chain-boundary failures; they come back as a status
  /// and error code.
  a402::schema::verification_result_t verify(std::string_view transaction_id);

  const verifier_options& options() const { return options_; }

 private:
  a402::schema::verification_result_t verify_on_chain(
      const std::string& transaction_id);

  std::optional<a402::contract::payment_event_t> match(
      const a402::schema::log_entry_t& log) const;

  const a402::rpc::chain_reader& reader_;
  verification_store_t& store_;
  verifier_options options_;
};

/// `0x` followed by 64 hex digits, any case.
bool is_valid_transaction_id(std::string_view transaction_id);

}  // namespace a402::verification
