#pragma once

#include <a402/abi/types.hpp>
#include <a402/rpc/chain_reader.hpp>
#include <a402/schema/log_entry.hpp>
#include <a402/schema/primitives.hpp>
#include <a402/schema/resource.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace a402::contract {

inline constexpr auto kHasAccessSignature =
    std::string_view{"hasAccess(string,address)"};
inline constexpr auto kGetResourceSignature =
    std::string_view{"getResource(string)"};
inline constexpr auto kPayForAccessSignature =
    std::string_view{"payForAccess(string,bytes32)"};

/// Payment event layout: payer and beneficiary are indexed (topics 1 and 2),
/// the amount is the second word of the non-indexed data.
inline constexpr auto kPayerTopic = std::size_t{1};
inline constexpr auto kBeneficiaryTopic = std::size_t{2};
inline constexpr auto kMinimumPaymentTopics = std::size_t{3};
inline constexpr auto kResourceIdWord = std::size_t{0};
inline constexpr auto kAmountWord = std::size_t{1};
inline constexpr auto kMinimumPaymentDataBytes = 2 * abi::kWordSize;

/// Output shape of getResource(string).
const std::vector<abi::field_shape_t>& resource_shape();

a402::schema::bytes_t encode_has_access(std::string_view resource_id,
                                        const a402::schema::address_t& user);
a402::schema::bytes_t encode_get_resource(std::string_view resource_id);
a402::schema::bytes_t encode_pay_for_access(
    std::string_view resource_id,
    const a402::schema::hash32_t& nonce);

/// Throws abi_error on malformed return data.
a402::schema::resource_t decode_resource(std::string_view resource_id,
                                         const a402::schema::bytes_view_t& data);

/// Fields of a payment event log, decoded without judging them.
struct payment_event_t final {
  a402::schema::address_t payer{};
  a402::schema::address_t beneficiary{};
  a402::schema::amount_t amount{};
};

/// std::nullopt for logs that do not have the payment layout (too few
/// topics or data words); such logs belong to other events.
std::optional<payment_event_t> try_decode_payment_event(
    const a402::schema::log_entry_t& log);

/// Resource id carried as a dynamic string in the event data, when the
/// contract emits it there.
std::optional<std::string> try_decode_event_resource_id(
    const a402::schema::log_entry_t& log);

/// Read-only client for the vault contract.
class vault_client final {
 public:
  vault_client(const a402::rpc::chain_reader& reader,
               a402::schema::address_t contract);

  /// Lifetime access flag for `user`. An empty return counts as no access.
  bool has_access(std::string_view resource_id,
                  const a402::schema::address_t& user) const;

  a402::schema::resource_t get_resource(std::string_view resource_id) const;

  const a402::schema::address_t& contract() const { return contract_; }

 private:
  const a402::rpc::chain_reader& reader_;
  a402::schema::address_t contract_;
};

}  // namespace a402::contract
