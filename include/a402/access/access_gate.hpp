#pragma once

#include <a402/contract/vault.hpp>
#include <a402/schema/access_source.hpp>
#include <a402/schema/primitives.hpp>
#include <a402/verification/verifier.hpp>

#include <optional>
#include <string>

namespace a402::access {

struct access_decision_t final {
  bool granted{};
  a402::schema::access_source_t source{a402::schema::access_source_t::none};
  std::optional<a402::schema::verification_record_t> record;
};

/// Decides whether a wallet may see the resource: first from payments
/// verified in this process, then, if lifetime access is enabled, from the
/// contract. Any failure on the chain path counts as no access.
class access_gate final {
 public:
  access_gate(const a402::verification::verification_store_t& store,
              const a402::contract::vault_client& vault,
              std::string resource_id,
              bool lifetime_access);

  access_decision_t check(const a402::schema::address_t& user) const;

 private:
  const a402::verification::verification_store_t& store_;
  const a402::contract::vault_client& vault_;
  std::string resource_id_;
  bool lifetime_access_;
};

}  // namespace a402::access
