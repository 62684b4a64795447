#include <a402/abi/error.hpp>
#include <a402/access/access_gate.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace a402::access {

access_gate::access_gate(const a402::verification::verification_store_t& store,
                         const a402::contract::vault_client& vault,
                         std::string resource_id,
                         const bool lifetime_access)
    : store_{store},
      vault_{vault},
      resource_id_{std::move(resource_id)},
      lifetime_access_{lifetime_access} {}

access_decision_t access_gate::check(const a402::schema::address_t& user) const {
  using enum a402::schema::access_source_t;

  if (auto record = store_.find_verified_by_payer(user); record.has_value()) {
    return access_decision_t{
        .granted = true, .source = session, .record = std::move(record)};
  }
  if (!lifetime_access_) {
    return access_decision_t{};
  }

  auto user_hex = a402::schema::to_hex_prefixed(user);
  try {
    if (vault_.has_access(resource_id_, user)) {
      spdlog::debug("{} holds lifetime access to {}", user_hex, resource_id_);
      return access_decision_t{.granted = true, .source = on_chain, .record = {}};
    }
  } catch (const a402::rpc::transport_error& e) {
    spdlog::warn("hasAccess for {} failed: {}", user_hex, e.what());
  } catch (const a402::rpc::response_error& e) {
    spdlog::warn("hasAccess for {} returned a malformed response: {}", user_hex,
                 e.what());
  } catch (const a402::abi::abi_error& e) {
    spdlog::warn("hasAccess for {} returned undecodable data: {}", user_hex,
                 e.what());
  }
  return access_decision_t{};
}

}  // namespace a402::access
