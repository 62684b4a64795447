#include <a402/abi/error.hpp>
#include <a402/verification/verifier.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <utility>

namespace a402::verification {

namespace {

using a402::schema::verification_error_code;
using a402::schema::verification_result_t;
using a402::schema::verification_status_t;

inline constexpr auto kCodespace = std::string_view{"a402.verify"};

verification_result_t make_outcome(const verification_status_t status,
                                   const verification_error_code code,
                                   std::string reason) {
  auto result = verification_result_t{};
  result.status = status;
  result.code = code;
  result.reason = std::move(reason);
  result.codespace = std::string{kCodespace};
  return result;
}

verification_result_t make_verified(
    a402::schema::verification_record_t record) {
  auto result = verification_result_t{};
  result.status = verification_status_t::verified;
  result.code = verification_error_code::ok;
  result.codespace = std::string{kCodespace};
  result.record = std::move(record);
  return result;
}

a402::schema::timestamp_milliseconds_t now_milliseconds() {
  return static_cast<a402::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace

bool is_valid_transaction_id(const std::string_view transaction_id) {
  return transaction_id.size() == 66 &&
         a402::schema::try_make_hash32(transaction_id).has_value() &&
         (transaction_id.starts_with("0x") || transaction_id.starts_with("0X"));
}

payment_verifier::payment_verifier(const a402::rpc::chain_reader& reader,
                                   verification_store_t& store,
                                   verifier_options options)
    : reader_{reader}, store_{store}, options_{std::move(options)} {}

verification_result_t payment_verifier::verify(
    const std::string_view transaction_id) {
  if (!is_valid_transaction_id(transaction_id)) {
    spdlog::warn("Rejecting malformed transaction id '{}'", transaction_id);
    return make_outcome(verification_status_t::rejected,
                        verification_error_code::invalid_transaction_id,
                        "invalid transaction id");
  }
  auto normalized = a402::schema::to_lower(transaction_id);

  if (auto stored = store_.find(normalized);
      stored.has_value() && stored->verified) {
    spdlog::debug("Transaction {} already verified", normalized);
    return make_verified(std::move(*stored));
  }

  try {
    return verify_on_chain(normalized);
  } catch (const a402::rpc::transport_error& e) {
    spdlog::error("Transport failure while verifying {}: {}", normalized,
                  e.what());
    return make_outcome(verification_status_t::transport_failure,
                        verification_error_code::transport_failure, e.what());
  } catch (const a402::rpc::response_error& e) {
    spdlog::warn("Malformed chain response for {}: {}", normalized, e.what());
    return make_outcome(verification_status_t::decode_error,
                        verification_error_code::decode_error, e.what());
  } catch (const a402::abi::abi_error& e) {
    spdlog::warn("Undecodable chain data for {}: {}", normalized, e.what());
    return make_outcome(verification_status_t::decode_error,
                        verification_error_code::decode_error, e.what());
  }
}

verification_result_t payment_verifier::verify_on_chain(
    const std::string& transaction_id) {
  auto receipt = reader_.get_receipt(transaction_id);
  if (!receipt.has_value()) {
    if (!reader_.get_transaction(transaction_id).has_value()) {
      spdlog::warn("Transaction {} not found", transaction_id);
      return make_outcome(verification_status_t::not_found,
                          verification_error_code::not_found,
                          "transaction not found");
    }
    spdlog::debug("Transaction {} is pending", transaction_id);
    return make_outcome(verification_status_t::pending,
                        verification_error_code::pending,
                        "transaction pending, retry later");
  }

  if (!receipt->succeeded()) {
    spdlog::warn("Transaction {} reverted", transaction_id);
    return make_outcome(verification_status_t::reverted,
                        verification_error_code::reverted,
                        "transaction failed on-chain");
  }

  auto tx = reader_.get_transaction(transaction_id);
  if (!tx.has_value()) {
    spdlog::warn("Receipt for {} has no matching transaction", transaction_id);
    return make_outcome(verification_status_t::not_found,
                        verification_error_code::not_found,
                        "transaction not found");
  }
  if (!tx->to.has_value() || *tx->to != options_.contract) {
    spdlog::warn("Transaction {} was sent to {}, not the verifier contract",
                 transaction_id,
                 tx->to ? a402::schema::to_hex_prefixed(*tx->to)
                        : std::string{"<contract creation>"});
    return make_outcome(verification_status_t::rejected,
                        verification_error_code::wrong_destination,
                        "transaction not sent to the verifier contract");
  }

  auto contract_logs = std::vector<const a402::schema::log_entry_t*>{};
  for (const auto& log : receipt->logs) {
    if (log.address == options_.contract) {
      contract_logs.push_back(&log);
    }
  }
  if (contract_logs.empty()) {
    spdlog::warn("Transaction {} emitted no contract events", transaction_id);
    return make_outcome(verification_status_t::rejected,
                        verification_error_code::no_contract_events,
                        "no contract events in transaction");
  }

  for (const auto* log : contract_logs) {
    auto event = match(*log);
    if (!event.has_value()) {
      continue;
    }
    auto record = a402::schema::verification_record_t{};
    record.transaction_id = transaction_id;
    record.verified = true;
    record.payer = event->payer;
    record.beneficiary = event->beneficiary;
    record.amount = event->amount;
    record.timestamp = now_milliseconds();
    auto stored = store_.insert(record);
    spdlog::info("Verified payment {} from {} to {} of {}", transaction_id,
                 a402::schema::to_hex_prefixed(stored.payer),
                 a402::schema::to_hex_prefixed(stored.beneficiary),
                 stored.amount.str());
    return make_verified(std::move(stored));
  }

  spdlog::warn("Transaction {} has no matching payment event", transaction_id);
  return make_outcome(verification_status_t::rejected,
                      verification_error_code::no_matching_payment,
                      "no matching payment event");
}

std::optional<a402::contract::payment_event_t> payment_verifier::match(
    const a402::schema::log_entry_t& log) const {
  if (options_.event_topic.has_value() &&
      (log.topics.empty() || log.topics.front() != *options_.event_topic)) {
    return std::nullopt;
  }
  auto event = a402::contract::try_decode_payment_event(log);
  if (!event.has_value()) {
    spdlog::debug("Skipping log {} without the payment layout", log.log_index);
    return std::nullopt;
  }
  if (event->beneficiary != options_.beneficiary) {
    spdlog::debug("Skipping log {} paid to {}", log.log_index,
                  a402::schema::to_hex_prefixed(event->beneficiary));
    return std::nullopt;
  }
  if (event->amount < options_.price) {
    spdlog::debug("Skipping log {} with insufficient amount {}", log.log_index,
                  event->amount.str());
    return std::nullopt;
  }
  if (options_.require_resource_match &&
      a402::contract::try_decode_event_resource_id(log) !=
          options_.resource_id) {
    spdlog::debug("Skipping log {} for another resource", log.log_index);
    return std::nullopt;
  }
  return event;
}

}  // namespace a402::verification
