#pragma once
#include <spdlog/spdlog.h>
#include <a402/schema/primitives.hpp>
#include <a402/storage/verification_store.hpp>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace a402::storage {

/// Process-lifetime table. Nothing is evicted.
struct memory_store_tag {};

template <>
struct verification_store<memory_store_tag> final {
  std::optional<a402::schema::verification_record_t> find(
      const std::string_view transaction_id) const {
    auto lock = std::scoped_lock{mutex_};
    auto it = records_.find(a402::schema::to_lower(transaction_id));
    if (it == records_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  a402::schema::verification_record_t insert(
      const a402::schema::verification_record_t& record) {
    auto key = a402::schema::to_lower(record.transaction_id);
    auto lock = std::scoped_lock{mutex_};
    auto [it, inserted] = records_.try_emplace(key, record);
    if (inserted) {
      it->second.transaction_id = key;
    } else {
      spdlog::debug("verification record for {} already stored", key);
    }
    return it->second;
  }

  std::optional<a402::schema::verification_record_t> find_verified_by_payer(
      const a402::schema::address_t& payer) const {
    auto lock = std::scoped_lock{mutex_};
    for (const auto& [_, record] : records_) {
      if (record.verified && record.payer == payer) {
        return record;
      }
    }
    return std::nullopt;
  }

  std::size_t size() const {
    auto lock = std::scoped_lock{mutex_};
    return records_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, a402::schema::verification_record_t, std::less<>>
      records_;
};

template <>
inline verification_store<memory_store_tag>
make_verification_store<memory_store_tag>() {
  return {};
}

}  // namespace a402::storage
