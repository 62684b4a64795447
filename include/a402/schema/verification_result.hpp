#pragma once

#include <a402/schema/verification_error_code.hpp>
#include <a402/schema/verification_record.hpp>
#include <a402/schema/verification_status.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: verification result.
// Envelope returned by the verifier: status, numeric code, human readable
// reason and, for verified payments, the stored record.
namespace a402::schema {

template <uint16_t Version>
struct verification_result;

template <>
struct verification_result<1> final {
  uint16_t version{1};
  verification_status_t status{verification_status_t::unseen};
  verification_error_code code{verification_error_code::ok};
  std::string reason;
  std::string codespace;
  std::optional<verification_record_t> record;

  bool verified() const {
    return status == verification_status_t::verified && record.has_value();
  }
};

using verification_result_t = verification_result<1>;

}  // namespace a402::schema
