#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace a402::abi {

enum class abi_error_code : uint32_t {
  truncated_data = 1,
  unsupported_type = 2,
  arity_mismatch = 3,
  type_mismatch = 4,
  invalid_signature = 5,
  invalid_value = 6,
  missing_field = 7,
};

class abi_error final : public std::runtime_error {
 public:
  abi_error(const abi_error_code code, const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  abi_error_code code() const noexcept { return code_; }

 private:
  abi_error_code code_;
};

}  // namespace a402::abi
