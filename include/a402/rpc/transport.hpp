#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace a402::rpc {

/// One JSON-RPC round trip: send `method` with `params`, return the
/// `result` member (which may be null). Implementations throw
/// transport_error for anything that prevents a well-formed answer.
using transport_t =
    std::function<nlohmann::json(std::string_view method,
                                 const nlohmann::json& params)>;

/// Network failure, timeout, HTTP error, unparsable body or a JSON-RPC
/// error object. Always safe to retry.
class transport_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Well-formed response whose result does not have the expected shape.
class response_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace a402::rpc
