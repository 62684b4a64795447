#pragma once

#include <a402/schema/primitives.hpp>

#include <string>

// Schema type: resource.
// Read-only view of a paywalled resource as returned by the vault contract.
namespace a402::schema {

struct resource_t final {
  std::string resource_id;
  amount_t price{};
  bool lifetime{};
  bool active{};
  bool exists{};
  std::string content_type;
  std::string content_ref;
  amount_t total_payments{};
};

}  // namespace a402::schema
