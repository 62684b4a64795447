#pragma once

#include <a402/schema/content_kind.hpp>

#include <optional>
#include <string>

// Schema type: content descriptor.
// Canonical form of a content reference. `resolved_locator` is empty for
// unknown content; `platform_id` is set only for video-platform content.
namespace a402::schema {

struct content_descriptor_t final {
  content_kind_t kind{content_kind_t::unknown};
  std::string resolved_locator;
  std::optional<std::string> platform_id;

  bool operator==(const content_descriptor_t&) const = default;
};

}  // namespace a402::schema
