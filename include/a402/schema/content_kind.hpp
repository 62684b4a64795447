#pragma once

#include <a402/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: content kind.
// Where a creator's content reference points: decentralized storage, a
// directly playable media URL, a hosted video platform, or nothing usable.
namespace a402::schema {

enum class content_kind_t : uint8_t {
  unknown = 0,
  ipfs = 1,
  direct_media = 2,
  video_platform = 3
};

inline constexpr auto kContentKindNames = enum_names_t<content_kind_t, 4>{{
    {"unknown", content_kind_t::unknown},
    {"ipfs", content_kind_t::ipfs},
    {"direct-media", content_kind_t::direct_media},
    {"video-platform", content_kind_t::video_platform},
}};

template <>
inline std::optional<content_kind_t> try_from_string<content_kind_t>(
    const std::string_view value) {
  return lookup_enum(value, kContentKindNames);
}

inline constexpr std::string_view to_string(const content_kind_t value) {
  return name_of(value, kContentKindNames, "unknown");
}

}  // namespace a402::schema
