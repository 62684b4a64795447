#include <a402/content/resolver.hpp>
#include <a402/schema/primitives.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <exception>
#include <initializer_list>
#include <regex>
#include <string>
#include <utility>

namespace a402::content {

namespace {

using a402::schema::content_descriptor_t;
using a402::schema::content_kind_t;

inline constexpr auto kIpfsScheme = std::string_view{"ipfs://"};
inline constexpr auto kWhitespace = std::string_view{" \t\n\r\f\v"};
inline constexpr auto kVideoIdLength = std::size_t{11};

inline constexpr auto kMediaExtensions =
    std::array<std::string_view, 5>{".mp4", ".webm", ".ogg", ".mov", ".m3u8"};

bool ends_with_media_extension(const std::string_view path) {
  return std::ranges::any_of(kMediaExtensions, [&](const auto extension) {
    return path.size() >= extension.size() &&
           a402::schema::iequals(path.substr(path.size() - extension.size()),
                                 extension);
  });
}

/// A media extension closing the reference, or closing the text before any
/// `?` that starts a query.
bool has_media_extension(const std::string_view ref) {
  if (ends_with_media_extension(ref)) {
    return true;
  }
  for (auto q = ref.find('?'); q != std::string_view::npos;
       q = ref.find('?', q + 1)) {
    if (ends_with_media_extension(ref.substr(0, q))) {
      return true;
    }
  }
  return false;
}

const std::regex& video_url_pattern() {
  static const auto pattern = std::regex{
      R"((?:youtube\.com/watch\?v=|youtu\.be/|youtube\.com/embed/|youtube\.com/v/|youtube\.com/shorts/)([a-zA-Z0-9_-]{11}))"};
  return pattern;
}

bool is_alphanumeric(const std::string_view value) {
  return std::ranges::all_of(value, [](const char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z');
  });
}

/// CIDv0 (`Qm` + at least 44) or CIDv1 base32 (`bafy` + at least 50).
bool is_bare_cid(const std::string_view ref) {
  for (const auto& [prefix, minimum] :
       {std::pair<std::string_view, std::size_t>{"Qm", 44},
        std::pair<std::string_view, std::size_t>{"bafy", 50}}) {
    if (ref.starts_with(prefix)) {
      auto rest = ref.substr(prefix.size());
      return rest.size() >= minimum && is_alphanumeric(rest);
    }
  }
  return false;
}

const std::regex& video_id_pattern() {
  static const auto pattern = std::regex{R"(^[a-zA-Z0-9_-]{11}$)"};
  return pattern;
}

bool is_http_url(const std::string_view ref) {
  return ref.starts_with("http://") || ref.starts_with("https://");
}

std::string gateway_locator(std::string_view gateway,
                            const std::string_view cid) {
  while (gateway.ends_with('/')) {
    gateway.remove_suffix(1);
  }
  return std::string{gateway} + "/ipfs/" + std::string{cid};
}

content_descriptor_t video_platform(const std::string& id) {
  return content_descriptor_t{.kind = content_kind_t::video_platform,
                              .resolved_locator =
                                  std::string{kVideoEmbedPrefix} + id,
                              .platform_id = id};
}

content_descriptor_t direct_media(const std::string_view ref) {
  return content_descriptor_t{.kind = content_kind_t::direct_media,
                              .resolved_locator = std::string{ref},
                              .platform_id = std::nullopt};
}

}  // namespace

std::string_view trim(std::string_view value) {
  auto first = value.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = value.find_last_not_of(kWhitespace);
  return value.substr(first, last - first + 1);
}

std::optional<std::string> extract_video_id(const std::string_view url) {
  auto match = std::match_results<std::string_view::const_iterator>{};
  if (!std::regex_search(url.begin(), url.end(), match, video_url_pattern())) {
    return std::nullopt;
  }
  return match[1].str();
}

rule_set_t default_rules(const std::string_view gateway) {
  auto rules = rule_set_t{};
  rules.push_back(
      {"ipfs-scheme",
       [gateway = std::string{gateway}](const std::string_view ref)
           -> std::optional<content_descriptor_t> {
         if (!ref.starts_with(kIpfsScheme)) {
           return std::nullopt;
         }
         return content_descriptor_t{
             .kind = content_kind_t::ipfs,
             .resolved_locator =
                 gateway_locator(gateway, ref.substr(kIpfsScheme.size())),
             .platform_id = std::nullopt};
       }});
  rules.push_back({"ipfs-path",
                   [](const std::string_view ref)
                       -> std::optional<content_descriptor_t> {
                     if (ref.find("/ipfs/") == std::string_view::npos &&
                         ref.find("/ipns/") == std::string_view::npos) {
                       return std::nullopt;
                     }
                     return content_descriptor_t{
                         .kind = content_kind_t::ipfs,
                         .resolved_locator = std::string{ref},
                         .platform_id = std::nullopt};
                   }});
  rules.push_back({"media-extension",
                   [](const std::string_view ref)
                       -> std::optional<content_descriptor_t> {
                     if (!ref.starts_with("http") ||
                         !has_media_extension(ref)) {
                       return std::nullopt;
                     }
                     return direct_media(ref);
                   }});
  rules.push_back({"video-platform-url",
                   [](const std::string_view ref)
                       -> std::optional<content_descriptor_t> {
                     if (!is_http_url(ref)) {
                       return std::nullopt;
                     }
                     auto id = extract_video_id(ref);
                     if (!id.has_value()) {
                       return std::nullopt;
                     }
                     return video_platform(*id);
                   }});
  rules.push_back({"http-url",
                   [](const std::string_view ref)
                       -> std::optional<content_descriptor_t> {
                     if (!is_http_url(ref)) {
                       return std::nullopt;
                     }
                     return direct_media(ref);
                   }});
  rules.push_back(
      {"bare-cid",
       [gateway = std::string{gateway}](const std::string_view ref)
           -> std::optional<content_descriptor_t> {
         if (!is_bare_cid(ref)) {
           return std::nullopt;
         }
         return content_descriptor_t{
             .kind = content_kind_t::ipfs,
             .resolved_locator = gateway_locator(gateway, ref),
             .platform_id = std::nullopt};
       }});
  rules.push_back({"bare-video-id",
                   [](const std::string_view ref)
                       -> std::optional<content_descriptor_t> {
                     if (ref.size() != kVideoIdLength ||
                         !std::regex_match(ref.begin(), ref.end(),
                                           video_id_pattern())) {
                       return std::nullopt;
                     }
                     return video_platform(std::string{ref});
                   }});
  return rules;
}

content_descriptor_t classify(const std::string_view ref,
                              const rule_set_t& rules) {
  auto trimmed = trim(ref);
  if (trimmed.empty()) {
    return content_descriptor_t{};
  }
  for (const auto& rule : rules) {
    try {
      if (auto descriptor = rule.apply(trimmed); descriptor.has_value()) {
        spdlog::debug("Content reference '{}' classified by rule {}", trimmed,
                      rule.name);
        return *descriptor;
      }
    } catch (const std::exception& e) {
      spdlog::warn("Content rule {} failed on '{}': {}", rule.name, trimmed,
                   e.what());
      return content_descriptor_t{};
    }
  }
  return content_descriptor_t{};
}

content_descriptor_t classify(const std::string_view ref,
                              const std::string_view gateway) {
  return classify(ref, default_rules(gateway));
}

content_descriptor_t resolve_content(const std::string_view ref,
                                     const std::string_view gateway) {
  auto configured = trim(ref);
  return classify(configured.empty() ? kDefaultContentRef : configured,
                  gateway);
}

}  // namespace a402::content
