#pragma once

#include <a402/schema/content_descriptor.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace a402::content {

inline constexpr auto kDefaultGateway = std::string_view{"https://ipfs.io"};
inline constexpr auto kDefaultContentRef = std::string_view{"dQw4w9WgXcQ"};
inline constexpr auto kVideoEmbedPrefix =
    std::string_view{"https://www.youtube.com/embed/"};

/// One step of the classification. `apply` receives the trimmed reference
/// and returns a descriptor when the rule claims it.
struct classification_rule_t final {
  std::string name;
  std::function<std::optional<a402::schema::content_descriptor_t>(
      std::string_view)>
      apply;
};

using rule_set_t = std::vector<classification_rule_t>;

/// The rules in evaluation order. Moving a rule changes which kind wins for
/// references that several rules accept.
rule_set_t default_rules(std::string_view gateway = kDefaultGateway);

/// First rule to claim the reference wins; nothing claims it, or a rule
/// throws, and the result is `unknown`. Never throws.
a402::schema::content_descriptor_t classify(std::string_view ref,
                                            const rule_set_t& rules);

a402::schema::content_descriptor_t classify(
    std::string_view ref,
    std::string_view gateway = kDefaultGateway);

/// Descriptor for the configured content reference, falling back to
/// kDefaultContentRef when none is configured.
a402::schema::content_descriptor_t resolve_content(
    std::string_view ref,
    std::string_view gateway = kDefaultGateway);

/// Video id from a watch, short link, embed, `/v/` or shorts URL.
std::optional<std::string> extract_video_id(std::string_view url);

std::string_view trim(std::string_view value);

}  // namespace a402::content
