#include <a402/abi/types.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace a402::abi {

namespace {

constexpr auto kTypeNames = std::array{
    std::pair<std::string_view, abi_type_t>{"uint256", abi_type_t::uint256},
    std::pair<std::string_view, abi_type_t>{"address", abi_type_t::address},
    std::pair<std::string_view, abi_type_t>{"bool", abi_type_t::boolean},
    std::pair<std::string_view, abi_type_t>{"bytes32", abi_type_t::bytes32},
    std::pair<std::string_view, abi_type_t>{"string", abi_type_t::string},
    std::pair<std::string_view, abi_type_t>{"bytes", abi_type_t::bytes}};

std::string_view trim(std::string_view value) {
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.front())) != 0) {
    value.remove_prefix(1);
  }
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.back())) != 0) {
    value.remove_suffix(1);
  }
  return value;
}

bool is_identifier(const std::string_view value) {
  if (value.empty() ||
      std::isdigit(static_cast<unsigned char>(value.front())) != 0) {
    return false;
  }
  return std::ranges::all_of(value, [](const unsigned char c) {
    return std::isalnum(c) != 0 || c == '_' || c == '$';
  });
}

}  // namespace

std::optional<abi_type_t> try_parse_type(std::string_view name) {
  name = trim(name);
  for (const auto& [type_name, type] : kTypeNames) {
    if (type_name == name) {
      return type;
    }
  }
  return std::nullopt;
}

std::string_view type_name(const abi_type_t type) {
  if (type == abi_type_t::tuple) {
    return "tuple";
  }
  for (const auto& [name, value] : kTypeNames) {
    if (value == type) {
      return name;
    }
  }
  return "unknown";
}

bool is_dynamic(const field_shape_t& shape) {
  switch (shape.type) {
    case abi_type_t::string:
    case abi_type_t::bytes:
      return true;
    case abi_type_t::tuple:
      return std::ranges::any_of(shape.components,
                                 [](const auto& c) { return is_dynamic(c); });
    default:
      return false;
  }
}

std::size_t head_size(const field_shape_t& shape) {
  if (shape.type != abi_type_t::tuple || is_dynamic(shape)) {
    return kWordSize;
  }
  auto size = std::size_t{};
  for (const auto& component : shape.components) {
    size += head_size(component);
  }
  return size;
}

std::string function_signature_t::canonical() const {
  auto out = name;
  out.push_back('(');
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    if (i != 0) {
      out.push_back(',');
    }
    out.append(type_name(inputs[i]));
  }
  out.push_back(')');
  return out;
}

function_signature_t parse_signature(std::string_view signature) {
  signature = trim(signature);
  auto open = signature.find('(');
  if (open == std::string_view::npos || signature.back() != ')') {
    throw abi_error{abi_error_code::invalid_signature,
                    "malformed signature '" + std::string{signature} + "'"};
  }
  auto name = trim(signature.substr(0, open));
  if (!is_identifier(name)) {
    throw abi_error{abi_error_code::invalid_signature,
                    "invalid function name in '" + std::string{signature} +
                        "'"};
  }

  auto result = function_signature_t{.name = std::string{name}, .inputs = {}};
  auto params = signature.substr(open + 1, signature.size() - open - 2);
  if (trim(params).empty()) {
    return result;
  }
  while (true) {
    auto comma = params.find(',');
    auto token = trim(params.substr(0, comma));
    auto type = try_parse_type(token);
    if (!type.has_value()) {
      throw abi_error{abi_error_code::unsupported_type,
                      "unsupported parameter type '" + std::string{token} +
                          "'"};
    }
    result.inputs.push_back(*type);
    if (comma == std::string_view::npos) {
      break;
    }
    params.remove_prefix(comma + 1);
  }
  return result;
}

}  // namespace a402::abi
