#include <a402/abi/codec.hpp>
#include <a402/keccak/hash.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string>

namespace a402::abi {

namespace {

using a402::schema::address_t;
using a402::schema::amount_t;
using a402::schema::bytes_t;
using a402::schema::bytes_view_t;
using a402::schema::hash32_t;

std::size_t padded_size(const std::size_t size) {
  return ((size + kWordSize - 1) / kWordSize) * kWordSize;
}

void append_word(bytes_t& out, const hash32_t& word) {
  out.insert(std::end(out), std::begin(word), std::end(word));
}

void append_padded(bytes_t& out, const bytes_view_t& content) {
  append_word(out, encode_word(amount_t{content.size()}));
  out.insert(std::end(out), std::begin(content), std::end(content));
  out.resize(out.size() + (padded_size(content.size()) - content.size()), 0);
}

[[noreturn]] void throw_type_mismatch(const abi_type_t expected,
                                      const std::size_t index) {
  throw abi_error{abi_error_code::type_mismatch,
                  "argument " + std::to_string(index) + " is not a " +
                      std::string{type_name(expected)}};
}

template <typename T>
const T& expect_arg(const abi_arg_t& arg,
                    const abi_type_t type,
                    const std::size_t index) {
  const auto* value = std::get_if<T>(&arg);
  if (value == nullptr) {
    throw_type_mismatch(type, index);
  }
  return *value;
}

hash32_t read_word(const bytes_view_t& data, const std::size_t offset) {
  if (offset > data.size() || data.size() - offset < kWordSize) {
    throw abi_error{abi_error_code::truncated_data,
                    "word at offset " + std::to_string(offset) +
                        " exceeds buffer of " + std::to_string(data.size()) +
                        " bytes"};
  }
  auto word = hash32_t{};
  std::copy_n(data.data() + offset, word.size(), word.data());
  return word;
}

/// Offsets and lengths must index into `data`; anything larger is
/// truncation, not a value worth converting.
std::size_t read_size_word(const bytes_view_t& data,
                           const std::size_t offset,
                           const std::string_view what) {
  auto value = read_uint_word(data, offset);
  if (value > amount_t{data.size()}) {
    throw abi_error{abi_error_code::truncated_data,
                    std::string{what} + " " + value.str() +
                        " exceeds buffer of " + std::to_string(data.size()) +
                        " bytes"};
  }
  return value.convert_to<std::size_t>();
}

bytes_view_t read_dynamic_bytes(const bytes_view_t& data,
                                const std::size_t offset) {
  auto length = read_size_word(data, offset, "length");
  auto start = offset + kWordSize;
  if (data.size() - start < length) {
    throw abi_error{abi_error_code::truncated_data,
                    "content of " + std::to_string(length) +
                        " bytes at offset " + std::to_string(start) +
                        " exceeds buffer of " + std::to_string(data.size()) +
                        " bytes"};
  }
  return data.subspan(start, length);
}

bool leading_zero(const hash32_t& word, const std::size_t count) {
  return std::all_of(word.begin(), word.begin() + count,
                     [](const uint8_t b) { return b == 0; });
}

decoded_tuple_t decode_tuple(const bytes_view_t& data,
                             const std::vector<field_shape_t>& shape);

abi_value_t decode_static(const bytes_view_t& data,
                          const std::size_t position,
                          const field_shape_t& field) {
  switch (field.type) {
    case abi_type_t::uint256:
      return word_to_uint(read_word(data, position));
    case abi_type_t::boolean: {
      auto word = read_word(data, position);
      if (!leading_zero(word, kWordSize - 1) || word.back() > 1) {
        throw abi_error{abi_error_code::invalid_value,
                        "field '" + field.name + "' is not a boolean word"};
      }
      return word.back() == 1;
    }
    case abi_type_t::address: {
      auto word = read_word(data, position);
      if (!leading_zero(word, kWordSize - std::tuple_size_v<address_t>)) {
        throw abi_error{abi_error_code::invalid_value,
                        "field '" + field.name + "' is not an address word"};
      }
      return word_to_address(word);
    }
    case abi_type_t::bytes32:
      return read_word(data, position);
    case abi_type_t::tuple:
      if (position > data.size()) {
        throw abi_error{abi_error_code::truncated_data,
                        "tuple '" + field.name + "' starts past buffer"};
      }
      return decode_tuple(data.subspan(position), field.components);
    default:
      throw abi_error{abi_error_code::unsupported_type,
                      "field '" + field.name + "' is not a static type"};
  }
}

abi_value_t decode_dynamic(const bytes_view_t& data,
                           const std::size_t offset,
                           const field_shape_t& field) {
  switch (field.type) {
    case abi_type_t::string:
      return a402::schema::make_string(read_dynamic_bytes(data, offset));
    case abi_type_t::bytes:
      return a402::schema::make_bytes(read_dynamic_bytes(data, offset));
    case abi_type_t::tuple:
      return decode_tuple(data.subspan(offset), field.components);
    default:
      throw abi_error{abi_error_code::unsupported_type,
                      "field '" + field.name + "' is not a dynamic type"};
  }
}

decoded_tuple_t decode_tuple(const bytes_view_t& data,
                             const std::vector<field_shape_t>& shape) {
  auto total_head = std::size_t{};
  for (const auto& field : shape) {
    total_head += head_size(field);
  }
  if (data.size() < total_head) {
    throw abi_error{abi_error_code::truncated_data,
                    "return data of " + std::to_string(data.size()) +
                        " bytes is shorter than the " +
                        std::to_string(total_head) + "-byte head"};
  }

  auto out = decoded_tuple_t{};
  out.fields.reserve(shape.size());
  auto position = std::size_t{};
  for (const auto& field : shape) {
    if (is_dynamic(field)) {
      auto offset = read_size_word(data, position, "offset");
      out.fields.push_back(
          decoded_field_t{field.name, decode_dynamic(data, offset, field)});
    } else {
      out.fields.push_back(
          decoded_field_t{field.name, decode_static(data, position, field)});
    }
    position += head_size(field);
  }
  return out;
}

}  // namespace

hash32_t encode_word(const amount_t& value) {
  auto minimal = bytes_t{};
  boost::multiprecision::export_bits(value, std::back_inserter(minimal), 8);
  auto word = hash32_t{};
  if (value != 0) {
    std::copy(minimal.begin(), minimal.end(),
              word.end() - static_cast<std::ptrdiff_t>(minimal.size()));
  }
  return word;
}

hash32_t encode_word(const address_t& address) {
  auto word = hash32_t{};
  std::copy(address.begin(), address.end(),
            word.end() - static_cast<std::ptrdiff_t>(address.size()));
  return word;
}

amount_t word_to_uint(const hash32_t& word) {
  auto value = amount_t{};
  boost::multiprecision::import_bits(value, word.begin(), word.end());
  return value;
}

amount_t read_uint_word(const bytes_view_t& data, const std::size_t offset) {
  return word_to_uint(read_word(data, offset));
}

address_t word_to_address(const hash32_t& word) {
  auto address = address_t{};
  std::copy(word.end() - static_cast<std::ptrdiff_t>(address.size()),
            word.end(), address.begin());
  return address;
}

bytes_t encode_arguments(const std::vector<abi_type_t>& types,
                         const std::vector<abi_arg_t>& args) {
  if (types.size() != args.size()) {
    throw abi_error{abi_error_code::arity_mismatch,
                    "expected " + std::to_string(types.size()) +
                        " argument(s), got " + std::to_string(args.size())};
  }

  auto head = bytes_t{};
  auto tail = bytes_t{};
  auto head_bytes = types.size() * kWordSize;
  head.reserve(head_bytes);

  for (std::size_t i = 0; i < types.size(); ++i) {
    const auto& arg = args[i];
    switch (types[i]) {
      case abi_type_t::uint256:
        append_word(head, encode_word(expect_arg<amount_t>(arg, types[i], i)));
        break;
      case abi_type_t::address:
        append_word(head,
                    encode_word(expect_arg<address_t>(arg, types[i], i)));
        break;
      case abi_type_t::boolean:
        append_word(head, encode_word(amount_t{
                              expect_arg<bool>(arg, types[i], i) ? 1 : 0}));
        break;
      case abi_type_t::bytes32:
        append_word(head, expect_arg<hash32_t>(arg, types[i], i));
        break;
      case abi_type_t::string: {
        const auto& value = expect_arg<std::string>(arg, types[i], i);
        append_word(head, encode_word(amount_t{head_bytes + tail.size()}));
        append_padded(tail, a402::schema::make_bytes_view(value));
        break;
      }
      case abi_type_t::bytes: {
        const auto& value = expect_arg<bytes_t>(arg, types[i], i);
        append_word(head, encode_word(amount_t{head_bytes + tail.size()}));
        append_padded(tail, a402::schema::make_bytes_view(value));
        break;
      }
      default:
        throw abi_error{abi_error_code::unsupported_type,
                        "argument " + std::to_string(i) +
                            " has a type that cannot be encoded"};
    }
  }

  head.insert(std::end(head), std::begin(tail), std::end(tail));
  return head;
}

bytes_t encode_call(const std::string_view signature,
                    const std::vector<abi_arg_t>& args) {
  auto parsed = parse_signature(signature);
  auto selector = a402::keccak::selector(parsed.canonical());
  auto arguments = encode_arguments(parsed.inputs, args);

  auto out = bytes_t{};
  out.reserve(selector.size() + arguments.size());
  out.insert(std::end(out), std::begin(selector), std::end(selector));
  out.insert(std::end(out), std::begin(arguments), std::end(arguments));
  return out;
}

decoded_tuple_t decode_return(const bytes_view_t& data,
                              const std::vector<field_shape_t>& shape) {
  return decode_tuple(data, shape);
}

std::optional<decoded_tuple_t> try_decode_return(
    const bytes_view_t& data,
    const std::vector<field_shape_t>& shape) {
  try {
    return decode_tuple(data, shape);
  } catch (const abi_error&) {
    return std::nullopt;
  }
}

std::vector<field_shape_t> shape_of(const std::string_view signature) {
  auto parsed = parse_signature(signature);
  auto shape = std::vector<field_shape_t>{};
  shape.reserve(parsed.inputs.size());
  for (std::size_t i = 0; i < parsed.inputs.size(); ++i) {
    shape.push_back(field_shape_t{
        .name = std::to_string(i), .type = parsed.inputs[i], .components = {}});
  }
  return shape;
}

bytes_view_t strip_selector(const bytes_view_t& call) {
  if (call.size() < kSelectorSize) {
    throw abi_error{abi_error_code::truncated_data,
                    "calldata shorter than a selector"};
  }
  return call.subspan(kSelectorSize);
}

}  // namespace a402::abi
