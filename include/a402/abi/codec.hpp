#pragma once

#include <a402/abi/types.hpp>
#include <a402/schema/primitives.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace a402::abi {

/// `selector || head words || tail`, ready to be used as call input.
/// Throws abi_error when `args` do not match the signature.
a402::schema::bytes_t encode_call(std::string_view signature,
                                  const std::vector<abi_arg_t>& args);

/// Argument block without the selector. Dynamic offsets are relative to the
/// start of this block.
a402::schema::bytes_t encode_arguments(const std::vector<abi_type_t>& types,
                                       const std::vector<abi_arg_t>& args);

/// Walk `data` according to `shape`. Offsets of dynamic fields are read
/// relative to the start of `data`. Throws abi_error(truncated_data) instead
/// of reading past the buffer, and abi_error(invalid_value) for words that
/// are not canonical encodings of their declared type.
decoded_tuple_t decode_return(const a402::schema::bytes_view_t& data,
                              const std::vector<field_shape_t>& shape);

std::optional<decoded_tuple_t> try_decode_return(
    const a402::schema::bytes_view_t& data,
    const std::vector<field_shape_t>& shape);

/// Output shape mirroring a signature's inputs, fields named "0", "1", ...
std::vector<field_shape_t> shape_of(std::string_view signature);

/// Drop the 4-byte selector from encoded calldata.
a402::schema::bytes_view_t strip_selector(const a402::schema::bytes_view_t& call);

a402::schema::hash32_t encode_word(const a402::schema::amount_t& value);
a402::schema::hash32_t encode_word(const a402::schema::address_t& address);

/// Big-endian word at `offset`; throws abi_error(truncated_data).
a402::schema::amount_t read_uint_word(const a402::schema::bytes_view_t& data,
                                      std::size_t offset);
a402::schema::amount_t word_to_uint(const a402::schema::hash32_t& word);

/// Low 20 bytes of an indexed address topic.
a402::schema::address_t word_to_address(const a402::schema::hash32_t& word);

}  // namespace a402::abi
