#include <a402/common/critical.hpp>
#include <a402/schema/units.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace a402::schema {

namespace {

bool all_digits(const std::string_view value) {
  return std::ranges::all_of(value, [](const unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

amount_t pow10(const unsigned exponent) {
  auto out = amount_t{1};
  for (auto i = 0u; i < exponent; ++i) {
    out *= 10;
  }
  return out;
}

}  // namespace

std::optional<amount_t> try_to_base_units(std::string_view amount,
                                          const unsigned decimals) {
  auto dot = amount.find('.');
  auto whole = amount.substr(0, dot);
  auto fraction = dot == std::string_view::npos ? std::string_view{}
                                                : amount.substr(dot + 1);
  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }
  if (!all_digits(whole) || !all_digits(fraction)) {
    return std::nullopt;
  }
  if (fraction.size() > decimals) {
    fraction = fraction.substr(0, decimals);
  }

  auto digits = std::string{whole.empty() ? "0" : whole};
  digits.append(fraction);
  digits.append(decimals - fraction.size(), '0');

  auto first = digits.find_first_not_of('0');
  if (first == std::string::npos) {
    return amount_t{0};
  }
  auto wide = boost::multiprecision::cpp_int{digits.substr(first)};
  if (wide > boost::multiprecision::cpp_int{
                 std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return static_cast<amount_t>(wide);
}

amount_t to_base_units(std::string_view amount, const unsigned decimals) {
  auto value = try_to_base_units(amount, decimals);
  if (!value.has_value()) {
    a402::common::critical("invalid currency amount '{}'", amount);
  }
  return *value;
}

std::string format_base_units(const amount_t& value, const unsigned decimals) {
  auto scale = pow10(decimals);
  auto whole = value / scale;
  auto fraction = value % scale;
  if (fraction == 0) {
    return whole.str();
  }
  auto digits = fraction.str();
  digits.insert(0, decimals - digits.size(), '0');
  digits.erase(digits.find_last_not_of('0') + 1);
  return whole.str() + "." + digits;
}

}  // namespace a402::schema
