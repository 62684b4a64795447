#include <boost/program_options.hpp>
#include <a402/common/critical.hpp>
#include <a402/content/resolver.hpp>
#include <a402/contract/vault.hpp>
#include <a402/crypto/nonce.hpp>
#include <a402/keccak/hash.hpp>
#include <a402/schema/primitives.hpp>
#include <a402/schema/units.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace {

namespace po = boost::program_options;

std::string require(const po::variables_map& vm,
                    const std::string& name,
                    const std::string_view command) {
  if (!vm.contains(name)) {
    a402::common::critical("{} requires --{}", command, name);
  }
  return vm[name].as<std::string>();
}

std::string require_argument(const po::variables_map& vm,
                             const std::string_view command) {
  if (!vm.contains("argument")) {
    a402::common::critical("{} requires a positional argument", command);
  }
  return vm["argument"].as<std::string>();
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  a402_calldata selector <signature>\n"
            << "  a402_calldata digest <text> [--hex]\n"
            << "  a402_calldata has-access --resource-id <id> --address <addr>\n"
            << "  a402_calldata get-resource --resource-id <id>\n"
            << "  a402_calldata pay --resource-id <id> [--nonce <hash32>]\n"
            << "  a402_calldata nonce\n"
            << "  a402_calldata classify <ref> [--gateway <url>]\n"
            << "  a402_calldata to-wei <amount>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"a402_calldata options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "selector|digest|has-access|get-resource|pay|nonce|classify|to-wei")(
      "argument", po::value<std::string>(), "command argument")(
      "hex", "digest argument is hex bytes, not text")(
      "resource-id", po::value<std::string>(), "resource id")(
      "address", po::value<std::string>(), "wallet address hex")(
      "nonce", po::value<std::string>(), "payment nonce hash32 hex")(
      "gateway",
      po::value<std::string>()->default_value(
          std::string{a402::content::kDefaultGateway}),
      "ipfs gateway")("decimals",
                      po::value<unsigned>()->default_value(
                          a402::schema::kNativeDecimals),
                      "decimals for to-wei");

  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("argument", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "selector") {
    auto selector = a402::keccak::selector(require_argument(vm, command));
    std::cout << a402::schema::to_hex_prefixed(
                     a402::schema::bytes_view_t{selector})
              << '\n';
    return 0;
  }

  if (command == "digest") {
    auto argument = require_argument(vm, command);
    auto digest = a402::schema::hash32_t{};
    if (vm.contains("hex")) {
      auto bytes = a402::schema::from_hex(argument);
      digest = a402::keccak::hash(a402::schema::make_bytes_view(bytes));
    } else {
      digest = a402::keccak::hash(std::string_view{argument});
    }
    std::cout << a402::schema::to_hex_prefixed(digest) << '\n';
    return 0;
  }

  if (command == "has-access") {
    auto user =
        a402::schema::make_address(require(vm, "address", command));
    auto call = a402::contract::encode_has_access(
        require(vm, "resource-id", command), user);
    std::cout << a402::schema::to_hex_prefixed(
                     a402::schema::make_bytes_view(call))
              << '\n';
    return 0;
  }

  if (command == "get-resource") {
    auto call = a402::contract::encode_get_resource(
        require(vm, "resource-id", command));
    std::cout << a402::schema::to_hex_prefixed(
                     a402::schema::make_bytes_view(call))
              << '\n';
    return 0;
  }

  if (command == "pay") {
    auto nonce = vm.contains("nonce")
                     ? a402::schema::make_hash32(
                           std::string_view{vm["nonce"].as<std::string>()})
                     : a402::crypto::make_payment_nonce();
    if (!vm.contains("nonce")) {
      std::cerr << "nonce: " << a402::schema::to_hex_prefixed(nonce) << '\n';
    }
    auto call = a402::contract::encode_pay_for_access(
        require(vm, "resource-id", command), nonce);
    std::cout << a402::schema::to_hex_prefixed(
                     a402::schema::make_bytes_view(call))
              << '\n';
    return 0;
  }

  if (command == "nonce") {
    std::cout << a402::schema::to_hex_prefixed(
                     a402::crypto::make_payment_nonce())
              << '\n';
    return 0;
  }

  if (command == "classify") {
    auto descriptor = a402::content::classify(
        require_argument(vm, command), vm["gateway"].as<std::string>());
    std::cout << a402::schema::to_string(descriptor.kind) << ' '
              << descriptor.resolved_locator;
    if (descriptor.platform_id.has_value()) {
      std::cout << ' ' << *descriptor.platform_id;
    }
    std::cout << '\n';
    return 0;
  }

  if (command == "to-wei") {
    auto amount = a402::schema::try_to_base_units(
        require_argument(vm, command), vm["decimals"].as<unsigned>());
    if (!amount.has_value()) {
      a402::common::critical("'{}' is not a decimal amount",
                             vm["argument"].as<std::string>());
    }
    std::cout << amount->str() << '\n';
    return 0;
  }

  a402::common::critical(
      "command must be "
      "selector|digest|has-access|get-resource|pay|nonce|classify|to-wei");
}
