#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <a402/abi/error.hpp>
#include <a402/access/access_gate.hpp>
#include <a402/common/critical.hpp>
#include <a402/content/resolver.hpp>
#include <a402/contract/vault.hpp>
#include <a402/keccak/hash.hpp>
#include <a402/rpc/chain_reader.hpp>
#include <a402/rpc/http_transport.hpp>
#include <a402/schema/units.hpp>
#include <a402/storage/memory/verification_store.hpp>
#include <a402/verification/verifier.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

namespace po = boost::program_options;

inline constexpr auto kEnvironmentPrefix = std::string_view{"A402_"};

inline constexpr auto kExitOk = 0;
inline constexpr auto kExitFailure = 1;
inline constexpr auto kExitPending = 2;

struct settings final {
  uint64_t chain_id{};
  std::string rpc_url;
  uint64_t rpc_timeout_ms{};
  a402::schema::address_t contract{};
  a402::schema::address_t beneficiary{};
  a402::schema::amount_t price{};
  std::string resource_id;
  std::string ipfs_gateway;
  std::string content_ref;
  bool lifetime_access{};
  bool require_resource_match{};
  std::optional<a402::schema::hash32_t> event_topic;
};

po::options_description make_description() {
  auto description = po::options_description{"a402"};
  description.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable verbose output")(
      "config,c", po::value<std::string>(), "INI configuration file")(
      "log-file", po::value<std::string>()->default_value("a402.log"),
      "Log file path")("command", po::value<std::string>(),
                       "verify|check-access|resource|info")(
      "argument", po::value<std::string>(), "Transaction hash for verify")(
      "address", po::value<std::string>(), "Wallet address for check-access")(
      "chain-id", po::value<uint64_t>()->default_value(2786), "EVM chain id")(
      "rpc-url",
      po::value<std::string>()->default_value(
          "https://rpc.apertum.io/ext/bc/"
          "YDJ1r9RMkewATmA7B35q1bdV18aywzmdiXwd9zGBq3uQjsCnn/rpc"),
      "JSON-RPC endpoint")(
      "rpc-timeout-ms", po::value<uint64_t>()->default_value(10000),
      "Timeout of each RPC round-trip")(
      "verifier-contract",
      po::value<std::string>()->default_value(
          "0x461dA8e28B276586EB9dC4F010EbfF7F126A7076"),
      "Vault contract address")(
      "payment-address",
      po::value<std::string>()->default_value(
          "0x0000000000000000000000000000000000000000"),
      "Beneficiary expected in the payment event")(
      "price", po::value<std::string>()->default_value("0.001"),
      "Price in native currency")(
      "resource-id", po::value<std::string>()->default_value("video-001"),
      "Resource id registered on the contract")(
      "ipfs-gateway",
      po::value<std::string>()->default_value(
          std::string{a402::content::kDefaultGateway}),
      "Gateway used for ipfs:// references")(
      "content-ref", po::value<std::string>()->default_value(""),
      "Content reference served after payment")(
      "lifetime-access", po::value<bool>()->default_value(true),
      "Consult the contract for lifetime access")(
      "require-resource-match", po::value<bool>()->default_value(false),
      "Require the resource id in the payment event")(
      "event-topic", po::value<std::string>(),
      "Payment event signature or topic hash");
  return description;
}

po::variables_map parse_options(int argc,
                                const char** argv,
                                const po::options_description& description) {
  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("argument", 1);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(description)
                .positional(positional)
                .run(),
            vm);

  if (vm.contains("config")) {
    auto path = vm["config"].as<std::string>();
    auto file = std::ifstream{path};
    if (!file) {
      a402::common::critical("unable to open config file '{}'", path);
    }
    po::store(po::parse_config_file(file, description, true), vm);
  }

  po::store(po::parse_environment(
                description,
                [&description](const std::string& variable) -> std::string {
                  if (!variable.starts_with(kEnvironmentPrefix)) {
                    return {};
                  }
                  auto name = a402::schema::to_lower(
                      variable.substr(kEnvironmentPrefix.size()));
                  std::ranges::replace(name, '_', '-');
                  if (description.find_nothrow(name, false) == nullptr) {
                    return {};
                  }
                  return name;
                }),
            vm);
  po::notify(vm);
  return vm;
}

void install_logger(const po::variables_map& vm) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      vm["log-file"].as<std::string>(), false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "a402", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);
}

a402::schema::address_t require_address(const std::string& value,
                                        const std::string_view what) {
  auto address = a402::schema::try_make_address(value);
  if (!address.has_value()) {
    a402::common::critical("{} '{}' is not a 20-byte hex address", what, value);
  }
  return *address;
}

/// A 32-byte hex value is taken as the topic itself; anything else is an
/// event signature to hash.
a402::schema::hash32_t parse_event_topic(const std::string& value) {
  if (auto topic = a402::schema::try_make_hash32(value); topic.has_value()) {
    return *topic;
  }
  return a402::keccak::event_topic(value);
}

settings load_settings(const po::variables_map& vm) {
  auto out = settings{};
  out.chain_id = vm["chain-id"].as<uint64_t>();
  out.rpc_url = vm["rpc-url"].as<std::string>();
  out.rpc_timeout_ms = vm["rpc-timeout-ms"].as<uint64_t>();
  out.contract = require_address(vm["verifier-contract"].as<std::string>(),
                                 "verifier contract");
  out.beneficiary = require_address(vm["payment-address"].as<std::string>(),
                                    "payment address");
  out.price = a402::schema::to_base_units(vm["price"].as<std::string>());
  out.resource_id = vm["resource-id"].as<std::string>();
  out.ipfs_gateway = vm["ipfs-gateway"].as<std::string>();
  out.content_ref = vm["content-ref"].as<std::string>();
  out.lifetime_access = vm["lifetime-access"].as<bool>();
  out.require_resource_match = vm["require-resource-match"].as<bool>();
  if (vm.contains("event-topic")) {
    out.event_topic = parse_event_topic(vm["event-topic"].as<std::string>());
  }
  return out;
}

a402::rpc::chain_reader make_reader(const settings& config) {
  return a402::rpc::chain_reader{a402::rpc::make_http_transport(
      a402::rpc::http_transport_options{
          .url = config.rpc_url,
          .timeout = std::chrono::milliseconds{config.rpc_timeout_ms}})};
}

a402::verification::verifier_options make_verifier_options(
    const settings& config) {
  return a402::verification::verifier_options{
      .contract = config.contract,
      .beneficiary = config.beneficiary,
      .price = config.price,
      .event_topic = config.event_topic,
      .require_resource_match = config.require_resource_match,
      .resource_id = config.resource_id};
}

void print_record(const a402::schema::verification_record_t& record) {
  std::cout << "transaction: " << record.transaction_id << '\n'
            << "payer: " << a402::schema::to_hex_prefixed(record.payer) << '\n'
            << "beneficiary: "
            << a402::schema::to_hex_prefixed(record.beneficiary) << '\n'
            << "amount: " << record.amount.str() << " ("
            << a402::schema::format_base_units(record.amount) << ")\n";
}

int print_verdict(const a402::schema::verification_result_t& result) {
  std::cout << "status: " << a402::schema::to_string(result.status) << '\n';
  if (result.verified()) {
    print_record(*result.record);
    return kExitOk;
  }
  std::cout << "code: " << static_cast<uint32_t>(result.code) << '\n'
            << "reason: " << result.reason << '\n';
  return result.status == a402::schema::verification_status_t::pending
             ? kExitPending
             : kExitFailure;
}

int run_verify(const po::variables_map& vm, const settings& config) {
  if (!vm.contains("argument")) {
    a402::common::critical("verify requires a transaction hash");
  }
  auto reader = make_reader(config);
  auto store = a402::storage::make_verification_store<
      a402::storage::memory_store_tag>();
  auto verifier = a402::verification::payment_verifier{
      reader, store, make_verifier_options(config)};
  return print_verdict(verifier.verify(vm["argument"].as<std::string>()));
}

int run_check_access(const po::variables_map& vm, const settings& config) {
  if (!vm.contains("address")) {
    a402::common::critical("check-access requires --address");
  }
  auto user = require_address(vm["address"].as<std::string>(), "address");
  auto reader = make_reader(config);
  auto store = a402::storage::make_verification_store<
      a402::storage::memory_store_tag>();

  // A transaction hash given alongside seeds the session table first.
  if (vm.contains("argument")) {
    auto verifier = a402::verification::payment_verifier{
        reader, store, make_verifier_options(config)};
    auto result = verifier.verify(vm["argument"].as<std::string>());
    spdlog::info("Session payment {}: {}", vm["argument"].as<std::string>(),
                 a402::schema::to_string(result.status));
  }

  auto vault = a402::contract::vault_client{reader, config.contract};
  auto gate = a402::access::access_gate{store, vault, config.resource_id,
                                        config.lifetime_access};
  auto decision = gate.check(user);
  std::cout << "granted: " << (decision.granted ? "true" : "false") << '\n'
            << "source: " << a402::schema::to_string(decision.source) << '\n';
  if (!decision.granted) {
    return kExitFailure;
  }
  auto content =
      a402::content::resolve_content(config.content_ref, config.ipfs_gateway);
  std::cout << "content: " << a402::schema::to_string(content.kind) << ' '
            << content.resolved_locator << '\n';
  return kExitOk;
}

int run_resource(const settings& config) {
  auto reader = make_reader(config);
  auto vault = a402::contract::vault_client{reader, config.contract};
  auto resource = a402::schema::resource_t{};
  try {
    resource = vault.get_resource(config.resource_id);
  } catch (const a402::rpc::transport_error& e) {
    spdlog::error("getResource failed: {}", e.what());
    return kExitFailure;
  } catch (const a402::rpc::response_error& e) {
    spdlog::error("getResource returned a malformed response: {}", e.what());
    return kExitFailure;
  } catch (const a402::abi::abi_error& e) {
    spdlog::error("getResource returned undecodable data: {}", e.what());
    return kExitFailure;
  }

  std::cout << "resource: " << resource.resource_id << '\n'
            << "exists: " << (resource.exists ? "true" : "false") << '\n'
            << "active: " << (resource.active ? "true" : "false") << '\n'
            << "lifetime: " << (resource.lifetime ? "true" : "false") << '\n'
            << "price: " << resource.price.str() << " ("
            << a402::schema::format_base_units(resource.price) << ")\n"
            << "content-type: " << resource.content_type << '\n'
            << "content-ref: " << resource.content_ref << '\n'
            << "total-payments: " << resource.total_payments.str() << '\n';
  if (!resource.content_ref.empty()) {
    auto content = a402::content::classify(resource.content_ref,
                                           config.ipfs_gateway);
    std::cout << "content-kind: " << a402::schema::to_string(content.kind)
              << '\n';
  }
  return resource.exists ? kExitOk : kExitFailure;
}

int run_info(const settings& config) {
  auto content =
      a402::content::resolve_content(config.content_ref, config.ipfs_gateway);
  std::cout << "network: eip155:" << config.chain_id << '\n'
            << "rpc-url: " << config.rpc_url << '\n'
            << "verifier-contract: "
            << a402::schema::to_hex_prefixed(config.contract) << '\n'
            << "payment-address: "
            << a402::schema::to_hex_prefixed(config.beneficiary) << '\n'
            << "price: " << config.price.str() << " ("
            << a402::schema::format_base_units(config.price) << ")\n"
            << "resource-id: " << config.resource_id << '\n'
            << "lifetime-access: "
            << (config.lifetime_access ? "true" : "false") << '\n'
            << "content: " << a402::schema::to_string(content.kind) << ' '
            << content.resolved_locator << '\n';
  return kExitOk;
}

}  // namespace

int main(int argc, const char** argv) {
  auto description = make_description();
  auto vm = parse_options(argc, argv, description);

  if (vm.contains("help") || !vm.contains("command")) {
    std::cout << "Usage:\n"
              << "  a402 verify <tx-hash> [options]\n"
              << "  a402 check-access --address <wallet> [tx-hash] [options]\n"
              << "  a402 resource [options]\n"
              << "  a402 info [options]\n\n"
              << description << std::endl;
    return kExitOk;
  }

  install_logger(vm);
  auto config = load_settings(vm);
  auto command = vm["command"].as<std::string>();

  auto code = kExitFailure;
  if (command == "verify") {
    code = run_verify(vm, config);
  } else if (command == "check-access") {
    code = run_check_access(vm, config);
  } else if (command == "resource") {
    code = run_resource(config);
  } else if (command == "info") {
    code = run_info(config);
  } else {
    a402::common::critical("command must be verify|check-access|resource|info");
  }

  spdlog::shutdown();
  return code;
}
