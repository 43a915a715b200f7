#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <dynart/content/metadata.hpp>
#include <dynart/encoding/base64.hpp>
#include <dynart/execution/gallery.hpp>
#include <dynart/execution/registry.hpp>
#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace {

dynart::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const std::string& name) {
  auto parsed = dynart::schema::try_make_hash32(vm[name].as<std::string>());
  if (!parsed) {
    throw po::validation_error{po::validation_error::invalid_option_value,
                               name};
  }
  return *parsed;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("dynart.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  auto mint = uint64_t{};
  auto token = uint64_t{};
  auto current_time = uint64_t{};
  auto difficulty = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"dynart"};
  description.add_options()("help,h", "Show the help message")(
      "owner", po::value<std::string>()->default_value(
                   "0x0100000000000000000000000000000000000000000000000000000000000000"),
      "Identity (32-byte hex) receiving the minted assets")(
      "mint,m", po::value<uint64_t>(&mint)->default_value(1),
      "Number of assets to mint before describing")(
      "token,t", po::value<uint64_t>(&token)->default_value(1),
      "Identifier to describe")(
      "time", po::value<uint64_t>(&current_time)->default_value(0),
      "Entropy: current time in seconds")(
      "previous-hash",
      po::value<std::string>()->default_value(
          "0x0000000000000000000000000000000000000000000000000000000000000000"),
      "Entropy: previous block hash (32-byte hex)")(
      "producer",
      po::value<std::string>()->default_value(
          "0x0000000000000000000000000000000000000000000000000000000000000000"),
      "Entropy: block producer identity (32-byte hex)")(
      "difficulty", po::value<std::string>(&difficulty)->default_value("0"),
      "Entropy: difficulty-like value (decimal)")(
      "decode,d", "Print the JSON document instead of the data URI")(
      "verbose,v", "Enable verbose output");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    spdlog::error("{}", ex.what());
    std::cerr << description << std::endl;
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto entropy = dynart::schema::entropy_t{};
  auto owner = dynart::schema::identity_t{};
  try {
    owner = get_hash32(vm, "owner");
    entropy.current_time = current_time;
    entropy.previous_hash = get_hash32(vm, "previous-hash");
    entropy.producer = get_hash32(vm, "producer");
    entropy.difficulty = dynart::schema::seed_t{difficulty};
  } catch (const std::exception& ex) {
    spdlog::error("Invalid argument: {}", ex.what());
    spdlog::shutdown();
    return 1;
  }

  auto registry = dynart::execution::registry{};
  for (auto i = uint64_t{0}; i < mint; ++i) {
    auto minted = registry.allocate_and_assign(owner);
    if (!minted.ok()) {
      spdlog::error("Mint failed: {} ({})", minted.log, minted.info);
      spdlog::shutdown();
      return 1;
    }
  }

  auto gallery = dynart::execution::gallery{registry};
  auto described = gallery.describe_asset(token, entropy);
  if (!described.ok()) {
    spdlog::error("{}: {}", described.codespace, described.log);
    spdlog::shutdown();
    return 2;
  }

  if (vm.contains("decode")) {
    const auto& uri = *described.value;
    auto payload =
        std::string_view{uri}.substr(dynart::content::kJsonDataPrefix.size());
    auto json = dynart::encoding::try_from_base64(payload);
    if (!json) {
      spdlog::error("Generated payload is not valid base64");
      spdlog::shutdown();
      return 3;
    }
    std::cout << dynart::schema::make_string(*json) << std::endl;
  } else {
    std::cout << *described.value << std::endl;
  }

  spdlog::shutdown();
  return 0;
}
