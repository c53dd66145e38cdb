#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <obligation/common/critical.hpp>
#include <obligation/contract/contract_registry.hpp>
#include <obligation/schema/encoding/scale/encoder.hpp>
#include <obligation/schema/ledger_transaction.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = obligation::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

constexpr auto kExitAccepted = 0;
constexpr auto kExitRejected = 1;
constexpr auto kExitUndecodable = 2;

// Parties are given as `name:hex32`, the key being a named signer id.
obligation::schema::party_t parse_party(const std::string& value) {
  auto separator = value.find(':');
  if (separator == std::string::npos) {
    obligation::common::critical("party '{}' must be name:hex32", value);
  }
  auto key = obligation::schema::try_make_hash32(
      std::string_view{value}.substr(separator + 1));
  if (!key) {
    obligation::common::critical("party '{}' key must be 32 bytes of hex",
                                 value);
  }
  return obligation::schema::party_t{
      .name = value.substr(0, separator),
      .owning_key = obligation::schema::signer_id_t{*key}};
}

obligation::schema::party_t get_party(const po::variables_map& vm,
                                      const std::string& name) {
  if (!vm.contains(name)) {
    obligation::common::critical("missing required argument --{}", name);
  }
  return parse_party(vm[name].as<std::string>());
}

obligation::schema::linear_id_t get_linear_id(const po::variables_map& vm) {
  auto external_id = std::optional<std::string>{};
  if (vm.contains("external-id")) {
    external_id = vm["external-id"].as<std::string>();
  }
  auto seed = vm["linear-id"].as<std::string>();
  return obligation::schema::make_linear_id(
      external_id, obligation::schema::make_bytes_view(std::string_view{seed}));
}

obligation::schema::obligation_state_t get_state(const po::variables_map& vm) {
  auto state = obligation::schema::make_obligation_state(
      vm["amount"].as<int64_t>(), get_party(vm, "lender"),
      get_party(vm, "borrower"), get_linear_id(vm));
  state.paid = vm["paid"].as<int64_t>();
  if (!obligation::schema::try_outstanding(state)) {
    obligation::common::critical("--paid {} against --amount {} overflows",
                                 state.paid, state.amount);
  }
  return state;
}

obligation::schema::command_t make_command(
    const po::variables_map& vm,
    const obligation::schema::command_type_t type,
    std::vector<obligation::schema::signer_id_t> default_signers) {
  auto command = obligation::schema::command_t{
      .version = 1,
      .contract_id = vm["contract-id"].as<std::string>(),
      .type = type,
      .signers = {}};
  if (vm.contains("signer")) {
    for (const auto& value : vm["signer"].as<std::vector<std::string>>()) {
      command.signers.push_back(
          obligation::schema::signer_id_t{obligation::schema::make_hash32(
              std::string_view{value})});
    }
  } else {
    command.signers = std::move(default_signers);
  }
  return command;
}

obligation::schema::ledger_transaction_t build_issue(
    const po::variables_map& vm) {
  auto output = get_state(vm);
  output.paid = 0;
  auto tx = obligation::schema::ledger_transaction_t{};
  tx.commands.push_back(
      make_command(vm, obligation::schema::command_type_t::issue,
                   {output.lender.owning_key, output.borrower.owning_key}));
  tx.outputs.push_back(std::move(output));
  return tx;
}

obligation::schema::ledger_transaction_t build_transfer(
    const po::variables_map& vm) {
  auto input = get_state(vm);
  auto output = obligation::schema::with_new_lender(
      input, get_party(vm, "new-lender"));
  auto tx = obligation::schema::ledger_transaction_t{};
  tx.commands.push_back(make_command(
      vm, obligation::schema::command_type_t::transfer,
      {input.borrower.owning_key, input.lender.owning_key,
       output.lender.owning_key}));
  tx.inputs.push_back(std::move(input));
  tx.outputs.push_back(std::move(output));
  return tx;
}

obligation::schema::ledger_transaction_t build_settle(
    const po::variables_map& vm) {
  auto input = get_state(vm);
  auto tx = obligation::schema::ledger_transaction_t{};
  tx.commands.push_back(
      make_command(vm, obligation::schema::command_type_t::settle,
                   {input.lender.owning_key, input.borrower.owning_key}));
  if (!vm.contains("full")) {
    const auto amount = vm["pay"].as<int64_t>();
    auto output = obligation::schema::try_pay(input, amount);
    if (!output) {
      obligation::common::critical("--pay {} on top of --paid {} overflows",
                                   amount, input.paid);
    }
    tx.outputs.push_back(std::move(*output));
  }
  tx.inputs.push_back(std::move(input));
  return tx;
}

std::optional<obligation::schema::ledger_transaction_t> read_transaction(
    const po::variables_map& vm) {
  if (!vm.contains("tx")) {
    spdlog::error("missing required argument --tx");
    return std::nullopt;
  }
  auto bytes = obligation::schema::try_from_hex(vm["tx"].as<std::string>());
  if (!bytes) {
    spdlog::error("--tx is not valid hex");
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<obligation::schema::ledger_transaction_t>(
      obligation::schema::make_bytes_view(*bytes));
  if (!tx) {
    spdlog::error("--tx is not a SCALE encoded transaction");
  }
  return tx;
}

int verify(const po::variables_map& vm) {
  auto tx = read_transaction(vm);
  if (!tx) {
    return kExitUndecodable;
  }
  const auto contract_id = vm["contract-id"].as<std::string>();
  auto registry = obligation::contract::contract_registry{};
  if (!obligation::contract::register_obligation_contract(registry,
                                                          contract_id)) {
    obligation::common::critical("contract '{}' is already registered",
                                 contract_id);
  }

  auto result = registry.verify(contract_id, *tx);
  if (obligation::schema::accepted(result)) {
    std::cout << "accepted" << std::endl;
    return kExitAccepted;
  }
  std::cout << "rejected code=" << result.code
            << " codespace=" << result.codespace << " log=" << result.log
            << std::endl;
  return kExitRejected;
}

int txid(const po::variables_map& vm) {
  auto tx = read_transaction(vm);
  if (!tx) {
    return kExitUndecodable;
  }
  auto id = obligation::schema::transaction_id(*tx);
  std::cout << obligation::schema::to_hex(
                   obligation::schema::bytes_view_t{id.data(), id.size()})
            << std::endl;
  return kExitAccepted;
}

void configure_logging(const std::string& level) {
  // Log to stderr so stdout stays machine readable.
  auto logger = spdlog::stderr_color_mt("obligation");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

}  // namespace

int main(int argc, char* argv[]) {
  auto description =
      po::options_description{"obligation_tool <command> [options]"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(),
      "build-issue | build-transfer | build-settle | verify | txid")(
      "log-level", po::value<std::string>()->default_value("warning"),
      "trace | debug | info | warning | error | critical | off")(
      "contract-id",
      po::value<std::string>()->default_value(
          std::string{obligation::contract::kObligationContractId}),
      "Contract id the command is addressed to")(
      "amount", po::value<int64_t>()->default_value(0), "Obligation amount")(
      "paid", po::value<int64_t>()->default_value(0), "Amount already paid")(
      "lender", po::value<std::string>(), "Lender as name:hex32")(
      "borrower", po::value<std::string>(), "Borrower as name:hex32")(
      "new-lender", po::value<std::string>(), "New lender as name:hex32")(
      "pay", po::value<int64_t>()->default_value(0),
      "Amount paid by a part settlement")(
      "full", "Settle in full, producing no output")(
      "linear-id", po::value<std::string>()->default_value("obligation"),
      "Seed the linear id is derived from")(
      "external-id", po::value<std::string>(), "External linear id label")(
      "signer", po::value<std::vector<std::string>>()->composing(),
      "Signer key as hex32, repeatable. Defaults to the required signers")(
      "tx", po::value<std::string>(), "Hex SCALE encoded transaction");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return kExitUndecodable;
  }

  if (vm.contains("help") || !vm.contains("command")) {
    std::cout << description << std::endl;
    return 0;
  }

  configure_logging(vm["log-level"].as<std::string>());

  auto encoder = encoder_t{};
  auto command = vm["command"].as<std::string>();
  auto exit_code = kExitAccepted;
  if (command == "build-issue") {
    std::cout << obligation::schema::to_hex(
                     encoder.encode(build_issue(vm)))
              << std::endl;
  } else if (command == "build-transfer") {
    std::cout << obligation::schema::to_hex(
                     encoder.encode(build_transfer(vm)))
              << std::endl;
  } else if (command == "build-settle") {
    std::cout << obligation::schema::to_hex(
                     encoder.encode(build_settle(vm)))
              << std::endl;
  } else if (command == "verify") {
    exit_code = verify(vm);
  } else if (command == "txid") {
    exit_code = txid(vm);
  } else {
    obligation::common::critical("unsupported command '{}'", command);
  }

  spdlog::shutdown();
  return exit_code;
}
