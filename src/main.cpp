#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <ballot/governance/engine.hpp>
#include <boost/program_options.hpp>
#include <chrono>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace ballot::schema;

namespace {

using power_table_t = std::map<account_id_t, amount_t>;

std::optional<account_id_t> parse_account(const std::string& value,
                                          const std::string_view option) {
  auto account = try_make_hash32(value);
  if (!account) {
    std::cerr << "--" << option << ": expected 32-byte hex id, got '" << value
              << "'" << std::endl;
  }
  return account;
}

std::optional<amount_t> parse_amount(const std::string& value,
                                     const std::string_view option) {
  auto amount = try_parse_amount(value);
  if (!amount) {
    std::cerr << "--" << option << ": expected decimal amount, got '" << value
              << "'" << std::endl;
  }
  return amount;
}

// Each entry is "<hex account>:<decimal amount>".
std::optional<power_table_t> parse_power_table(
    const std::vector<std::string>& entries) {
  auto table = power_table_t{};
  for (const auto& entry : entries) {
    auto separator = entry.find(':');
    if (separator == std::string::npos) {
      std::cerr << "--power: expected account:amount, got '" << entry << "'"
                << std::endl;
      return std::nullopt;
    }
    auto account = parse_account(entry.substr(0, separator), "power");
    auto amount = parse_amount(entry.substr(separator + 1), "power");
    if (!account || !amount) {
      return std::nullopt;
    }
    table[*account] = *amount;
  }
  return table;
}

void print_result(const operation_result_t& result) {
  std::cout << "code: " << result.code << " (" << result.log << ")\n"
            << "codespace: " << result.codespace << "\n"
            << "info: " << result.info << "\n";
  if (!result.data.empty()) {
    std::cout << "data: " << to_hex(result.data) << "\n";
  }
  for (const auto& event : result.events) {
    std::cout << "event #" << event.sequence << " " << to_string(event.type);
    for (const auto& attribute : event.attributes) {
      std::cout << " " << attribute.key << "=" << attribute.value;
    }
    std::cout << "\n";
  }
}

void print_proposal(const proposal_state_t& proposal,
                    const proposal_status_t status) {
  std::cout << "proposal: " << to_hex(proposal.proposal_id) << "\n"
            << "status: " << to_string(status) << "\n"
            << "proposer: " << to_hex(proposal.proposer) << "\n"
            << "description: " << make_string(proposal.description) << "\n"
            << "voting: " << proposal.voting_start << ".."
            << proposal.voting_end << "\n"
            << "quorum: " << to_string(proposal.quorum) << "\n"
            << "threshold: " << proposal.approval_threshold_percent << "%\n"
            << "weighting: " << to_string(proposal.weighting) << "\n"
            << "tally: for=" << to_string(proposal.tally.in_favor)
            << " against=" << to_string(proposal.tally.against)
            << " abstain=" << to_string(proposal.tally.abstain)
            << " voters=" << proposal.tally.voters << "\n";
  if (proposal.execute_after) {
    std::cout << "execute_after: " << *proposal.execute_after << "\n";
  }
  for (std::size_t i = 0; i < proposal.targets.size(); ++i) {
    std::cout << "action " << i << ": " << to_hex(proposal.targets[i]) << " "
              << to_string(proposal.values[i]) << " "
              << to_hex(proposal.payloads[i]) << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto config_path = std::string{};
  auto command = std::string{};
  auto caller_hex = std::string{};
  auto proposal_hex = std::string{};
  auto choice_name = std::string{};
  auto description_text = std::string{};
  auto to_hex_arg = std::string{};
  auto amount_text = std::string{};
  auto log_file = std::string{};
  auto power_entries = std::vector<std::string>{};
  auto target_entries = std::vector<std::string>{};
  auto value_entries = std::vector<std::string>{};
  auto payload_entries = std::vector<std::string>{};
  auto fixed_now = uint64_t{};
  auto from_event = uint64_t{};
  auto to_event = uint64_t{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Ballot"};
  description.add_options()("help,h", "Show the help message")(
      "db", boost::program_options::value<std::string>(&db_path)
                ->default_value("ballot.db"),
      "RocksDB directory")(
      "config", boost::program_options::value<std::string>(&config_path),
      "INI file with a [governance] section")(
      "now", boost::program_options::value<uint64_t>(&fixed_now),
      "Fixed clock in milliseconds (default: system clock)")(
      "power",
      boost::program_options::value<std::vector<std::string>>(&power_entries),
      "account:amount voting power (repeatable)")(
      "command,c", boost::program_options::value<std::string>(&command),
      "propose|vote|queue|execute|cancel|delegate|revoke|state|show|list|"
      "events")(
      "caller", boost::program_options::value<std::string>(&caller_hex),
      "Acting account")(
      "proposal", boost::program_options::value<std::string>(&proposal_hex),
      "Proposal id")(
      "choice", boost::program_options::value<std::string>(&choice_name),
      "for|against|abstain")(
      "target",
      boost::program_options::value<std::vector<std::string>>(&target_entries),
      "Action target (repeatable)")(
      "value",
      boost::program_options::value<std::vector<std::string>>(&value_entries),
      "Action value (repeatable)")(
      "payload",
      boost::program_options::value<std::vector<std::string>>(
          &payload_entries),
      "Action payload in hex (repeatable)")(
      "description",
      boost::program_options::value<std::string>(&description_text),
      "Proposal description")(
      "to", boost::program_options::value<std::string>(&to_hex_arg),
      "Delegate account")(
      "amount", boost::program_options::value<std::string>(&amount_text),
      "Delegation amount")(
      "from-event",
      boost::program_options::value<uint64_t>(&from_event)->default_value(1),
      "First event sequence")(
      "to-event",
      boost::program_options::value<uint64_t>(&to_event)->default_value(
          std::numeric_limits<uint64_t>::max()),
      "Last event sequence")(
      "log-file", boost::program_options::value<std::string>(&log_file),
      "Also write logs to this file")("verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << std::endl;
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    return vm.contains("help") ? 0 : 2;
  }

  spdlog::init_thread_pool(8192, 1);
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "ballot", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto config = ballot::governance::governance_config{};
  if (!config_path.empty()) {
    auto error = std::string{};
    if (!ballot::governance::load_config(config_path, config, error)) {
      spdlog::error("Invalid config: {}", error);
      spdlog::shutdown();
      return 2;
    }
  }

  auto power_table = parse_power_table(power_entries);
  if (!power_table) {
    spdlog::shutdown();
    return 2;
  }

  auto time_source = ballot::governance::time_source_t{};
  if (vm.contains("now")) {
    time_source = [fixed_now] { return fixed_now; };
  } else {
    time_source = [] {
      return static_cast<timestamp_milliseconds_t>(
          std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::system_clock::now().time_since_epoch())
              .count());
    };
  }

  auto gateway = ballot::governance::execution_gateway{
      [](const account_id_t& target, const amount_t& value,
         const bytes_t& payload) {
        spdlog::info("Invoking {} with value {} and {} byte payload",
                     to_hex(target), to_string(value), payload.size());
        return ballot::governance::invocation_result{.success = true,
                                                     .return_data = {}};
      }};

  auto encoder = ballot::governance::encoder_t{};
  auto storage =
      ballot::storage::make_storage<ballot::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = ballot::governance::engine{
      encoder,
      storage,
      config,
      [table = *power_table](const account_id_t& account,
                             timestamp_milliseconds_t) {
        auto it = table.find(account);
        return it == std::end(table) ? amount_t{0} : it->second;
      },
      std::move(gateway),
      std::move(time_source)};

  auto require_account = [&](const std::string& value,
                             const std::string_view option) {
    if (value.empty()) {
      std::cerr << "--" << option << " is required for " << command
                << std::endl;
      return std::optional<account_id_t>{};
    }
    return parse_account(value, option);
  };

  auto exit_code = 0;
  auto finish = [&](const operation_result_t& result) {
    print_result(result);
    exit_code = result.code == 0 ? 0 : 1;
  };

  if (command == "list") {
    for (const auto& proposal : engine.proposals()) {
      auto status = engine.state(proposal.proposal_id);
      std::cout << to_hex(proposal.proposal_id) << " "
                << to_string(std::get<proposal_status_t>(status)) << " "
                << make_string(proposal.description) << "\n";
    }
  } else if (command == "events") {
    for (const auto& event : engine.events(from_event, to_event)) {
      std::cout << "#" << event.sequence << " " << event.emitted_at << " "
                << to_string(event.type);
      for (const auto& attribute : event.attributes) {
        std::cout << " " << attribute.key << "=" << attribute.value;
      }
      std::cout << "\n";
    }
  } else if (command == "propose") {
    auto proposer = require_account(caller_hex, "caller");
    if (!proposer) {
      exit_code = 2;
    } else {
      auto proposal = propose_proposal_t{};
      proposal.description = make_bytes(description_text);
      for (const auto& target : target_entries) {
        auto account = parse_account(target, "target");
        if (!account) {
          exit_code = 2;
          break;
        }
        proposal.targets.push_back(*account);
      }
      for (const auto& value : value_entries) {
        auto amount = parse_amount(value, "value");
        if (!amount) {
          exit_code = 2;
          break;
        }
        proposal.values.push_back(*amount);
      }
      for (const auto& payload : payload_entries) {
        auto bytes = try_from_hex(payload);
        if (!bytes) {
          std::cerr << "--payload: expected hex, got '" << payload << "'"
                    << std::endl;
          exit_code = 2;
          break;
        }
        proposal.payloads.push_back(std::move(*bytes));
      }
      if (exit_code == 0) {
        finish(engine.propose(*proposer, proposal));
      }
    }
  } else if (command == "delegate" || command == "revoke") {
    auto from = require_account(caller_hex, "caller");
    auto to = require_account(to_hex_arg, "to");
    auto amount = parse_amount(amount_text, "amount");
    if (!from || !to || !amount) {
      exit_code = 2;
    } else if (command == "delegate") {
      finish(engine.delegate(*from, *to, *amount));
    } else {
      finish(engine.revoke(*from, *to, *amount));
    }
  } else {
    auto proposal_id = require_account(proposal_hex, "proposal");
    if (!proposal_id) {
      exit_code = 2;
    } else if (command == "state" || command == "show") {
      auto loaded = engine.proposal(*proposal_id);
      if (auto* error = std::get_if<governance_error_code>(&loaded)) {
        std::cerr << to_string(*error) << std::endl;
        exit_code = 1;
      } else {
        auto status =
            std::get<proposal_status_t>(engine.state(*proposal_id));
        if (command == "state") {
          std::cout << to_string(status) << "\n";
        } else {
          print_proposal(std::get<proposal_state_t>(loaded), status);
        }
      }
    } else {
      auto caller = require_account(caller_hex, "caller");
      if (!caller) {
        exit_code = 2;
      } else if (command == "vote") {
        auto choice = try_from_string<vote_choice_t>(choice_name);
        if (!choice) {
          std::cerr << "--choice: expected for, against or abstain"
                    << std::endl;
          exit_code = 2;
        } else {
          finish(engine.cast_vote(*caller, *proposal_id, *choice));
        }
      } else if (command == "queue") {
        finish(engine.queue(*caller, *proposal_id));
      } else if (command == "execute") {
        finish(engine.execute(*caller, *proposal_id));
      } else if (command == "cancel") {
        finish(engine.cancel(*caller, *proposal_id));
      } else {
        std::cerr << "unknown command '" << command << "'" << std::endl;
        exit_code = 2;
      }
    }
  }

  std::cout.flush();
  spdlog::shutdown();
  return exit_code;
}
