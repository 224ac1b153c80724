#include <ballot/governance/config.hpp>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <optional>

namespace po = boost::program_options;

namespace ballot::governance {

namespace {

std::optional<std::vector<ballot::schema::account_id_t>> parse_accounts(
    const std::vector<std::string>& values,
    const std::string_view field,
    std::string& error) {
  auto accounts = std::vector<ballot::schema::account_id_t>{};
  accounts.reserve(values.size());
  for (const auto& value : values) {
    auto account = ballot::schema::try_make_hash32(value);
    if (!account) {
      error = std::string{field} + ": expected 32-byte hex account, got '" +
              value + "'";
      return std::nullopt;
    }
    accounts.push_back(*account);
  }
  return accounts;
}

std::optional<ballot::schema::amount_t> parse_amount_field(
    const std::string& value,
    const std::string_view field,
    std::string& error) {
  auto parsed = ballot::schema::try_parse_amount(value);
  if (!parsed) {
    error = std::string{field} + ": expected decimal amount, got '" + value +
            "'";
  }
  return parsed;
}

}  // namespace

bool validate_config(const governance_config& config, std::string& error) {
  if (config.approval_threshold_percent == 0 ||
      config.approval_threshold_percent > 100) {
    error = "approval_threshold_percent must be within 1..100";
    return false;
  }
  if (config.voting_period == 0) {
    error = "voting_period_ms must be greater than zero";
    return false;
  }
  if (config.max_actions == 0) {
    error = "max_actions must be greater than zero";
    return false;
  }
  return true;
}

bool load_config(const std::string_view path,
                 governance_config& config,
                 std::string& error) {
  auto input = std::ifstream{std::string{path}};
  if (!input) {
    error = "unable to open config file '" + std::string{path} + "'";
    return false;
  }

  auto quorum = std::string{};
  auto proposal_threshold = std::string{};
  auto weighting = std::string{};
  auto cancellers = std::vector<std::string>{};
  auto queuers = std::vector<std::string>{};
  auto executors = std::vector<std::string>{};
  auto loaded = config;

  auto description = po::options_description{"governance"};
  description.add_options()(
      "governance.voting_delay_ms",
      po::value<uint64_t>(&loaded.voting_delay))(
      "governance.voting_period_ms",
      po::value<uint64_t>(&loaded.voting_period))(
      "governance.execution_delay_ms",
      po::value<uint64_t>(&loaded.execution_delay))(
      "governance.quorum", po::value<std::string>(&quorum))(
      "governance.approval_threshold_percent",
      po::value<uint32_t>(&loaded.approval_threshold_percent))(
      "governance.proposal_threshold",
      po::value<std::string>(&proposal_threshold))(
      "governance.weighting", po::value<std::string>(&weighting))(
      "governance.abstain_counts_toward_approval",
      po::value<bool>(&loaded.abstain_counts_toward_approval))(
      "governance.max_actions", po::value<uint32_t>(&loaded.max_actions))(
      "governance.canceller",
      po::value<std::vector<std::string>>(&cancellers)->composing())(
      "governance.queuer",
      po::value<std::vector<std::string>>(&queuers)->composing())(
      "governance.executor",
      po::value<std::vector<std::string>>(&executors)->composing());

  try {
    auto vm = po::variables_map{};
    po::store(po::parse_config_file(input, description, true), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    error = ex.what();
    return false;
  }

  if (!quorum.empty()) {
    auto parsed = parse_amount_field(quorum, "quorum", error);
    if (!parsed) {
      return false;
    }
    loaded.quorum = *parsed;
  }
  if (!proposal_threshold.empty()) {
    auto parsed =
        parse_amount_field(proposal_threshold, "proposal_threshold", error);
    if (!parsed) {
      return false;
    }
    loaded.proposal_threshold = *parsed;
  }
  if (!weighting.empty()) {
    auto parsed =
        ballot::schema::try_from_string<ballot::schema::vote_weighting_t>(
            weighting);
    if (!parsed) {
      error = "weighting: unknown mode '" + weighting + "'";
      return false;
    }
    loaded.weighting = *parsed;
  }

  if (!cancellers.empty()) {
    auto parsed = parse_accounts(cancellers, "canceller", error);
    if (!parsed) {
      return false;
    }
    loaded.cancellers = std::move(*parsed);
  }
  if (!queuers.empty()) {
    auto parsed = parse_accounts(queuers, "queuer", error);
    if (!parsed) {
      return false;
    }
    loaded.queuers = std::move(*parsed);
  }
  if (!executors.empty()) {
    auto parsed = parse_accounts(executors, "executor", error);
    if (!parsed) {
      return false;
    }
    loaded.executors = std::move(*parsed);
  }

  if (!validate_config(loaded, error)) {
    return false;
  }
  config = std::move(loaded);
  spdlog::info("Loaded governance config from '{}'", path);
  return true;
}

bool is_listed(const std::vector<ballot::schema::account_id_t>& accounts,
               const ballot::schema::account_id_t& account) {
  return std::find(std::begin(accounts), std::end(accounts), account) !=
         std::end(accounts);
}

}  // namespace ballot::governance
