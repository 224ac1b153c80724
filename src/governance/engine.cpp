#include <ballot/governance/engine.hpp>

#include <ballot/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <utility>

using namespace ballot::schema;

namespace {

constexpr auto kProposeCodespace = std::string_view{"ballot.propose"};
constexpr auto kVoteCodespace = std::string_view{"ballot.vote"};
constexpr auto kQueueCodespace = std::string_view{"ballot.queue"};
constexpr auto kExecuteCodespace = std::string_view{"ballot.execute"};
constexpr auto kCancelCodespace = std::string_view{"ballot.cancel"};
constexpr auto kDelegateCodespace = std::string_view{"ballot.delegate"};
constexpr auto kRevokeCodespace = std::string_view{"ballot.revoke"};

operation_result_t make_error_result(const governance_error_code code,
                                     const std::string_view codespace,
                                     std::string info) {
  spdlog::warn("{} rejected: {} {}", codespace, to_string(code), info);
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

operation_result_t make_success_result(const std::string_view codespace,
                                       std::string info) {
  auto result = operation_result_t{};
  result.code = 0;
  result.log = "ok";
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

event_attribute_t make_attribute(const std::string_view key,
                                 std::string value,
                                 const bool index = false) {
  return event_attribute_t{
      .key = std::string{key}, .value = std::move(value), .index = index};
}

std::vector<event_attribute_t> make_state_change_attributes(
    const proposal_id_t& proposal_id,
    const proposal_status_t from,
    const proposal_status_t to) {
  return {make_attribute("proposal_id", to_hex(proposal_id), true),
          make_attribute("from", std::string{to_string(from)}),
          make_attribute("to", std::string{to_string(to)})};
}

}  // namespace

namespace ballot::governance {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               governance_config config,
               voting_power_source_t power_source,
               execution_gateway gateway,
               time_source_t time_source,
               reputation_source_t reputation_source)
    : encoder_{encoder},
      storage_{storage},
      config_{std::move(config)},
      time_source_{std::move(time_source)},
      gateway_{std::move(gateway)},
      proposals_{encoder, storage},
      delegations_{encoder, storage, std::move(power_source)},
      votes_{encoder, storage, proposals_, delegations_,
             std::move(reputation_source)} {
  auto lock = std::scoped_lock{mutex_};
  last_observed_ = storage_.get<timestamp_milliseconds_t>(
                               encoder_, key::make_clock_key())
                       .value_or(0);
  next_event_sequence_ =
      storage_.get<uint64_t>(encoder_, key::make_event_sequence_key())
          .value_or(0) +
      1;
  spdlog::info(
      "Governance engine ready: clock {} ms, next event {}, weighting {}",
      last_observed_, next_event_sequence_, to_string(config_.weighting));
}

operation_result_t engine::propose(const account_id_t& proposer,
                                   const propose_proposal_t& proposal) {
  auto lock = std::scoped_lock{mutex_};
  auto now = observe_clock();
  if (!now) {
    return make_error_result(governance_error_code::clock_regression,
                             kProposeCodespace, "time moved backwards");
  }

  if (config_.proposal_threshold > 0) {
    auto power = delegations_.power_of(proposer, *now);
    if (power < config_.proposal_threshold) {
      return make_error_result(
          governance_error_code::proposal_threshold_not_met, kProposeCodespace,
          "proposer power " + to_string(power) + " below " +
              to_string(config_.proposal_threshold));
    }
  }

  auto created = proposals_.create(proposer, proposal, *now, config_);
  if (auto* error = std::get_if<governance_error_code>(&created)) {
    return make_error_result(*error, kProposeCodespace, to_hex(proposer));
  }
  const auto& record = std::get<proposal_state_t>(created);

  auto staged = std::vector<governance_event_t>{};
  staged.push_back(make_event(
      governance_event_type_t::proposal_created, *now,
      {make_attribute("proposal_id", to_hex(record.proposal_id), true),
       make_attribute("proposer", to_hex(proposer), true),
       make_attribute("actions", std::to_string(record.targets.size())),
       make_attribute("voting_start", std::to_string(record.voting_start)),
       make_attribute("voting_end", std::to_string(record.voting_end)),
       make_attribute("quorum", to_string(record.quorum)),
       make_attribute("approval_threshold_percent",
                      std::to_string(record.approval_threshold_percent)),
       make_attribute("weighting", std::string{to_string(record.weighting)}),
       make_attribute("description_hash", to_hex(record.description_hash))}));

  auto result = make_success_result(kProposeCodespace, "proposal created");
  result.data = encoder_.encode(record.proposal_id);
  commit(result, std::move(staged), *now);
  spdlog::info("Proposal {} created by {} (voting {}..{})",
               to_hex(record.proposal_id), to_hex(proposer),
               record.voting_start, record.voting_end);
  return result;
}

operation_result_t engine::cast_vote(const account_id_t& voter,
                                     const proposal_id_t& proposal_id,
                                     const vote_choice_t choice) {
  auto lock = std::scoped_lock{mutex_};
  auto now = observe_clock();
  if (!now) {
    return make_error_result(governance_error_code::clock_regression,
                             kVoteCodespace, "time moved backwards");
  }

  auto cast = votes_.cast_vote(proposal_id, voter, choice, *now);
  if (auto* error = std::get_if<governance_error_code>(&cast)) {
    return make_error_result(*error, kVoteCodespace, to_hex(proposal_id));
  }
  const auto& receipt = std::get<vote_receipt_t>(cast);

  auto staged = std::vector<governance_event_t>{};
  staged.push_back(make_event(
      governance_event_type_t::vote_cast, *now,
      {make_attribute("proposal_id", to_hex(proposal_id), true),
       make_attribute("voter", to_hex(voter), true),
       make_attribute("choice", std::string{to_string(choice)}),
       make_attribute("snapshot_power", to_string(receipt.snapshot_power)),
       make_attribute("weight", to_string(receipt.weight))}));

  auto result = make_success_result(kVoteCodespace, "vote recorded");
  result.data = encoder_.encode(receipt.weight);
  commit(result, std::move(staged), *now);
  spdlog::info("{} voted {} on {} with weight {}", to_hex(voter),
               to_string(choice), to_hex(proposal_id),
               to_string(receipt.weight));
  return result;
}

operation_result_t engine::queue(const account_id_t& caller,
                                 const proposal_id_t& proposal_id) {
  auto lock = std::scoped_lock{mutex_};
  auto now = observe_clock();
  if (!now) {
    return make_error_result(governance_error_code::clock_regression,
                             kQueueCodespace, "time moved backwards");
  }

  auto loaded = proposals_.get(proposal_id);
  auto* record = std::get_if<proposal_state_t>(&loaded);
  if (record == nullptr) {
    return make_error_result(std::get<governance_error_code>(loaded),
                             kQueueCodespace, to_hex(proposal_id));
  }
  if (!config_.queuers.empty() && !is_listed(config_.queuers, caller)) {
    return make_error_result(governance_error_code::not_authorized,
                             kQueueCodespace, to_hex(caller));
  }
  auto status = resolve_status(*record, *now);
  if (status == proposal_status_t::executed) {
    return make_error_result(governance_error_code::already_executed,
                             kQueueCodespace, to_hex(proposal_id));
  }
  if (status != proposal_status_t::succeeded) {
    return make_error_result(governance_error_code::illegal_transition,
                             kQueueCodespace,
                             "proposal is " + std::string{to_string(status)});
  }
  if (auto error = proposals_.transition(proposal_id, status,
                                         proposal_status_t::queued, *now)) {
    return make_error_result(*error, kQueueCodespace, to_hex(proposal_id));
  }

  auto execute_after = *now + record->execution_delay;
  auto staged = std::vector<governance_event_t>{};
  staged.push_back(make_event(
      governance_event_type_t::proposal_queued, *now,
      {make_attribute("proposal_id", to_hex(proposal_id), true),
       make_attribute("queuer", to_hex(caller), true),
       make_attribute("execute_after", std::to_string(execute_after))}));
  staged.push_back(make_event(
      governance_event_type_t::proposal_state_changed, *now,
      make_state_change_attributes(proposal_id, status,
                                   proposal_status_t::queued)));

  auto result = make_success_result(kQueueCodespace, "proposal queued");
  commit(result, std::move(staged), *now);
  spdlog::info("Proposal {} queued; executable after {}", to_hex(proposal_id),
               execute_after);
  return result;
}

operation_result_t engine::execute(const account_id_t& caller,
                                   const proposal_id_t& proposal_id) {
  auto lock = std::scoped_lock{mutex_};
  auto now = observe_clock();
  if (!now) {
    return make_error_result(governance_error_code::clock_regression,
                             kExecuteCodespace, "time moved backwards");
  }

  auto loaded = proposals_.get(proposal_id);
  auto* record = std::get_if<proposal_state_t>(&loaded);
  if (record == nullptr) {
    return make_error_result(std::get<governance_error_code>(loaded),
                             kExecuteCodespace, to_hex(proposal_id));
  }
  if (!config_.executors.empty() && !is_listed(config_.executors, caller)) {
    return make_error_result(governance_error_code::not_authorized,
                             kExecuteCodespace, to_hex(caller));
  }
  auto status = resolve_status(*record, *now);
  if (status == proposal_status_t::executed) {
    return make_error_result(governance_error_code::already_executed,
                             kExecuteCodespace, to_hex(proposal_id));
  }
  if (status != proposal_status_t::queued) {
    return make_error_result(governance_error_code::illegal_transition,
                             kExecuteCodespace,
                             "proposal is " + std::string{to_string(status)});
  }
  if (*now < record->execute_after.value_or(0)) {
    return make_error_result(
        governance_error_code::timelock_not_elapsed, kExecuteCodespace,
        "executable after " + std::to_string(*record->execute_after));
  }

  auto batch =
      gateway_.execute_batch(record->targets, record->values, record->payloads);
  if (!batch.success) {
    auto index = batch.failed_index.value_or(0);
    spdlog::error("Proposal {} action {} failed; proposal stays queued",
                  to_hex(proposal_id), index);
    auto result = make_error_result(governance_error_code::target_call_failed,
                                    kExecuteCodespace,
                                    "action " + std::to_string(index));
    result.data = std::move(batch.return_data);
    return result;
  }

  if (auto error = proposals_.transition(proposal_id, status,
                                         proposal_status_t::executed, *now)) {
    return make_error_result(*error, kExecuteCodespace, to_hex(proposal_id));
  }

  auto staged = std::vector<governance_event_t>{};
  staged.push_back(make_event(
      governance_event_type_t::proposal_executed, *now,
      {make_attribute("proposal_id", to_hex(proposal_id), true),
       make_attribute("executor", to_hex(caller), true),
       make_attribute("actions", std::to_string(record->targets.size()))}));
  staged.push_back(make_event(
      governance_event_type_t::proposal_state_changed, *now,
      make_state_change_attributes(proposal_id, status,
                                   proposal_status_t::executed)));

  auto result = make_success_result(kExecuteCodespace, "proposal executed");
  commit(result, std::move(staged), *now);
  spdlog::info("Proposal {} executed ({} action(s))", to_hex(proposal_id),
               record->targets.size());
  return result;
}

operation_result_t engine::cancel(const account_id_t& caller,
                                  const proposal_id_t& proposal_id) {
  auto lock = std::scoped_lock{mutex_};
  auto now = observe_clock();
  if (!now) {
    return make_error_result(governance_error_code::clock_regression,
                             kCancelCodespace, "time moved backwards");
  }

  auto loaded = proposals_.get(proposal_id);
  auto* record = std::get_if<proposal_state_t>(&loaded);
  if (record == nullptr) {
    return make_error_result(std::get<governance_error_code>(loaded),
                             kCancelCodespace, to_hex(proposal_id));
  }
  if (caller != record->proposer && !is_listed(config_.cancellers, caller)) {
    return make_error_result(governance_error_code::not_authorized,
                             kCancelCodespace, to_hex(caller));
  }
  auto status = resolve_status(*record, *now);
  if (status != proposal_status_t::pending &&
      status != proposal_status_t::active) {
    return make_error_result(governance_error_code::illegal_transition,
                             kCancelCodespace,
                             "proposal is " + std::string{to_string(status)});
  }
  if (auto error = proposals_.transition(proposal_id, status,
                                         proposal_status_t::cancelled, *now)) {
    return make_error_result(*error, kCancelCodespace, to_hex(proposal_id));
  }

  auto staged = std::vector<governance_event_t>{};
  staged.push_back(make_event(
      governance_event_type_t::proposal_cancelled, *now,
      {make_attribute("proposal_id", to_hex(proposal_id), true),
       make_attribute("canceller", to_hex(caller), true)}));
  staged.push_back(make_event(
      governance_event_type_t::proposal_state_changed, *now,
      make_state_change_attributes(proposal_id, status,
                                   proposal_status_t::cancelled)));

  auto result = make_success_result(kCancelCodespace, "proposal cancelled");
  commit(result, std::move(staged), *now);
  spdlog::info("Proposal {} cancelled by {}", to_hex(proposal_id),
               to_hex(caller));
  return result;
}

operation_result_t engine::delegate(const account_id_t& from,
                                    const account_id_t& to,
                                    const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto now = observe_clock();
  if (!now) {
    return make_error_result(governance_error_code::clock_regression,
                             kDelegateCodespace, "time moved backwards");
  }
  if (auto error = delegations_.delegate(from, to, amount, *now)) {
    return make_error_result(*error, kDelegateCodespace,
                             to_hex(from) + " -> " + to_hex(to));
  }

  auto staged = std::vector<governance_event_t>{};
  staged.push_back(make_event(
      governance_event_type_t::delegation_changed, *now,
      {make_attribute("delegator", to_hex(from), true),
       make_attribute("delegate", to_hex(to), true),
       make_attribute("action", "delegate"),
       make_attribute("delta", to_string(amount)),
       make_attribute("amount", to_string(delegations_.delegation(from, to)))}));

  auto result = make_success_result(kDelegateCodespace, "delegation updated");
  commit(result, std::move(staged), *now);
  spdlog::info("{} delegated {} to {}", to_hex(from), to_string(amount),
               to_hex(to));
  return result;
}

operation_result_t engine::revoke(const account_id_t& from,
                                  const account_id_t& to,
                                  const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto now = observe_clock();
  if (!now) {
    return make_error_result(governance_error_code::clock_regression,
                             kRevokeCodespace, "time moved backwards");
  }
  if (auto error = delegations_.revoke(from, to, amount, *now)) {
    return make_error_result(*error, kRevokeCodespace,
                             to_hex(from) + " -> " + to_hex(to));
  }

  auto staged = std::vector<governance_event_t>{};
  staged.push_back(make_event(
      governance_event_type_t::delegation_changed, *now,
      {make_attribute("delegator", to_hex(from), true),
       make_attribute("delegate", to_hex(to), true),
       make_attribute("action", "revoke"),
       make_attribute("delta", to_string(amount)),
       make_attribute("amount", to_string(delegations_.delegation(from, to)))}));

  auto result = make_success_result(kRevokeCodespace, "delegation updated");
  commit(result, std::move(staged), *now);
  spdlog::info("{} revoked {} from {}", to_hex(from), to_string(amount),
               to_hex(to));
  return result;
}

store_result_t<proposal_state_t> engine::proposal(
    const proposal_id_t& proposal_id) const {
  auto lock = std::scoped_lock{mutex_};
  return proposals_.get(proposal_id);
}

store_result_t<proposal_status_t> engine::state(
    const proposal_id_t& proposal_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto loaded = proposals_.get(proposal_id);
  if (auto* error = std::get_if<governance_error_code>(&loaded)) {
    return *error;
  }
  return resolve_status(std::get<proposal_state_t>(loaded), read_clock());
}

store_result_t<vote_receipt_t> engine::receipt(
    const proposal_id_t& proposal_id,
    const account_id_t& voter) const {
  auto lock = std::scoped_lock{mutex_};
  auto loaded = proposals_.get(proposal_id);
  if (auto* error = std::get_if<governance_error_code>(&loaded)) {
    return *error;
  }
  return votes_.receipt_of(proposal_id, voter);
}

std::vector<vote_receipt_t> engine::receipts(
    const proposal_id_t& proposal_id) const {
  auto lock = std::scoped_lock{mutex_};
  return votes_.receipts(proposal_id);
}

std::vector<proposal_state_t> engine::proposals() const {
  auto lock = std::scoped_lock{mutex_};
  return proposals_.list();
}

amount_t engine::power_of(const account_id_t& account,
                          const timestamp_milliseconds_t at) const {
  auto lock = std::scoped_lock{mutex_};
  return delegations_.power_of(account, at);
}

store_result_t<amount_t> engine::voting_weight(
    const proposal_id_t& proposal_id,
    const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  auto loaded = proposals_.get(proposal_id);
  if (auto* error = std::get_if<governance_error_code>(&loaded)) {
    return *error;
  }
  return votes_.voting_weight(std::get<proposal_state_t>(loaded), account);
}

amount_t engine::delegation(const account_id_t& from,
                            const account_id_t& to) const {
  auto lock = std::scoped_lock{mutex_};
  return delegations_.delegation(from, to);
}

std::vector<governance_event_t> engine::events(
    const uint64_t from_sequence,
    const uint64_t to_sequence) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<governance_event_t>{};
  if (from_sequence > to_sequence || next_event_sequence_ <= 1) {
    return out;
  }
  auto last = std::min(to_sequence, next_event_sequence_ - 1);
  for (auto sequence = std::max<uint64_t>(from_sequence, 1); sequence <= last;
       ++sequence) {
    auto event = storage_.get<governance_event_t>(
        encoder_, key::make_event_key(sequence));
    if (event) {
      out.push_back(std::move(*event));
    }
  }
  return out;
}

const governance_config& engine::config() const {
  return config_;
}

std::optional<timestamp_milliseconds_t> engine::observe_clock() {
  auto now = time_source_();
  if (now < last_observed_) {
    spdlog::warn("Clock regression: observed {} ms after {} ms", now,
                 last_observed_);
    return std::nullopt;
  }
  return now;
}

timestamp_milliseconds_t engine::read_clock() const {
  return std::max(time_source_(), last_observed_);
}

governance_event_t engine::make_event(
    const governance_event_type_t type,
    const timestamp_milliseconds_t now,
    std::vector<event_attribute_t> attributes) {
  auto event = governance_event_t{};
  event.sequence = next_event_sequence_++;
  event.type = type;
  event.emitted_at = now;
  event.attributes = std::move(attributes);
  return event;
}

void engine::commit(operation_result_t& result,
                    std::vector<governance_event_t> staged,
                    const timestamp_milliseconds_t now) {
  auto puts = std::vector<ballot::storage::key_value_entry_t>{};
  puts.reserve(staged.size() + 2);
  for (const auto& event : staged) {
    puts.emplace_back(key::make_event_key(event.sequence),
                      encoder_.encode(event));
  }
  puts.emplace_back(key::make_event_sequence_key(),
                    encoder_.encode(next_event_sequence_ - 1));
  puts.emplace_back(key::make_clock_key(), encoder_.encode(now));
  storage_.write_batch(puts, {});
  last_observed_ = now;
  result.events = std::move(staged);
}

}  // namespace ballot::governance
