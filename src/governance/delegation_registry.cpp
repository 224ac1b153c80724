#include <ballot/governance/delegation_registry.hpp>

#include <ballot/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <utility>

using namespace ballot::schema;

namespace {

using big_int_t = boost::multiprecision::cpp_int;

amount_t saturating_sub(const amount_t& lhs, const amount_t& rhs) {
  return lhs > rhs ? amount_t{lhs - rhs} : amount_t{0};
}

amount_t saturating_add(const amount_t& lhs, const amount_t& rhs) {
  auto sum = big_int_t{lhs} + big_int_t{rhs};
  if (sum > big_int_t{std::numeric_limits<amount_t>::max()}) {
    return std::numeric_limits<amount_t>::max();
  }
  return static_cast<amount_t>(sum);
}

// Append a checkpoint derived from the latest one, or rewrite the latest in
// place when it was taken at the same instant.
template <typename Mutator>
void advance_checkpoints(std::vector<power_checkpoint_t>& log,
                         const timestamp_milliseconds_t now,
                         Mutator&& mutate) {
  if (log.empty() || log.back().at < now) {
    auto next = log.empty() ? power_checkpoint_t{} : log.back();
    next.at = now;
    log.push_back(std::move(next));
  }
  mutate(log.back());
}

}  // namespace

namespace ballot::governance {

delegation_registry::delegation_registry(encoder_t& encoder,
                                         storage_t& storage,
                                         voting_power_source_t power_source)
    : encoder_{encoder},
      storage_{storage},
      power_source_{std::move(power_source)} {}

std::optional<governance_error_code> delegation_registry::delegate(
    const account_id_t& from,
    const account_id_t& to,
    const amount_t& amount,
    const timestamp_milliseconds_t now) {
  if (from == to) {
    return governance_error_code::self_delegation;
  }
  if (amount == 0) {
    return governance_error_code::invalid_amount;
  }
  if (spendable(from, now) < amount) {
    return governance_error_code::insufficient_power;
  }

  auto edge_key = key::make_delegation_key(from, to);
  auto edge = storage_.get<delegation_edge_t>(encoder_, edge_key)
                  .value_or(delegation_edge_t{});
  edge.delegator = from;
  edge.delegate = to;
  edge.amount = saturating_add(edge.amount, amount);
  edge.updated_at = now;

  auto from_log = checkpoints(from);
  advance_checkpoints(from_log, now, [&](auto& checkpoint) {
    checkpoint.delegated_out = saturating_add(checkpoint.delegated_out, amount);
  });
  auto to_log = checkpoints(to);
  advance_checkpoints(to_log, now, [&](auto& checkpoint) {
    checkpoint.delegated_in = saturating_add(checkpoint.delegated_in, amount);
  });

  storage_.write_batch({{edge_key, encoder_.encode(edge)},
                        {key::make_checkpoint_key(from), encoder_.encode(from_log)},
                        {key::make_checkpoint_key(to), encoder_.encode(to_log)}},
                       {});
  spdlog::debug("Delegated {} from {} to {}", to_string(amount), to_hex(from),
                to_hex(to));
  return std::nullopt;
}

std::optional<governance_error_code> delegation_registry::revoke(
    const account_id_t& from,
    const account_id_t& to,
    const amount_t& amount,
    const timestamp_milliseconds_t now) {
  if (from == to) {
    return governance_error_code::self_delegation;
  }
  if (amount == 0) {
    return governance_error_code::invalid_amount;
  }

  auto edge_key = key::make_delegation_key(from, to);
  auto edge = storage_.get<delegation_edge_t>(encoder_, edge_key);
  if (!edge || edge->amount < amount) {
    return governance_error_code::insufficient_delegation;
  }
  edge->amount -= amount;
  edge->updated_at = now;

  auto from_log = checkpoints(from);
  advance_checkpoints(from_log, now, [&](auto& checkpoint) {
    checkpoint.delegated_out = saturating_sub(checkpoint.delegated_out, amount);
  });
  auto to_log = checkpoints(to);
  advance_checkpoints(to_log, now, [&](auto& checkpoint) {
    checkpoint.delegated_in = saturating_sub(checkpoint.delegated_in, amount);
  });

  auto puts = std::vector<ballot::storage::key_value_entry_t>{
      {key::make_checkpoint_key(from), encoder_.encode(from_log)},
      {key::make_checkpoint_key(to), encoder_.encode(to_log)}};
  auto deletes = std::vector<bytes_t>{};
  if (edge->amount == 0) {
    deletes.push_back(edge_key);
  } else {
    puts.emplace_back(edge_key, encoder_.encode(*edge));
  }
  storage_.write_batch(puts, deletes);
  spdlog::debug("Revoked {} delegated from {} to {}", to_string(amount),
                to_hex(from), to_hex(to));
  return std::nullopt;
}

amount_t delegation_registry::delegation(const account_id_t& from,
                                         const account_id_t& to) const {
  auto edge = storage_.get<delegation_edge_t>(
      encoder_, key::make_delegation_key(from, to));
  return edge ? edge->amount : amount_t{0};
}

std::vector<delegation_edge_t> delegation_registry::delegations_from(
    const account_id_t& from) const {
  auto entries = storage_.list_by_prefix(key::make_delegation_prefix(from));
  auto edges = std::vector<delegation_edge_t>{};
  edges.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    edges.push_back(encoder_.decode<delegation_edge_t>(
        bytes_view_t{value.data(), value.size()}));
  }
  return edges;
}

amount_t delegation_registry::delegated_in(
    const account_id_t& account,
    const timestamp_milliseconds_t at) const {
  auto checkpoint = checkpoint_at(account, at);
  return checkpoint ? checkpoint->delegated_in : amount_t{0};
}

amount_t delegation_registry::delegated_out(
    const account_id_t& account,
    const timestamp_milliseconds_t at) const {
  auto checkpoint = checkpoint_at(account, at);
  return checkpoint ? checkpoint->delegated_out : amount_t{0};
}

amount_t delegation_registry::spendable(
    const account_id_t& account,
    const timestamp_milliseconds_t at) const {
  auto own = power_source_ ? power_source_(account, at) : amount_t{0};
  return saturating_sub(own, delegated_out(account, at));
}

amount_t delegation_registry::power_of(
    const account_id_t& account,
    const timestamp_milliseconds_t at) const {
  auto own = power_source_ ? power_source_(account, at) : amount_t{0};
  auto checkpoint = checkpoint_at(account, at);
  if (!checkpoint) {
    return own;
  }
  return saturating_add(saturating_sub(own, checkpoint->delegated_out),
                        checkpoint->delegated_in);
}

amount_t delegation_registry::snapshot_power_of(
    const account_id_t& account,
    const timestamp_milliseconds_t snapshot) const {
  auto own = power_source_ ? power_source_(account, snapshot) : amount_t{0};
  auto checkpoint = checkpoint_before(account, snapshot);
  if (!checkpoint) {
    return own;
  }
  return saturating_add(saturating_sub(own, checkpoint->delegated_out),
                        checkpoint->delegated_in);
}

std::vector<power_checkpoint_t> delegation_registry::checkpoints(
    const account_id_t& account) const {
  return storage_
      .get<std::vector<power_checkpoint_t>>(encoder_,
                                            key::make_checkpoint_key(account))
      .value_or(std::vector<power_checkpoint_t>{});
}

std::optional<power_checkpoint_t> delegation_registry::checkpoint_at(
    const account_id_t& account,
    const timestamp_milliseconds_t at) const {
  auto log = checkpoints(account);
  auto it = std::upper_bound(
      std::begin(log), std::end(log), at,
      [](const timestamp_milliseconds_t value, const auto& checkpoint) {
        return value < checkpoint.at;
      });
  if (it == std::begin(log)) {
    return std::nullopt;
  }
  return *std::prev(it);
}

std::optional<power_checkpoint_t> delegation_registry::checkpoint_before(
    const account_id_t& account,
    const timestamp_milliseconds_t at) const {
  auto log = checkpoints(account);
  auto it = std::lower_bound(
      std::begin(log), std::end(log), at,
      [](const auto& checkpoint, const timestamp_milliseconds_t value) {
        return checkpoint.at < value;
      });
  if (it == std::begin(log)) {
    return std::nullopt;
  }
  return *std::prev(it);
}

}  // namespace ballot::governance
