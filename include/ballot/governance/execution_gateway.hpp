#pragma once

#include <ballot/schema/primitives.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace ballot::governance {

struct invocation_result final {
  bool success{};
  ballot::schema::bytes_t return_data;
};

struct batch_result final {
  bool success{};
  std::optional<std::size_t> failed_index;
  /// Return data of the failing call, empty on success.
  ballot::schema::bytes_t return_data;
  std::vector<invocation_result> results;
};

using invoke_fn_t = std::function<invocation_result(
    const ballot::schema::account_id_t& target,
    const ballot::schema::amount_t& value,
    const ballot::schema::bytes_t& payload)>;

/// Undo hook for a call that already succeeded in a failing batch.
using revert_fn_t =
    std::function<void(const ballot::schema::account_id_t& target,
                       const ballot::schema::amount_t& value,
                       const ballot::schema::bytes_t& payload)>;

/// Dispatches a proposal's actions to their targets.
///
/// A batch stops at the first failed call. Calls applied before it are handed
/// to the revert hook in reverse order.
class execution_gateway final {
 public:
  explicit execution_gateway(invoke_fn_t invoke, revert_fn_t revert = {});

  /// Invoke a single target. An exception from the target is a failure whose
  /// return data is the exception message.
  invocation_result invoke(const ballot::schema::account_id_t& target,
                           const ballot::schema::amount_t& value,
                           const ballot::schema::bytes_t& payload) const;

  batch_result execute_batch(
      const std::vector<ballot::schema::account_id_t>& targets,
      const std::vector<ballot::schema::amount_t>& values,
      const std::vector<ballot::schema::bytes_t>& payloads) const;

 private:
  invoke_fn_t invoke_;
  revert_fn_t revert_;
};

}  // namespace ballot::governance
