#include <ballot/governance/execution_gateway.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

using namespace ballot::schema;

namespace ballot::governance {

execution_gateway::execution_gateway(invoke_fn_t invoke, revert_fn_t revert)
    : invoke_{std::move(invoke)}, revert_{std::move(revert)} {}

invocation_result execution_gateway::invoke(const account_id_t& target,
                                            const amount_t& value,
                                            const bytes_t& payload) const {
  if (!invoke_) {
    return invocation_result{
        .success = false,
        .return_data = make_bytes(std::string_view{"no invoker installed"})};
  }
  try {
    return invoke_(target, value, payload);
  } catch (const std::exception& ex) {
    spdlog::error("Target {} threw: {}", to_hex(target), ex.what());
    return invocation_result{
        .success = false,
        .return_data = make_bytes(std::string_view{ex.what()})};
  }
}

batch_result execution_gateway::execute_batch(
    const std::vector<account_id_t>& targets,
    const std::vector<amount_t>& values,
    const std::vector<bytes_t>& payloads) const {
  auto result = batch_result{};
  if (targets.size() != values.size() || targets.size() != payloads.size()) {
    result.success = false;
    result.failed_index = 0;
    result.return_data =
        make_bytes(std::string_view{"action length mismatch"});
    return result;
  }

  result.results.reserve(targets.size());
  for (std::size_t i = 0; i < targets.size(); ++i) {
    auto call = invoke(targets[i], values[i], payloads[i]);
    auto success = call.success;
    result.results.push_back(std::move(call));
    if (success) {
      continue;
    }

    result.success = false;
    result.failed_index = i;
    result.return_data = result.results.back().return_data;
    if (revert_) {
      for (auto j = i; j > 0; --j) {
        try {
          revert_(targets[j - 1], values[j - 1], payloads[j - 1]);
        } catch (const std::exception& ex) {
          spdlog::error("Revert of action {} on {} failed: {}", j - 1,
                        to_hex(targets[j - 1]), ex.what());
        }
      }
    }
    return result;
  }

  result.success = true;
  return result;
}

}  // namespace ballot::governance
