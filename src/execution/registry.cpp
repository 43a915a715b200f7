#include <spdlog/spdlog.h>
#include <dynart/execution/registry.hpp>
#include <dynart/schema/encoding/scale/encoder.hpp>
#include <iterator>
#include <limits>
#include <mutex>
#include <tuple>

using namespace dynart::schema;

namespace {

using encoder_t =
    dynart::schema::encoding::encoder<dynart::schema::encoding::scale_encoder_tag>;

constexpr uint16_t kSnapshotVersion = 1;

using snapshot_asset_t = std::tuple<token_id_t, identity_t, identity_t>;
using snapshot_operator_t = std::tuple<identity_t, identity_t>;
using snapshot_t = std::tuple<uint16_t,
                              token_id_t,
                              std::vector<snapshot_asset_t>,
                              std::vector<snapshot_operator_t>>;

std::string format_identity(const identity_t& identity) {
  return "0x" + to_hex(identity);
}

transaction_result_t make_failure(const registry_error_code code,
                                  std::string log,
                                  std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = to_code(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{dynart::execution::kRegistryCodespace};
  return result;
}

template <typename T>
query_result<T> make_query_failure(const registry_error_code code,
                                   std::string log) {
  auto result = query_result<T>{};
  result.code = to_code(code);
  result.log = std::move(log);
  result.codespace = std::string{dynart::execution::kRegistryCodespace};
  return result;
}

template <typename T>
query_result<T> make_query_value(T value) {
  auto result = query_result<T>{};
  result.value = std::move(value);
  return result;
}

transaction_event_t make_transfer_event(const identity_t& from,
                                        const identity_t& to,
                                        const token_id_t token_id) {
  return transaction_event_t{
      .type = std::string{kTransferEvent},
      .attributes = {{.key = "from", .value = format_identity(from), .index = true},
                     {.key = "to", .value = format_identity(to), .index = true},
                     {.key = "token_id",
                      .value = std::to_string(token_id),
                      .index = true}}};
}

transaction_event_t make_approval_event(const identity_t& owner,
                                        const identity_t& approved,
                                        const token_id_t token_id) {
  return transaction_event_t{
      .type = std::string{kApprovalEvent},
      .attributes = {{.key = "owner", .value = format_identity(owner), .index = true},
                     {.key = "approved",
                      .value = format_identity(approved),
                      .index = true},
                     {.key = "token_id",
                      .value = std::to_string(token_id),
                      .index = true}}};
}

transaction_event_t make_approval_for_all_event(const identity_t& owner,
                                                const identity_t& operator_id,
                                                const bool approved) {
  return transaction_event_t{
      .type = std::string{kApprovalForAllEvent},
      .attributes = {{.key = "owner", .value = format_identity(owner), .index = true},
                     {.key = "operator",
                      .value = format_identity(operator_id),
                      .index = true},
                     {.key = "approved",
                      .value = approved ? "true" : "false",
                      .index = false}}};
}

}  // namespace

namespace dynart::execution {

registry::registry(registry_options options) : options_{std::move(options)} {
  spdlog::debug("Initializing registry '{}' ({})", options_.name,
                options_.symbol);
}

transaction_result_t registry::allocate_and_assign(const identity_t& caller) {
  auto lock = std::scoped_lock{mutex_};
  if (is_null(caller)) {
    spdlog::debug("Rejecting allocation to the null identity");
    return make_failure(registry_error_code::invalid_recipient,
                        "invalid recipient", "caller is the null identity");
  }

  auto token_id = next_token_id_;
  if (token_id == std::numeric_limits<token_id_t>::max()) {
    spdlog::warn("Identifier space exhausted at {}", token_id);
    return make_failure(registry_error_code::already_exists,
                        "identifier space exhausted",
                        "token " + std::to_string(token_id));
  }
  if (assets_.contains(token_id)) {
    spdlog::warn("Identifier {} already allocated", token_id);
    return make_failure(registry_error_code::already_exists,
                        "identifier already exists",
                        "token " + std::to_string(token_id));
  }

  ++next_token_id_;
  assets_.emplace(token_id, asset_state_t{.token_id = token_id,
                                          .owner = caller,
                                          .approved = make_null_identity()});
  ++balances_[caller];

  auto result = transaction_result_t{};
  result.token_id = token_id;
  result.info = "allocate_and_assign accepted";
  emit(result, make_transfer_event(make_null_identity(), caller, token_id));
  spdlog::info("Minted token {} to {}", token_id, format_identity(caller));
  return result;
}

query_result<identity_t> registry::owner_of(const token_id_t token_id) const {
  auto lock = std::shared_lock{mutex_};
  auto it = assets_.find(token_id);
  if (it == std::end(assets_)) {
    return make_query_failure<identity_t>(
        registry_error_code::not_found,
        "token " + std::to_string(token_id) + " does not exist");
  }
  return make_query_value(it->second.owner);
}

query_result<uint64_t> registry::balance_of(const identity_t& owner) const {
  if (is_null(owner)) {
    return make_query_failure<uint64_t>(registry_error_code::invalid_owner,
                                        "null identity has no balance");
  }
  auto lock = std::shared_lock{mutex_};
  auto it = balances_.find(owner);
  return make_query_value(it == std::end(balances_) ? uint64_t{0} : it->second);
}

transaction_result_t registry::approve(const identity_t& caller,
                                       const token_id_t token_id,
                                       const identity_t& spender) {
  auto lock = std::scoped_lock{mutex_};
  auto it = assets_.find(token_id);
  if (it == std::end(assets_)) {
    return make_failure(registry_error_code::not_found, "token does not exist",
                        "token " + std::to_string(token_id));
  }
  const auto owner = it->second.owner;
  if (caller != owner && !is_operator(owner, caller)) {
    spdlog::debug("Rejecting approval on token {} by {}", token_id,
                  format_identity(caller));
    return make_failure(registry_error_code::unauthorized,
                        "caller is neither owner nor operator");
  }

  it->second.approved = spender;
  auto result = transaction_result_t{};
  result.token_id = token_id;
  result.info = "approve accepted";
  emit(result, make_approval_event(owner, spender, token_id));
  return result;
}

query_result<identity_t> registry::get_approved(
    const token_id_t token_id) const {
  auto lock = std::shared_lock{mutex_};
  auto it = assets_.find(token_id);
  if (it == std::end(assets_)) {
    return make_query_failure<identity_t>(
        registry_error_code::not_found,
        "token " + std::to_string(token_id) + " does not exist");
  }
  return make_query_value(it->second.approved);
}

transaction_result_t registry::set_approval_for_all(
    const identity_t& caller,
    const identity_t& operator_id,
    const bool approved) {
  auto lock = std::scoped_lock{mutex_};
  if (approved) {
    operators_.emplace(caller, operator_id);
  } else {
    operators_.erase(std::pair{caller, operator_id});
  }

  auto result = transaction_result_t{};
  result.info = "set_approval_for_all accepted";
  emit(result, make_approval_for_all_event(caller, operator_id, approved));
  return result;
}

bool registry::is_approved_for_all(const identity_t& owner,
                                   const identity_t& operator_id) const {
  auto lock = std::shared_lock{mutex_};
  return is_operator(owner, operator_id);
}

transaction_result_t registry::transfer(const identity_t& caller,
                                        const identity_t& from,
                                        const identity_t& to,
                                        const token_id_t token_id) {
  auto lock = std::scoped_lock{mutex_};
  if (auto failure = validate_transfer(caller, from, to, token_id)) {
    return *failure;
  }
  return apply_transfer(from, to, token_id);
}

transaction_result_t registry::safe_transfer(
    const identity_t& caller,
    const identity_t& from,
    const identity_t& to,
    const token_id_t token_id,
    const std::optional<bytes_t>& extra_data) {
  auto lock = std::scoped_lock{mutex_};
  if (auto failure = validate_transfer(caller, from, to, token_id)) {
    return *failure;
  }

  if (recipient_check_) {
    auto data = extra_data.has_value()
                    ? bytes_view_t{extra_data->data(), extra_data->size()}
                    : bytes_view_t{};
    if (!recipient_check_(caller, from, to, token_id, data)) {
      spdlog::debug("Recipient {} rejected token {}", format_identity(to),
                    token_id);
      return make_failure(registry_error_code::unsafe_recipient,
                          "recipient rejected the transfer",
                          format_identity(to));
    }
  }

  auto result = apply_transfer(from, to, token_id);
  result.info = "safe_transfer accepted";
  return result;
}

bool registry::exists(const token_id_t token_id) const {
  auto lock = std::shared_lock{mutex_};
  return assets_.contains(token_id);
}

uint64_t registry::total_supply() const {
  auto lock = std::shared_lock{mutex_};
  return assets_.size();
}

const std::string& registry::name() const {
  return options_.name;
}

const std::string& registry::symbol() const {
  return options_.symbol;
}

std::vector<transaction_event_t> registry::history() const {
  auto lock = std::shared_lock{mutex_};
  return std::vector<transaction_event_t>{std::begin(history_),
                                          std::end(history_)};
}

std::vector<transaction_event_t> registry::drain_history() {
  auto lock = std::scoped_lock{mutex_};
  auto drained = std::vector<transaction_event_t>{
      std::make_move_iterator(std::begin(history_)),
      std::make_move_iterator(std::end(history_))};
  history_.clear();
  return drained;
}

bytes_t registry::export_snapshot() const {
  auto lock = std::shared_lock{mutex_};
  auto assets = std::vector<snapshot_asset_t>{};
  assets.reserve(assets_.size());
  for (const auto& [token_id, asset] : assets_) {
    assets.emplace_back(token_id, asset.owner, asset.approved);
  }
  auto operators = std::vector<snapshot_operator_t>{};
  operators.reserve(operators_.size());
  for (const auto& [owner, operator_id] : operators_) {
    operators.emplace_back(owner, operator_id);
  }

  auto encoder = encoder_t{};
  return encoder.encode(snapshot_t{kSnapshotVersion, next_token_id_,
                                   std::move(assets), std::move(operators)});
}

transaction_result_t registry::load_snapshot(const bytes_view_t& snapshot) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<snapshot_t>(snapshot);
  if (!decoded.has_value()) {
    return make_failure(registry_error_code::invalid_snapshot,
                        "failed to decode snapshot");
  }

  const auto& [version, next_token_id, assets, operators] = decoded.value();
  if (version != kSnapshotVersion) {
    return make_failure(registry_error_code::invalid_snapshot,
                        "unsupported snapshot version",
                        "version " + std::to_string(version));
  }
  if (next_token_id == 0) {
    return make_failure(registry_error_code::invalid_snapshot,
                        "next identifier must be positive");
  }

  auto loaded_assets = std::map<token_id_t, asset_state_t>{};
  auto loaded_balances = std::map<identity_t, uint64_t>{};
  for (const auto& [token_id, owner, approved] : assets) {
    if (token_id == 0 || token_id >= next_token_id) {
      return make_failure(registry_error_code::invalid_snapshot,
                          "identifier outside allocated range",
                          "token " + std::to_string(token_id));
    }
    if (is_null(owner)) {
      return make_failure(registry_error_code::invalid_snapshot,
                          "asset without owner",
                          "token " + std::to_string(token_id));
    }
    auto inserted = loaded_assets.emplace(
        token_id, asset_state_t{
                      .token_id = token_id, .owner = owner, .approved = approved});
    if (!inserted.second) {
      return make_failure(registry_error_code::invalid_snapshot,
                          "duplicate identifier",
                          "token " + std::to_string(token_id));
    }
    ++loaded_balances[owner];
  }

  auto loaded_operators = std::set<std::pair<identity_t, identity_t>>{};
  for (const auto& [owner, operator_id] : operators) {
    loaded_operators.emplace(owner, operator_id);
  }

  auto lock = std::scoped_lock{mutex_};
  next_token_id_ = next_token_id;
  assets_ = std::move(loaded_assets);
  balances_ = std::move(loaded_balances);
  operators_ = std::move(loaded_operators);
  history_.clear();
  spdlog::info("Loaded snapshot with {} asset(s), next identifier {}",
               assets_.size(), next_token_id_);

  auto result = transaction_result_t{};
  result.info = "load_snapshot accepted";
  return result;
}

void registry::set_recipient_check(recipient_check_t check) {
  auto lock = std::scoped_lock{mutex_};
  recipient_check_ = std::move(check);
}

std::optional<transaction_result_t> registry::validate_transfer(
    const identity_t& caller,
    const identity_t& from,
    const identity_t& to,
    const token_id_t token_id) const {
  auto it = assets_.find(token_id);
  if (it == std::end(assets_)) {
    return make_failure(registry_error_code::not_found, "token does not exist",
                        "token " + std::to_string(token_id));
  }

  const auto& asset = it->second;
  const auto is_approved = !is_null(asset.approved) && caller == asset.approved;
  if (caller != asset.owner && !is_approved &&
      !is_operator(asset.owner, caller)) {
    spdlog::debug("Rejecting transfer of token {} by {}", token_id,
                  format_identity(caller));
    return make_failure(registry_error_code::unauthorized,
                        "caller is not owner, approved or operator");
  }
  if (from != asset.owner) {
    return make_failure(registry_error_code::invalid_owner,
                        "source is not the current owner",
                        format_identity(from));
  }
  if (is_null(to)) {
    return make_failure(registry_error_code::invalid_recipient,
                        "invalid recipient", "destination is the null identity");
  }
  return std::nullopt;
}

transaction_result_t registry::apply_transfer(const identity_t& from,
                                              const identity_t& to,
                                              const token_id_t token_id) {
  auto& asset = assets_.at(token_id);
  asset.approved = make_null_identity();

  auto from_balance = balances_.find(from);
  if (--from_balance->second == 0) {
    balances_.erase(from_balance);
  }
  ++balances_[to];
  asset.owner = to;

  auto result = transaction_result_t{};
  result.token_id = token_id;
  result.info = "transfer accepted";
  emit(result, make_transfer_event(from, to, token_id));
  return result;
}

bool registry::is_operator(const identity_t& owner,
                           const identity_t& operator_id) const {
  return operators_.contains(std::pair{owner, operator_id});
}

void registry::emit(transaction_result_t& result, transaction_event_t event) {
  if (options_.history_limit > 0) {
    if (history_.size() == options_.history_limit) {
      history_.pop_front();
    }
    history_.push_back(event);
  }
  result.events.push_back(std::move(event));
}

}  // namespace dynart::execution
