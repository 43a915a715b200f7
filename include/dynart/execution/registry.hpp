#pragma once

#include <dynart/execution/recipient_check.hpp>
#include <dynart/schema/asset_state.hpp>
#include <dynart/schema/primitives.hpp>
#include <dynart/schema/query_result.hpp>
#include <dynart/schema/registry_error_code.hpp>
#include <dynart/schema/transaction_event.hpp>
#include <dynart/schema/transaction_result.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dynart::execution {

inline constexpr auto kRegistryCodespace = std::string_view{"dynart.registry"};

struct registry_options final {
  std::string name{"AI Dynamic"};
  std::string symbol{"AIDYN"};
  // Oldest notifications are dropped once the log holds this many.
  std::size_t history_limit{4096};
};

/// Single-writer asset registry.
///
/// Owns asset existence, ownership, balances and approvals. Mutations take
/// the write lock and check every precondition before touching state, so a
/// failed call leaves nothing behind. Reads take a shared lock and may run
/// concurrently.
class registry final {
 public:
  explicit registry(registry_options options = {});

  registry(const registry&) = delete;
  registry& operator=(const registry&) = delete;

  /// Allocate the next identifier (1, 2, 3, ...) and assign it to `caller`.
  ///
  /// On success `token_id` holds the new identifier and `events` a Transfer
  /// from the null identity.
  dynart::schema::transaction_result_t allocate_and_assign(
      const dynart::schema::identity_t& caller);

  dynart::schema::query_result<dynart::schema::identity_t> owner_of(
      dynart::schema::token_id_t token_id) const;

  dynart::schema::query_result<uint64_t> balance_of(
      const dynart::schema::identity_t& owner) const;

  /// Set the single approved spender. Caller must own the asset or be an
  /// operator for its owner. A null spender clears the approval.
  dynart::schema::transaction_result_t approve(
      const dynart::schema::identity_t& caller,
      dynart::schema::token_id_t token_id,
      const dynart::schema::identity_t& spender);

  dynart::schema::query_result<dynart::schema::identity_t> get_approved(
      dynart::schema::token_id_t token_id) const;

  dynart::schema::transaction_result_t set_approval_for_all(
      const dynart::schema::identity_t& caller,
      const dynart::schema::identity_t& operator_id,
      bool approved);

  bool is_approved_for_all(const dynart::schema::identity_t& owner,
                           const dynart::schema::identity_t& operator_id) const;

  dynart::schema::transaction_result_t transfer(
      const dynart::schema::identity_t& caller,
      const dynart::schema::identity_t& from,
      const dynart::schema::identity_t& to,
      dynart::schema::token_id_t token_id);

  /// transfer() followed by the recipient-acceptance check. A rejection
  /// fails with unsafe_recipient and applies nothing.
  dynart::schema::transaction_result_t safe_transfer(
      const dynart::schema::identity_t& caller,
      const dynart::schema::identity_t& from,
      const dynart::schema::identity_t& to,
      dynart::schema::token_id_t token_id,
      const std::optional<dynart::schema::bytes_t>& extra_data = std::nullopt);

  bool exists(dynart::schema::token_id_t token_id) const;
  uint64_t total_supply() const;
  const std::string& name() const;
  const std::string& symbol() const;

  /// Retained notifications, oldest first, since construction, the last
  /// drain or the last snapshot load. At most `history_limit` are kept.
  std::vector<dynart::schema::transaction_event_t> history() const;

  /// Return the retained notifications and empty the log.
  std::vector<dynart::schema::transaction_event_t> drain_history();

  /// SCALE-encoded copy of the full registry state.
  dynart::schema::bytes_t export_snapshot() const;

  /// Validate and install a snapshot produced by export_snapshot().
  ///
  /// Balances are recomputed from the asset list. On failure the current
  /// state is kept and the result carries invalid_snapshot.
  dynart::schema::transaction_result_t load_snapshot(
      const dynart::schema::bytes_view_t& snapshot);

  /// Install the recipient-acceptance capability. Without one, every
  /// recipient is accepted.
  void set_recipient_check(recipient_check_t check);

 private:
  /// Precondition checks shared by transfer and safe_transfer. Returns a
  /// failure result, or std::nullopt when the transfer may proceed.
  std::optional<dynart::schema::transaction_result_t> validate_transfer(
      const dynart::schema::identity_t& caller,
      const dynart::schema::identity_t& from,
      const dynart::schema::identity_t& to,
      dynart::schema::token_id_t token_id) const;

  /// Apply a validated transfer and record its notification.
  dynart::schema::transaction_result_t apply_transfer(
      const dynart::schema::identity_t& from,
      const dynart::schema::identity_t& to,
      dynart::schema::token_id_t token_id);

  bool is_operator(const dynart::schema::identity_t& owner,
                   const dynart::schema::identity_t& operator_id) const;

  void emit(dynart::schema::transaction_result_t& result,
            dynart::schema::transaction_event_t event);

  mutable std::shared_mutex mutex_;
  registry_options options_;
  dynart::schema::token_id_t next_token_id_{1};
  std::map<dynart::schema::token_id_t, dynart::schema::asset_state_t> assets_;
  std::map<dynart::schema::identity_t, uint64_t> balances_;
  std::set<std::pair<dynart::schema::identity_t, dynart::schema::identity_t>>
      operators_;
  std::deque<dynart::schema::transaction_event_t> history_;
  recipient_check_t recipient_check_;
};

}  // namespace dynart::execution
