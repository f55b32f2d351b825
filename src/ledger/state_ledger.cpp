#include <spdlog/spdlog.h>
#include <swapguard/common/critical.hpp>
#include <swapguard/ledger/state_ledger.hpp>
#include <swapguard/schema/key/engine_keys.hpp>

#include <iterator>
#include <limits>

using namespace swapguard::schema;

namespace swapguard::ledger {

namespace {

bool is_zero_party(const party_id_t& party) {
  return party == make_zero_hash();
}

bool would_overflow(const amount_t& balance, const amount_t& amount) {
  return balance > std::numeric_limits<amount_t>::max() - amount;
}

}  // namespace

state_ledger::state_ledger(
    encoding::encoder<encoding::scale_encoder_tag>& encoder,
    storage::storage<storage::rocksdb_storage_tag>& storage)
    : encoder_{encoder}, storage_{storage} {}

amount_t state_ledger::balance_of(const party_id_t& holder,
                                  const asset_id_t& asset) const {
  return read_amount(key::make_balance_key(encoder_, holder, asset));
}

amount_t state_ledger::allowance(const party_id_t& owner,
                                 const party_id_t& spender,
                                 const asset_id_t& asset) const {
  return read_amount(key::make_allowance_key(encoder_, owner, spender, asset));
}

ledger_status state_ledger::transfer(const party_id_t& from,
                                     const party_id_t& to,
                                     const asset_id_t& asset,
                                     const amount_t& amount) {
  return move_balance(from, to, asset, amount);
}

ledger_status state_ledger::transfer_from(const party_id_t& spender,
                                          const party_id_t& from,
                                          const party_id_t& to,
                                          const asset_id_t& asset,
                                          const amount_t& amount) {
  if (spender == from) {
    return move_balance(from, to, asset, amount);
  }
  if (is_zero_party(spender)) {
    return ledger_status::invalid_party;
  }

  auto allowance_key = key::make_allowance_key(encoder_, from, spender, asset);
  auto granted = read_amount(allowance_key);
  if (granted < amount) {
    spdlog::debug("transfer_from denied: allowance {} below {}",
                  swapguard::schema::to_string(granted),
                  swapguard::schema::to_string(amount));
    return ledger_status::not_authorized;
  }

  auto status = move_balance(from, to, asset, amount);
  if (status != ledger_status::ok) {
    return status;
  }
  // A maximal allowance is a standing grant and is never drawn down.
  if (granted != std::numeric_limits<amount_t>::max()) {
    write_amount(allowance_key, granted - amount);
  }
  return ledger_status::ok;
}

ledger_status state_ledger::authorize(const party_id_t& owner,
                                      const party_id_t& spender,
                                      const asset_id_t& asset,
                                      const amount_t& amount) {
  if (is_zero_party(owner) || is_zero_party(spender)) {
    return ledger_status::invalid_party;
  }
  write_amount(key::make_allowance_key(encoder_, owner, spender, asset),
               amount);
  spdlog::debug("authorize: spender {} may draw {} from owner {}",
                to_hex(spender), swapguard::schema::to_string(amount),
                to_hex(owner));
  return ledger_status::ok;
}

ledger_status state_ledger::raise_authorization(const party_id_t& owner,
                                                const party_id_t& spender,
                                                const asset_id_t& asset,
                                                const amount_t& minimum) {
  if (is_zero_party(owner) || is_zero_party(spender)) {
    return ledger_status::invalid_party;
  }
  auto allowance_key = key::make_allowance_key(encoder_, owner, spender, asset);
  auto granted = read_amount(allowance_key);
  if (granted >= minimum) {
    return ledger_status::ok;
  }
  write_amount(allowance_key, minimum);
  spdlog::debug("raise_authorization: spender {} raised from {} to {}",
                to_hex(spender), swapguard::schema::to_string(granted),
                swapguard::schema::to_string(minimum));
  return ledger_status::ok;
}

ledger_status state_ledger::credit(const party_id_t& holder,
                                   const asset_id_t& asset,
                                   const amount_t& amount) {
  if (is_zero_party(holder)) {
    return ledger_status::invalid_party;
  }
  auto balance_key = key::make_balance_key(encoder_, holder, asset);
  auto balance = read_amount(balance_key);
  if (would_overflow(balance, amount)) {
    return ledger_status::overflow;
  }
  write_amount(balance_key, balance + amount);
  return ledger_status::ok;
}

void state_ledger::begin() {
  if (transaction_open_) {
    swapguard::common::critical("ledger transaction already open");
  }
  transaction_open_ = true;
  staged_.clear();
}

void state_ledger::commit(
    const std::vector<storage::staged_write_t>& extra_writes) {
  if (!transaction_open_) {
    swapguard::common::critical("ledger commit without open transaction");
  }
  auto writes = std::vector<storage::staged_write_t>{};
  writes.reserve(staged_.size() + extra_writes.size());
  for (const auto& [staged_key, value] : staged_) {
    writes.emplace_back(staged_key, value);
  }
  writes.insert(std::end(writes), std::begin(extra_writes),
                std::end(extra_writes));
  storage_.write_batch(writes);
  spdlog::debug("ledger commit wrote {} key(s)", writes.size());
  staged_.clear();
  transaction_open_ = false;
}

void state_ledger::rollback() {
  if (!transaction_open_) {
    return;
  }
  spdlog::debug("ledger rollback discarded {} staged key(s)", staged_.size());
  staged_.clear();
  transaction_open_ = false;
}

bool state_ledger::in_transaction() const {
  return transaction_open_;
}

amount_t state_ledger::read_amount(const bytes_t& key) const {
  if (transaction_open_) {
    if (auto staged = staged_.find(key); staged != std::end(staged_)) {
      return decode_amount(encoder_.decode<amount_bytes_t>(
          bytes_view_t{staged->second.data(), staged->second.size()}));
    }
  }
  auto stored = storage_.get<amount_bytes_t>(
      encoder_, bytes_view_t{key.data(), key.size()});
  if (!stored) {
    return amount_t{0};
  }
  return decode_amount(*stored);
}

void state_ledger::write_amount(const bytes_t& key, const amount_t& amount) {
  auto encoded = encoder_.encode(encode_amount(amount));
  if (transaction_open_) {
    staged_[key] = std::move(encoded);
    return;
  }
  storage_.write_batch({storage::staged_write_t{key, std::move(encoded)}});
}

ledger_status state_ledger::move_balance(const party_id_t& from,
                                 const party_id_t& to,
                                 const asset_id_t& asset,
                                 const amount_t& amount) {
  if (is_zero_party(from) || is_zero_party(to)) {
    return ledger_status::invalid_party;
  }
  auto from_key = key::make_balance_key(encoder_, from, asset);
  auto from_balance = read_amount(from_key);
  if (from_balance < amount) {
    spdlog::debug("transfer denied: balance {} below {}",
                  swapguard::schema::to_string(from_balance),
                  swapguard::schema::to_string(amount));
    return ledger_status::insufficient_balance;
  }
  if (from == to) {
    return ledger_status::ok;
  }
  auto to_key = key::make_balance_key(encoder_, to, asset);
  auto to_balance = read_amount(to_key);
  if (would_overflow(to_balance, amount)) {
    return ledger_status::overflow;
  }
  write_amount(from_key, from_balance - amount);
  write_amount(to_key, to_balance + amount);
  return ledger_status::ok;
}

ledger_transaction::ledger_transaction(state_ledger& ledger) : ledger_{ledger} {
  ledger_.begin();
}

ledger_transaction::~ledger_transaction() {
  if (!resolved_) {
    ledger_.rollback();
  }
}

void ledger_transaction::commit(
    const std::vector<storage::staged_write_t>& extra_writes) {
  ledger_.commit(extra_writes);
  resolved_ = true;
}

void ledger_transaction::rollback() {
  ledger_.rollback();
  resolved_ = true;
}

}  // namespace swapguard::ledger
