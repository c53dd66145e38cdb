#include <obligation/common/critical.hpp>
#include <obligation/schema/obligation_state.hpp>
#include <limits>
#include <utility>

namespace obligation::schema {

obligation_state_t make_obligation_state(amount_t amount,
                                         party_t lender,
                                         party_t borrower,
                                         linear_id_t linear_id) {
  return obligation_state_t{.version = 1,
                            .amount = amount,
                            .lender = std::move(lender),
                            .borrower = std::move(borrower),
                            .paid = 0,
                            .linear_id = std::move(linear_id)};
}

std::vector<party_t> participants(const obligation_state_t& state) {
  return {state.lender, state.borrower};
}

signer_set_t participant_keys(const obligation_state_t& state) {
  auto keys = signer_set_t{};
  for (const auto& party : participants(state)) {
    keys.insert(party.owning_key);
  }
  return keys;
}

obligation_state_t with_new_lender(const obligation_state_t& state,
                                   party_t new_lender) {
  auto next = state;
  next.lender = std::move(new_lender);
  return next;
}

namespace {

constexpr auto kAmountMax = std::numeric_limits<amount_t>::max();
constexpr auto kAmountMin = std::numeric_limits<amount_t>::min();

std::optional<amount_t> checked_add(const amount_t lhs, const amount_t rhs) {
  if ((rhs > 0 && lhs > kAmountMax - rhs) ||
      (rhs < 0 && lhs < kAmountMin - rhs)) {
    return std::nullopt;
  }
  return lhs + rhs;
}

std::optional<amount_t> checked_subtract(const amount_t lhs,
                                         const amount_t rhs) {
  if ((rhs < 0 && lhs > kAmountMax + rhs) ||
      (rhs > 0 && lhs < kAmountMin + rhs)) {
    return std::nullopt;
  }
  return lhs - rhs;
}

}  // namespace

std::optional<obligation_state_t> try_pay(const obligation_state_t& state,
                                          const amount_t amount) {
  auto paid = checked_add(state.paid, amount);
  if (!paid) {
    return std::nullopt;
  }
  auto next = state;
  next.paid = *paid;
  return next;
}

obligation_state_t pay(const obligation_state_t& state, const amount_t amount) {
  auto next = try_pay(state, amount);
  if (!next) {
    obligation::common::critical("paying {} on top of {} overflows", amount,
                                 state.paid);
  }
  return *next;
}

std::optional<amount_t> try_outstanding(const obligation_state_t& state) {
  return checked_subtract(state.amount, state.paid);
}

amount_t outstanding(const obligation_state_t& state) {
  auto remaining = try_outstanding(state);
  if (!remaining) {
    obligation::common::critical("outstanding of {} less {} overflows",
                                 state.amount, state.paid);
  }
  return *remaining;
}

bool is_fully_paid(const obligation_state_t& state) {
  return state.paid >= state.amount;
}

}  // namespace obligation::schema
