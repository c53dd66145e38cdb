#pragma once
#include <obligation/schema/linear_id.hpp>
#include <obligation/schema/party.hpp>
#include <obligation/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace obligation::schema {

template <uint16_t Version>
struct obligation_state;

/// An amount owed by `borrower` to `lender`, of which `paid` has been
/// settled. Records are immutable snapshots: a change is a new record with
/// the same `linear_id` that consumes the previous one.
template <>
struct obligation_state<1> final {
  uint16_t version{1};
  amount_t amount{};
  party_t lender;
  party_t borrower;
  amount_t paid{};
  linear_id_t linear_id;
};

using obligation_state_t = obligation_state<1>;

/// Freshly issued record with nothing paid.
obligation_state_t make_obligation_state(amount_t amount,
                                         party_t lender,
                                         party_t borrower,
                                         linear_id_t linear_id);

/// Lender then borrower.
std::vector<party_t> participants(const obligation_state_t& state);

/// Owning keys of the participants, duplicates collapsed.
signer_set_t participant_keys(const obligation_state_t& state);

obligation_state_t with_new_lender(const obligation_state_t& state,
                                   party_t new_lender);

/// Adds `amount` to `paid`. Empty when the sum does not fit in `amount_t`.
std::optional<obligation_state_t> try_pay(const obligation_state_t& state,
                                          amount_t amount);

/// As `try_pay`, but an overflowing payment is fatal.
obligation_state_t pay(const obligation_state_t& state, amount_t amount);

/// `amount - paid`, empty when the difference does not fit in `amount_t`.
std::optional<amount_t> try_outstanding(const obligation_state_t& state);

amount_t outstanding(const obligation_state_t& state);

bool is_fully_paid(const obligation_state_t& state);

}  // namespace obligation::schema
