#pragma once

#include "parcelcity/Building.hpp"

#include <optional>

namespace parcelcity {

// Placement price and demolition refund for one building type.
struct BuildQuote {
  int cost = 0;
  int refund = 0;
};

// Fixed placement schedule. A type with build cost <= 0 has no placement rule
// and cannot be built. Only roads and housing refund on demolition; the other
// types carry a build cost alone.
struct BuildCostSchedule {
  BuildQuote residential{500, 250};
  BuildQuote road{100, 50};
  int commercial = 0;
  int industrial = 0;
  int park = 0;
};

// Returns the schedule entry for a buildable type, std::nullopt otherwise.
std::optional<BuildQuote> QuoteBuilding(const BuildCostSchedule& schedule, BuildingType type);

// The city's spendable balance.
class Treasury {
public:
  explicit Treasury(int balance = 0) : m_balance(balance) {}

  int balance() const { return m_balance; }

  // Deducts amount iff the balance covers it. No side effect on failure.
  bool tryDebit(int amount);

  // Adds a positive amount, saturating at INT_MAX.
  void credit(int amount);

  // Direct override for scenario tooling; the simulation itself never calls it.
  void setBalance(int balance) { m_balance = balance; }

private:
  int m_balance = 0;
};

} // namespace parcelcity
