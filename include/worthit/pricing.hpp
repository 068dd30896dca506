#pragma once

#include "worthit/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace worthit {

// ============================================================================
// Pricing Table
// ============================================================================

// Detect the model family by case-insensitive substring match.
// Family keys are checked in the fixed order opus, sonnet, haiku and the
// first hit wins. Returns nullopt when no key matches.
std::optional<ModelFamily> detect_model_family(const std::string& model);

// Rates for a known family.
const PricingEntry& pricing_for(ModelFamily family);

// Rates for an arbitrary model name. Never fails: names that match no family
// (including the empty string) get the sonnet rates.
const PricingEntry& get_pricing(const std::string& model);

// Human-readable model name ("Opus 4.5", ..., "Mystery Model").
std::string model_display_name(const std::string& model);

// ============================================================================
// Cost
// ============================================================================

// Sum of count * rate over the four token categories. Unrounded.
double calculate_cost(const UsageTotals& totals, const PricingEntry& pricing);

// "$" followed by 6 decimals below 0.0001 in magnitude, otherwise 4.
// Display only.
std::string format_cost(double cost);

// Integer with comma thousands separators, e.g. 1234567 -> "1,234,567".
std::string format_token_count(std::uint64_t count);

} // namespace worthit
