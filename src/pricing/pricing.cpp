#include "worthit/pricing.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

#include <spdlog/spdlog.h>

namespace worthit {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

struct FamilyRates {
    const char* key;
    ModelFamily family;
    PricingEntry rates;
};

// Ordered: the first key found in a model name wins.
const std::array<FamilyRates, 3>& pricing_table() {
    static const std::array<FamilyRates, 3> table = {{
        {"opus",   ModelFamily::Opus,   {0.000005, 0.000025, 0.00000625, 0.0000005}},
        {"sonnet", ModelFamily::Sonnet, {0.000003, 0.000015, 0.00000375, 0.0000003}},
        {"haiku",  ModelFamily::Haiku,  {0.000001, 0.000005, 0.00000125, 0.0000001}},
    }};
    return table;
}

constexpr double kSmallCostThreshold = 0.0001;

} // namespace

std::optional<ModelFamily> detect_model_family(const std::string& model) {
    std::string lower = to_lower(model);
    for (const auto& row : pricing_table()) {
        if (lower.find(row.key) != std::string::npos) {
            return row.family;
        }
    }
    return std::nullopt;
}

const PricingEntry& pricing_for(ModelFamily family) {
    for (const auto& row : pricing_table()) {
        if (row.family == family) {
            return row.rates;
        }
    }
    // Unreachable for a valid enum value
    return pricing_table()[1].rates;
}

const PricingEntry& get_pricing(const std::string& model) {
    auto family = detect_model_family(model);
    if (!family) {
        spdlog::debug("no pricing family matched model name, using sonnet rates");
        return pricing_for(ModelFamily::Sonnet);
    }
    return pricing_for(*family);
}

std::string model_display_name(const std::string& model) {
    if (model.empty()) {
        return "Mystery Model";
    }
    auto family = detect_model_family(model);
    if (!family) {
        return "Mystery Model";
    }
    switch (*family) {
        case ModelFamily::Opus: return "Opus 4.5";
        case ModelFamily::Sonnet: return "Sonnet 4.5";
        case ModelFamily::Haiku: return "Haiku 4.5";
    }
    return "Mystery Model";
}

double calculate_cost(const UsageTotals& totals, const PricingEntry& pricing) {
    return static_cast<double>(totals.input) * pricing.input +
           static_cast<double>(totals.output) * pricing.output +
           static_cast<double>(totals.cache_write) * pricing.cache_write +
           static_cast<double>(totals.cache_read) * pricing.cache_read;
}

std::string format_cost(double cost) {
    std::ostringstream ss;
    ss << '$' << std::fixed
       << std::setprecision(std::fabs(cost) < kSmallCostThreshold ? 6 : 4)
       << cost;
    return ss.str();
}

std::string format_token_count(std::uint64_t count) {
    std::string digits = std::to_string(count);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);
    size_t lead = digits.size() % 3;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i % 3) == lead) {
            out.push_back(',');
        }
        out.push_back(digits[i]);
    }
    return out;
}

} // namespace worthit
