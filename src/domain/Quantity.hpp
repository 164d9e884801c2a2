/**
 * @file Quantity.hpp
 * @brief Quantity estimates reported per chunk and their reconciled total.
 */

#pragma once
#include <string>

namespace editalflow::domain {

/**
 * @enum ThresholdStatus
 * @brief Outcome of the quantity check.
 */
enum class ThresholdStatus {
    True,
    False,
    Inconclusive
};

/**
 * @brief Wire/display form: "true", "false" or "inconclusive".
 */
inline std::string ThresholdStatusToString(ThresholdStatus status) {
    switch (status) {
        case ThresholdStatus::True: return "true";
        case ThresholdStatus::False: return "false";
        case ThresholdStatus::Inconclusive: return "inconclusive";
    }
    return "inconclusive";
}

/**
 * @struct QuantityEstimate
 * @brief What one chunk says about the quantity of the target item.
 */
struct QuantityEstimate {
    long long totalQuantity = 0;
    std::string unit;
    std::string explanation;
};

/**
 * @struct ReconciledQuantity
 * @brief Maximum over the valid chunk estimates, with the threshold verdict.
 */
struct ReconciledQuantity {
    long long totalQuantity = 0;
    std::string unit;
    std::string explanation;
    ThresholdStatus thresholdStatus = ThresholdStatus::Inconclusive;
    int anomalies = 0; ///< Estimates excluded as malformed.
};

} // namespace editalflow::domain
