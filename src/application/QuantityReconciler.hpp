/**
 * @file QuantityReconciler.hpp
 * @brief Validates per-chunk quantity answers and merges them into one verdict.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "domain/Quantity.hpp"

namespace editalflow::application {

class QuantityReconciler {
public:
    /**
     * @struct ParsedEstimate
     * @brief A validated estimate, or the reason the model answer was rejected.
     */
    struct ParsedEstimate {
        std::optional<domain::QuantityEstimate> estimate;
        std::string anomaly;
    };

    /**
     * @brief Validates one model answer.
     *
     * Requires an object with a non-negative integer "total_quantity" (integral floats and
     * numeric strings accepted), a non-empty string "unit" and a string "explanation".
     */
    static ParsedEstimate ParseEstimate(const std::string& rawResponse);

    /**
     * @brief Takes the largest valid estimate and decides the threshold status.
     *
     * Rules, in order: threshold 0 is "true"; an unmatched target is "false"; a zero
     * quantity is "inconclusive"; otherwise quantity >= threshold. Estimates with a
     * negative quantity or an empty unit are counted as anomalies and ignored.
     */
    static domain::ReconciledQuantity Reconcile(const std::vector<domain::QuantityEstimate>& estimates,
                                                int threshold, bool targetMatched = true);

    /** @brief ParseEstimate on every answer, then Reconcile on the valid ones. */
    static domain::ReconciledQuantity ReconcileResponses(const std::vector<std::string>& responses,
                                                         int threshold, bool targetMatched = true);
};

} // namespace editalflow::application
