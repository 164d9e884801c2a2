/**
 * @file QuantityReconciler.cpp
 * @brief Implementation of QuantityReconciler.
 */

#include "application/QuantityReconciler.hpp"
#include <cctype>
#include <cmath>
#include <iostream>
#include <nlohmann/json.hpp>

namespace editalflow::application {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Accepts integers, integral floats and digit-only strings. Negative values are returned
// as such so the caller can report them.
std::optional<long long> ReadQuantity(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        if (!std::isfinite(d) || std::floor(d) != d || std::fabs(d) > 9.0e15) return std::nullopt;
        return static_cast<long long>(d);
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (text.empty() || text.size() > 15) return std::nullopt;
        long long parsed = 0;
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
            parsed = parsed * 10 + (c - '0');
        }
        return parsed;
    }
    return std::nullopt;
}

} // namespace

QuantityReconciler::ParsedEstimate QuantityReconciler::ParseEstimate(const std::string& rawResponse) {
    ParsedEstimate parsed;

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(rawResponse);
    } catch (const nlohmann::json::parse_error& e) {
        parsed.anomaly = std::string("JSON inválido: ") + e.what();
        return parsed;
    }
    if (!data.is_object()) {
        parsed.anomaly = "resposta não é um objeto JSON";
        return parsed;
    }

    if (!data.contains("total_quantity")) {
        parsed.anomaly = "total_quantity ausente";
        return parsed;
    }
    auto quantity = ReadQuantity(data["total_quantity"]);
    if (!quantity) {
        parsed.anomaly = "total_quantity não é um inteiro";
        return parsed;
    }
    if (*quantity < 0) {
        parsed.anomaly = "total_quantity negativo";
        return parsed;
    }

    if (!data.contains("unit") || !data["unit"].is_string() || IsBlank(data["unit"].get<std::string>())) {
        parsed.anomaly = "unit ausente ou inválido";
        return parsed;
    }
    if (!data.contains("explanation") || !data["explanation"].is_string()) {
        parsed.anomaly = "explanation ausente ou inválido";
        return parsed;
    }

    domain::QuantityEstimate estimate;
    estimate.totalQuantity = *quantity;
    estimate.unit = data["unit"].get<std::string>();
    estimate.explanation = data["explanation"].get<std::string>();
    parsed.estimate = estimate;
    return parsed;
}

domain::ReconciledQuantity QuantityReconciler::Reconcile(const std::vector<domain::QuantityEstimate>& estimates,
                                                         int threshold, bool targetMatched) {
    domain::ReconciledQuantity reconciled;

    bool haveBest = false;
    for (const auto& estimate : estimates) {
        if (estimate.totalQuantity < 0 || IsBlank(estimate.unit)) {
            std::cerr << "[QuantityReconciler] Estimativa ignorada (quantidade " << estimate.totalQuantity
                      << ", unidade '" << estimate.unit << "')" << std::endl;
            ++reconciled.anomalies;
            continue;
        }
        if (!haveBest || estimate.totalQuantity > reconciled.totalQuantity) {
            reconciled.totalQuantity = estimate.totalQuantity;
            reconciled.unit = estimate.unit;
            reconciled.explanation = estimate.explanation;
            haveBest = true;
        }
    }

    if (threshold <= 0) {
        reconciled.thresholdStatus = domain::ThresholdStatus::True;
    } else if (!targetMatched) {
        reconciled.thresholdStatus = domain::ThresholdStatus::False;
    } else if (reconciled.totalQuantity == 0) {
        reconciled.thresholdStatus = domain::ThresholdStatus::Inconclusive;
    } else if (reconciled.totalQuantity >= threshold) {
        reconciled.thresholdStatus = domain::ThresholdStatus::True;
    } else {
        reconciled.thresholdStatus = domain::ThresholdStatus::False;
    }
    return reconciled;
}

domain::ReconciledQuantity QuantityReconciler::ReconcileResponses(const std::vector<std::string>& responses,
                                                                  int threshold, bool targetMatched) {
    std::vector<domain::QuantityEstimate> estimates;
    int anomalies = 0;
    for (std::size_t i = 0; i < responses.size(); ++i) {
        auto parsed = ParseEstimate(responses[i]);
        if (!parsed.estimate) {
            std::cerr << "[QuantityReconciler] Resposta do trecho " << (i + 1) << " descartada: "
                      << parsed.anomaly << std::endl;
            ++anomalies;
            continue;
        }
        estimates.push_back(*parsed.estimate);
    }

    auto reconciled = Reconcile(estimates, threshold, targetMatched);
    reconciled.anomalies += anomalies;
    return reconciled;
}

} // namespace editalflow::application
