#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <variant>
#include <vector>

namespace gamcoach {

// ─── Feature Value ────────────────────────────────────────────
// Continuous features carry a number, categorical features carry
// the level label as it appears in the label encoder.

using FeatureValue = std::variant<double, std::string>;

/// One sample. Length and order follow ModelDescription::feature_names.
using Sample = std::vector<FeatureValue>;

inline bool isNumeric(const FeatureValue& v) {
    return std::holds_alternative<double>(v);
}

/// Numeric payload of a continuous value. Throws std::invalid_argument
/// when the value is a label.
double asNumber(const FeatureValue& v);

/// Label payload of a categorical value. Numbers are formatted so that
/// integral codes read as "3" rather than "3.000000".
std::string asLabel(const FeatureValue& v);

std::string toString(const FeatureValue& v);

nlohmann::json valueToJson(const FeatureValue& v);
FeatureValue valueFromJson(const nlohmann::json& j);

nlohmann::json sampleToJson(const Sample& sample);
Sample sampleFromJson(const nlohmann::json& j);

} // namespace gamcoach
