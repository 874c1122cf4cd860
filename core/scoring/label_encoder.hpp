#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gamcoach {

// ─── Label Encoder ────────────────────────────────────────────
// Bidirectional label <-> level-code mapping for categorical features.

class LabelEncoder {
public:
    LabelEncoder() = default;

    void add(const std::string& feature, const std::string& label, int code);

    std::optional<int> encode(const std::string& feature, const std::string& label) const;
    std::optional<std::string> decode(const std::string& feature, int code) const;

    /// Labels known for a feature, in ascending code order.
    std::vector<std::string> labels(const std::string& feature) const;

    bool hasFeature(const std::string& feature) const {
        return encoder_.count(feature) > 0;
    }

private:
    std::unordered_map<std::string, std::unordered_map<std::string, int>> encoder_;
    std::unordered_map<std::string, std::unordered_map<int, std::string>> decoder_;
};

} // namespace gamcoach
