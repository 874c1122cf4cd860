#pragma once

#include "model/feature_value.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace gamcoach {

enum class OptionKind {
    Continuous,
    Categorical,
    Interaction
};

// ─── Option Identifier ────────────────────────────────────────
// Typed key of one decision variable. Main-effect options are keyed by
// (feature, bin); interaction options by the two parent (feature, bin)
// pairs, with feature < feature2.

struct OptionId {
    OptionKind kind = OptionKind::Continuous;
    std::size_t feature = 0;
    std::size_t bin = 0;
    std::size_t feature2 = 0;
    std::size_t bin2 = 0;

    static OptionId mainEffect(OptionKind kind, std::size_t feature, std::size_t bin) {
        return OptionId{kind, feature, bin, 0, 0};
    }

    static OptionId interaction(std::size_t feature1, std::size_t bin1,
                                std::size_t feature2, std::size_t bin2) {
        if (feature2 < feature1) {
            return OptionId{OptionKind::Interaction, feature2, bin2, feature1, bin1};
        }
        return OptionId{OptionKind::Interaction, feature1, bin1, feature2, bin2};
    }

    bool isInteraction() const { return kind == OptionKind::Interaction; }

    /// Compact form for logs, e.g. "2:3" or "0:1 x 2:3".
    std::string toString() const {
        std::string out = std::to_string(feature) + ":" + std::to_string(bin);
        if (isInteraction()) {
            out += " x " + std::to_string(feature2) + ":" + std::to_string(bin2);
        }
        return out;
    }

    bool operator==(const OptionId& other) const {
        return std::tie(kind, feature, bin, feature2, bin2) ==
               std::tie(other.kind, other.feature, other.bin, other.feature2, other.bin2);
    }
    bool operator!=(const OptionId& other) const { return !(*this == other); }
    bool operator<(const OptionId& other) const {
        return std::tie(kind, feature, bin, feature2, bin2) <
               std::tie(other.kind, other.feature, other.bin, other.feature2, other.bin2);
    }
};

/// Identifiers already used by earlier solutions of a batch.
using OptionIdSet = std::set<OptionId>;

/// Interaction term index -> part of an option's score gain that comes
/// from that interaction term.
using InteractionGains = std::map<std::size_t, double>;

// ─── Options ──────────────────────────────────────────────────

struct ContinuousOption {
    double target = 0.0;
    double score_gain = 0.0;
    double distance = 0.0;
    std::size_t bin = 0;
    InteractionGains interaction_gains;
};

struct CategoricalOption {
    std::string level;
    double level_code = 0.0;
    double score_gain = 0.0;
    double distance = 0.0;
    std::size_t bin = 0;
    InteractionGains interaction_gains;
};

/// Joint change of both features of an interaction term. Carries no
/// distance of its own: the cost is paid by the two parent options.
struct InteractionOption {
    std::size_t term = 0;
    std::size_t feature1 = 0;
    std::size_t bin1 = 0;
    std::size_t feature2 = 0;
    std::size_t bin2 = 0;
    FeatureValue target1;
    FeatureValue target2;
    double score_gain = 0.0;
    double distance = 0.0;

    OptionId id() const { return OptionId::interaction(feature1, bin1, feature2, bin2); }
};

/// Kind-agnostic read view of a main-effect option.
struct MainOptionView {
    OptionId id;
    FeatureValue target;
    double score_gain = 0.0;
    double distance = 0.0;
    const InteractionGains* interaction_gains = nullptr;
};

// ─── Option Set ───────────────────────────────────────────────
// All candidate changes for one sample, keyed by feature index (main
// effects) or interaction term index.

struct OptionSet {
    std::map<std::size_t, std::vector<ContinuousOption>> continuous;
    std::map<std::size_t, std::vector<CategoricalOption>> categorical;
    std::map<std::size_t, std::vector<InteractionOption>> interaction;

    /// Main-effect options of one feature, whichever kind it is.
    std::vector<MainOptionView> mainOptions(std::size_t feature) const {
        std::vector<MainOptionView> out;
        auto cont = continuous.find(feature);
        if (cont != continuous.end()) {
            for (const auto& o : cont->second) {
                out.push_back({OptionId::mainEffect(OptionKind::Continuous, feature, o.bin),
                               o.target, o.score_gain, o.distance, &o.interaction_gains});
            }
        }
        auto cat = categorical.find(feature);
        if (cat != categorical.end()) {
            for (const auto& o : cat->second) {
                out.push_back({OptionId::mainEffect(OptionKind::Categorical, feature, o.bin),
                               o.level, o.score_gain, o.distance, &o.interaction_gains});
            }
        }
        return out;
    }

    std::size_t mainOptionCount() const {
        std::size_t n = 0;
        for (const auto& [_, options] : continuous) n += options.size();
        for (const auto& [_, options] : categorical) n += options.size();
        return n;
    }

    std::size_t interactionOptionCount() const {
        std::size_t n = 0;
        for (const auto& [_, options] : interaction) n += options.size();
        return n;
    }
};

} // namespace gamcoach
