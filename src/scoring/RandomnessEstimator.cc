#include "scoring/RandomnessEstimator.hh"

#include "Logging.hh"
#include "Utility.hh"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace Shuffling {
namespace Scoring {

namespace {

using DisplacementVector = std::vector<int>;

std::optional<DisplacementVector> getDisplacements(
    const Deck& original, const Deck& shuffled)
{
    if (original.size() != shuffled.size() || original.empty()) {
        log(LogLevel::WARNING,
            "Cannot estimate randomness: deck sizes %d and %d",
            original.size(), shuffled.size());
        return std::nullopt;
    }
    auto new_indices = std::map<std::string_view, int> {};
    for (const auto n : to(shuffled.size())) {
        const auto& id = shuffled[n].id;
        if (!new_indices.try_emplace(id, static_cast<int>(n)).second) {
            log(LogLevel::WARNING,
                "Cannot estimate randomness: duplicate card %s", id);
            return std::nullopt;
        }
    }
    auto ret = DisplacementVector {};
    ret.reserve(original.size());
    for (const auto n : to(original.size())) {
        const auto& id = original[n].id;
        const auto iter = new_indices.find(id);
        if (iter == new_indices.end()) {
            log(LogLevel::WARNING,
                "Cannot estimate randomness: card %s missing", id);
            return std::nullopt;
        }
        ret.push_back(std::abs(iter->second - static_cast<int>(n)));
        // Erasing catches duplicates in the original deck
        new_indices.erase(iter);
    }
    return ret;
}

}

int displacementScore(const Deck& original, const Deck& shuffled)
{
    const auto displacements = getDisplacements(original, shuffled);
    if (!displacements) {
        return 0;
    }
    const auto n = static_cast<double>(displacements->size());
    const auto n_displaced = std::count_if(
        displacements->begin(), displacements->end(),
        [](const auto d) { return d != 0; });
    auto total = 0.0;
    for (const auto d : *displacements) {
        total += d;
    }
    const auto displaced_fraction = n_displaced / n;
    const auto normalized_mean = std::min((total / n) / (n / 2), 1.0);
    return static_cast<int>(
        std::lround(100 * (0.6 * displaced_fraction + 0.4 * normalized_mean)));
}

double entropyScore(const Deck& original, const Deck& shuffled)
{
    const auto displacements = getDisplacements(original, shuffled);
    if (!displacements) {
        return 0;
    }
    const auto max_displacement = *std::max_element(
        displacements->begin(), displacements->end());
    if (max_displacement == 0) {
        return 0;
    }
    auto buckets = std::vector<int>(max_displacement + 1);
    for (const auto d : *displacements) {
        ++buckets[d];
    }
    const auto total = static_cast<double>(displacements->size());
    auto entropy = 0.0;
    for (const auto count : buckets) {
        if (count > 0) {
            const auto p = count / total;
            entropy -= p * std::log2(p);
        }
    }
    const auto max_entropy = std::log2(static_cast<double>(buckets.size()));
    return 100 * entropy / max_entropy;
}

int estimateRandomness(const Deck& original, const Deck& shuffled)
{
    return displacementScore(original, shuffled);
}

RandomnessEstimate estimate(const Deck& original, const Deck& shuffled)
{
    return {
        displacementScore(original, shuffled),
        entropyScore(original, shuffled),
        countSuitRuns(shuffled),
    };
}

bool operator==(const RandomnessEstimate& lhs, const RandomnessEstimate& rhs)
{
    return lhs.displacementScore == rhs.displacementScore &&
        lhs.entropyScore == rhs.entropyScore && lhs.suitRuns == rhs.suitRuns;
}

std::ostream& operator<<(std::ostream& os, const RandomnessEstimate& estimate)
{
    return os << "displacement " << estimate.displacementScore <<
        ", entropy " << estimate.entropyScore <<
        ", suit runs " << estimate.suitRuns;
}

}
}
