#include "scorer/scorer.hpp"
#include "faults.hpp"

#include <algorithm>

static std::string joinLabels(const std::vector<WakewordLabel>& labels) {
    std::string out;
    for (const auto& l : labels) out += out.empty() ? l : "," + l;
    return out;
}

void requireLabels(const Scorer& scorer, const DetectionConfig& det) {
    std::vector<WakewordLabel> have = scorer.labels();
    std::vector<WakewordLabel> want = det.labels();
    std::sort(have.begin(), have.end());
    std::sort(want.begin(), want.end());

    if (have != want) {
        throw ScoringFault("Scorer labels [" + joinLabels(have) +
                           "] do not match configured models [" + joinLabels(want) + "]",
                           "ERR_SCORER_INIT");
    }
}
