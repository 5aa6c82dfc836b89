#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include "BonferroniCorrection.h"
#include "ValidationTypes.h"

namespace stratvalidator
{
namespace validation
{

struct BonferroniConfig
{
    std::optional<std::size_t> numStrategies;   ///< Empty = size of the batch under test
    double familyWiseAlpha = 0.05;
    double conservativeFloor = 0.5;
    analysis::ThresholdMode mode = analysis::ThresholdMode::Parametric;
    analysis::BootstrapNullSettings nullSettings;
    double divergenceWarning = 0.20;             ///< Relative threshold divergence that is logged
};

/**
 * @class BonferroniValidator
 * @brief Decides whether one candidate's metric survives the correction
 *        for the number of strategies screened.
 *
 * In Bootstrap mode both thresholds are computed and reported; the
 * bootstrap threshold is applied unless its simulation degenerates, in
 * which case the parametric threshold is applied and the failure logged.
 */
class BonferroniValidator
{
public:
    /**
     * @throws std::invalid_argument if numStrategies == 0 or alpha is not in (0, 1)
     */
    BonferroniValidator(std::size_t numStrategies, const BonferroniConfig& config = BonferroniConfig());

    BonferroniResult validate(double metric,
                              std::size_t numPeriods,
                              uint64_t seed,
                              std::ostream& os) const;

    /**
     * @brief Copy of result recording whether the bootstrap interval clears
     *        the applied threshold (point and lower bound both above it).
     *        result is returned unchanged when ci carries no interval.
     */
    static BonferroniResult withConfidenceInterval(const BonferroniResult& result,
                                                   const BootstrapResult& ci);

    const analysis::BonferroniCorrector& getCorrector() const
    {
        return mCorrector;
    }

    const BonferroniConfig& getConfig() const
    {
        return mConfig;
    }

private:
    analysis::BonferroniCorrector mCorrector;
    BonferroniConfig mConfig;
};

} // namespace validation
} // namespace stratvalidator
