#pragma once

#include <cstddef>
#include <ostream>
#include <vector>
#include "PeriodEvaluator.h"
#include "ReturnSeries.h"
#include "ValidationTypes.h"

namespace stratvalidator
{
namespace validation
{

struct WalkForwardConfig
{
    std::size_t trainLength = 252;
    std::size_t testLength = 63;
    std::size_t stepSize = 63;
    std::size_t minWindows = 3;
    double minMeanMetric = 0.5;
    double minWinRate = 0.6;
    double minWorstMetric = -0.5;
    double maxStdDev = 1.0;
};

/**
 * @class WalkForwardAnalyzer
 * @brief Rolling out-of-sample evaluation over consecutive windows.
 *
 * Window k trains on [p, p + train) and tests on [p + train, p + train + test).
 * The next window starts at max(end of this test window, p + step), so
 * training of window k+1 never begins before test window k has ended and
 * test windows never overlap, whatever the step size. Generation stops when
 * a test window would run past the end of the series.
 */
class WalkForwardAnalyzer
{
public:
    /**
     * @throws std::invalid_argument if a length is below 2, the step is 0
     *         or minWindows is 0
     */
    explicit WalkForwardAnalyzer(const WalkForwardConfig& config = WalkForwardConfig());

    // Index-only windows for a series of numPeriods entries
    static std::vector<WalkForwardWindow> generateWindows(std::size_t numPeriods,
                                                          const WalkForwardConfig& config);

    std::vector<WalkForwardWindow> generateWindows(std::size_t numPeriods) const
    {
        return generateWindows(numPeriods, mConfig);
    }

    WalkForwardResult analyze(const ReturnSeries& series,
                              const IPeriodEvaluator& evaluator,
                              std::ostream& os) const;

    const WalkForwardConfig& getConfig() const
    {
        return mConfig;
    }

private:
    WalkForwardConfig mConfig;
};

} // namespace validation
} // namespace stratvalidator
