#include "WalkForwardAnalyzer.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "OutputUtils.h"
#include "StatisticalExceptions.h"
#include "StatUtils.h"

namespace stratvalidator
{
namespace validation
{

using utils::formatNumber;

namespace
{
    const char* const kTag = "WalkForward";
}

WalkForwardAnalyzer::WalkForwardAnalyzer(const WalkForwardConfig& config)
    : mConfig(config)
{
    if (mConfig.trainLength < 2 || mConfig.testLength < 2)
        throw std::invalid_argument("WalkForwardAnalyzer: train and test lengths must be >= 2");

    if (mConfig.stepSize == 0)
        throw std::invalid_argument("WalkForwardAnalyzer: step size must be > 0");

    if (mConfig.minWindows == 0)
        throw std::invalid_argument("WalkForwardAnalyzer: minimum window count must be > 0");
}

std::vector<WalkForwardWindow> WalkForwardAnalyzer::generateWindows(std::size_t numPeriods,
                                                                    const WalkForwardConfig& config)
{
    std::vector<WalkForwardWindow> windows;
    const std::size_t span = config.trainLength + config.testLength;

    std::size_t start = 0;
    while (start + span <= numPeriods)
    {
        WalkForwardWindow window;
        window.index = windows.size();
        window.trainBegin = start;
        window.trainEnd = start + config.trainLength;
        window.testBegin = window.trainEnd;
        window.testEnd = window.testBegin + config.testLength;
        windows.push_back(window);

        start = std::max(window.testEnd, start + config.stepSize);
    }

    return windows;
}

WalkForwardResult WalkForwardAnalyzer::analyze(const ReturnSeries& series,
                                               const IPeriodEvaluator& evaluator,
                                               std::ostream& os) const
{
    WalkForwardDetails details;
    std::vector<WalkForwardWindow> windows = generateWindows(series.size());
    details.windowsGenerated = windows.size();

    if (windows.size() < mConfig.minWindows)
    {
        const std::string reason = "Only " + std::to_string(windows.size()) + " windows from " +
            std::to_string(series.size()) + " periods, minimum " + std::to_string(mConfig.minWindows);
        utils::logVerdict(os, kTag, false, reason);
        return WalkForwardResult(ValidationStatus::InsufficientData, reason, std::nullopt, details);
    }

    std::vector<double> metrics;
    std::size_t upstreamFailures = 0;

    for (auto& window : windows)
    {
        window.trainBounds = series.boundsForIndexRange(window.trainBegin, window.trainEnd);
        window.testBounds = series.boundsForIndexRange(window.testBegin, window.testEnd);

        WindowEvaluation evaluation{window, std::nullopt, ""};

        try
        {
            const double metric = evaluator.evaluatePeriod(*window.testBounds);
            if (std::isfinite(metric))
                evaluation.metric = metric;
            else
                evaluation.error = "non-finite metric";
        }
        catch (const UpstreamEvaluationException& e)
        {
            evaluation.error = e.what();
            ++upstreamFailures;
        }
        catch (const InsufficientDataException& e)
        {
            evaluation.error = e.what();
        }
        catch (const DegenerateInputException& e)
        {
            evaluation.error = e.what();
        }

        if (evaluation.metric)
        {
            metrics.push_back(*evaluation.metric);
            utils::logInfo(os, kTag, "window " + std::to_string(window.index) + " test " +
                           window.testBounds->toString() + ": " + formatNumber(*evaluation.metric));
        }
        else
        {
            utils::logWarning(os, kTag, "window " + std::to_string(window.index) +
                              " excluded: " + evaluation.error);
        }

        details.windows.push_back(std::move(evaluation));
    }

    details.windowsEvaluated = metrics.size();

    if (metrics.size() < mConfig.minWindows)
    {
        const ValidationStatus status = (upstreamFailures > 0)
            ? ValidationStatus::Unavailable
            : ValidationStatus::InsufficientData;
        const std::string reason = "Only " + std::to_string(metrics.size()) + " of " +
            std::to_string(windows.size()) + " windows evaluated, minimum " +
            std::to_string(mConfig.minWindows);
        utils::logVerdict(os, kTag, false, reason);
        return WalkForwardResult(status, reason, std::nullopt, details);
    }

    const DescriptiveStats summary = StatUtils::summarize(metrics);
    details.meanMetric = summary.mean;
    details.stdDevMetric = summary.stdDev;
    details.winRate = static_cast<double>(std::count_if(metrics.begin(), metrics.end(),
                                                        [](double m) { return m > 0.0; })) /
        static_cast<double>(summary.count);
    details.worstMetric = summary.min;
    details.bestMetric = summary.max;

    utils::logInfo(os, kTag, std::to_string(metrics.size()) + " windows: mean " +
                   formatNumber(details.meanMetric) + ", std " + formatNumber(details.stdDevMetric) +
                   ", win rate " + formatNumber(details.winRate) + ", worst " +
                   formatNumber(details.worstMetric));

    std::vector<std::string> failures;
    if (!(details.meanMetric > mConfig.minMeanMetric))
        failures.push_back("mean " + formatNumber(details.meanMetric) + " <= " +
                           formatNumber(mConfig.minMeanMetric));

    if (!(details.winRate > mConfig.minWinRate))
        failures.push_back("win rate " + formatNumber(details.winRate) + " <= " +
                           formatNumber(mConfig.minWinRate));

    if (!(details.worstMetric > mConfig.minWorstMetric))
        failures.push_back("worst window " + formatNumber(details.worstMetric) + " <= " +
                           formatNumber(mConfig.minWorstMetric));

    if (!(details.stdDevMetric < mConfig.maxStdDev))
        failures.push_back("std " + formatNumber(details.stdDevMetric) + " >= " +
                           formatNumber(mConfig.maxStdDev));

    const bool pass = failures.empty();
    const std::string reason = pass ? "All walk-forward criteria met" : utils::join(failures, "; ");

    utils::logVerdict(os, kTag, pass, reason);
    return WalkForwardResult(pass ? ValidationStatus::Pass : ValidationStatus::Fail,
                             reason,
                             details.meanMetric,
                             details);
}

} // namespace validation
} // namespace stratvalidator
