#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "BaselineCache.h"
#include "BaselineTypes.h"
#include "BonferroniCorrection.h"
#include "PerformanceMetrics.h"
#include "PeriodEvaluator.h"
#include "ReturnSeries.h"
#include "ValidationTypes.h"
#include "ValidatorConfiguration.h"

namespace stratvalidator
{
namespace validation
{

/**
 * @brief One strategy to validate: its backtested returns and, optionally,
 *        an evaluator that re-runs the backtest over arbitrary periods.
 *
 * Without an evaluator, periods are scored by applying the orchestrator's
 * metric function to slices of the return series.
 */
struct StrategyCandidate
{
    std::string id;
    ReturnSeries returns;
    std::shared_ptr<const IPeriodEvaluator> evaluator;
};

class CandidateReport
{
public:
    explicit CandidateReport(std::string candidateId = "")
        : mCandidateId(std::move(candidateId)),
          mResults(),
          mCandidateMetric(),
          mAborted(false),
          mAbortReason()
    {}

    const std::string& getCandidateId() const
    {
        return mCandidateId;
    }

    const std::vector<ValidationResult>& getResults() const
    {
        return mResults;
    }

    const std::optional<double>& getCandidateMetric() const
    {
        return mCandidateMetric;
    }

    bool isAborted() const
    {
        return mAborted;
    }

    const std::string& getAbortReason() const
    {
        return mAbortReason;
    }

    // Result of the named validator ("data_split", ...), if it ran
    const ValidationResult* findResult(const std::string& validator) const;

    std::size_t passedCount() const;

    std::size_t failedCount() const
    {
        return mResults.size() - passedCount();
    }

    // All five validators ran and passed
    bool overallPassed() const;

    void addResult(ValidationResult result)
    {
        mResults.push_back(std::move(result));
    }

    void setCandidateMetric(double metric)
    {
        mCandidateMetric = metric;
    }

    void markAborted(const std::string& reason)
    {
        mAborted = true;
        mAbortReason = reason;
    }

    static constexpr std::size_t kNumValidators = 5;

private:
    std::string mCandidateId;
    std::vector<ValidationResult> mResults;
    std::optional<double> mCandidateMetric;
    bool mAborted;
    std::string mAbortReason;
};

struct BatchReport
{
    std::vector<CandidateReport> candidates;
    analysis::StrategySetCorrection correction;
};

/**
 * @class ValidationOrchestrator
 * @brief Runs the five validators for each strategy candidate.
 *
 * Validation failures never stop a candidate: every validator reports. An
 * exception escaping a validator aborts that candidate only; the remaining
 * validators are skipped and the batch continues. The baseline cache is
 * shared by all candidates of this orchestrator.
 */
class ValidationOrchestrator
{
public:
    /**
     * @param simulator Reference portfolio simulator; null leaves the
     *        baseline comparison Unavailable
     * @throws ValidatorConfigurationException if configuration is invalid
     */
    ValidationOrchestrator(const ValidatorConfiguration& configuration,
                           MetricFunction metric,
                           std::shared_ptr<const baseline::IBaselineSimulator> simulator);

    /**
     * @param numStrategies Strategies screened in the family, used for the
     *        correction unless the configuration fixes it
     */
    CandidateReport runCandidate(const StrategyCandidate& candidate,
                                 std::size_t numStrategies,
                                 std::ostream& os) const;

    BatchReport runBatch(const std::vector<StrategyCandidate>& candidates, std::ostream& os) const;

    const baseline::BaselineCache& getBaselineCache() const
    {
        return *mBaselineCache;
    }

    const ValidatorConfiguration& getConfiguration() const
    {
        return mConfiguration;
    }

private:
    uint64_t candidateSeed(const std::string& candidateId) const;

    void runValidators(const StrategyCandidate& candidate,
                       std::size_t numStrategies,
                       CandidateReport& report,
                       std::ostream& os) const;

private:
    ValidatorConfiguration mConfiguration;
    MetricFunction mMetric;
    std::shared_ptr<const baseline::IBaselineSimulator> mSimulator;
    std::shared_ptr<baseline::BaselineCache> mBaselineCache;
    uint64_t mMasterSeed;
};

} // namespace validation
} // namespace stratvalidator
