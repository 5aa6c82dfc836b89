#include "ValidationOrchestrator.h"
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <mutex>
#include <sstream>
#include "BaselineComparator.h"
#include "BonferroniValidator.h"
#include "BootstrapValidator.h"
#include "DataSplitValidator.h"
#include "OutputUtils.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "RngUtils.h"
#include "WalkForwardAnalyzer.h"

namespace stratvalidator
{
namespace validation
{

const ValidationResult* CandidateReport::findResult(const std::string& validator) const
{
    for (const auto& result : mResults)
        if (validatorName(result) == validator)
            return &result;

    return nullptr;
}

std::size_t CandidateReport::passedCount() const
{
    return static_cast<std::size_t>(std::count_if(mResults.begin(), mResults.end(),
                                                  [](const ValidationResult& r) { return passed(r); }));
}

bool CandidateReport::overallPassed() const
{
    return !mAborted && mResults.size() == kNumValidators && passedCount() == kNumValidators;
}

ValidationOrchestrator::ValidationOrchestrator(const ValidatorConfiguration& configuration,
                                               MetricFunction metric,
                                               std::shared_ptr<const baseline::IBaselineSimulator> simulator)
    : mConfiguration(configuration),
      mMetric(std::move(metric)),
      mSimulator(std::move(simulator)),
      mBaselineCache(std::make_shared<baseline::BaselineCache>()),
      mMasterSeed(rng_utils::resolve_seed(configuration.getOrchestrationConfig().seed))
{
    if (!mMetric)
        throw ValidatorConfigurationException("ValidationOrchestrator: metric function must not be empty");

    mConfiguration.validate();
}

uint64_t ValidationOrchestrator::candidateSeed(const std::string& candidateId) const
{
    return rng_utils::CRNKey(mMasterSeed).with_tag(rng_utils::tag_from_string(candidateId)).make_seed_for(0);
}

void ValidationOrchestrator::runValidators(const StrategyCandidate& candidate,
                                           std::size_t numStrategies,
                                           CandidateReport& report,
                                           std::ostream& os) const
{
    const OrchestrationConfig& orchestration = mConfiguration.getOrchestrationConfig();
    const BonferroniConfig& bonferroniConfig = mConfiguration.getBonferroniConfig();

    auto series = std::make_shared<const ReturnSeries>(candidate.returns);
    std::shared_ptr<const IPeriodEvaluator> inner = candidate.evaluator
        ? candidate.evaluator
        : std::make_shared<ReturnSeriesPeriodEvaluator>(series, mMetric);
    const BudgetedPeriodEvaluator evaluator(inner, orchestration.maxEvaluationsPerCandidate, series);

    const double candidateMetric = mMetric(series->getReturns());
    report.setCandidateMetric(candidateMetric);
    const uint64_t seed = candidateSeed(candidate.id);

    const DataSplitValidator dataSplit(mConfiguration.getDataSplitConfig());
    const WalkForwardAnalyzer walkForward(mConfiguration.getWalkForwardConfig());
    const BonferroniValidator bonferroni(bonferroniConfig.numStrategies.value_or(std::max<std::size_t>(1, numStrategies)),
                                         bonferroniConfig);
    const BootstrapValidator bootstrap(mConfiguration.getBootstrapConfig(), mMetric);

    std::optional<DataSplitResult> dataSplitResult;
    std::optional<WalkForwardResult> walkForwardResult;
    std::optional<BonferroniResult> bonferroniResult;
    std::optional<BootstrapResult> bootstrapResult;
    std::optional<BaselineComparisonResult> baselineResult;

    std::vector<std::function<void(std::ostream&)>> tasks = {
        [&](std::ostream& out) {
            dataSplitResult = dataSplit.validate(evaluator, *series, out);
        },
        [&](std::ostream& out) {
            walkForwardResult = walkForward.analyze(*series, evaluator, out);
        },
        [&](std::ostream& out) {
            bonferroniResult = bonferroni.validate(candidateMetric, series->size(), seed, out);
        },
        [&](std::ostream& out) {
            bootstrapResult = bootstrap.validate(*series, rng_utils::hash_combine64({seed, 1}), out);
        },
        [&](std::ostream& out) {
            if (!mSimulator)
            {
                const std::string reason = "No baseline simulator configured";
                utils::logVerdict(out, "Baseline", false, reason);
                baselineResult = BaselineComparisonResult(ValidationStatus::Unavailable, reason,
                                                          std::nullopt, BaselineComparisonDetails());
                return;
            }

            const baseline::BaselineComparator comparator(mSimulator, mBaselineCache,
                                                          mConfiguration.getBaselineConfig());
            baselineResult = comparator.compare(*series, mMetric, out);
        }
    };

    // Completed results are kept even when a later validator throws
    auto collect = [&]() {
        if (bonferroniResult && bootstrapResult)
            bonferroniResult = BonferroniValidator::withConfidenceInterval(*bonferroniResult, *bootstrapResult);

        if (dataSplitResult)
            report.addResult(*dataSplitResult);
        if (walkForwardResult)
            report.addResult(*walkForwardResult);
        if (bonferroniResult)
            report.addResult(*bonferroniResult);
        if (bootstrapResult)
            report.addResult(*bootstrapResult);
        if (baselineResult)
            report.addResult(*baselineResult);
    };

    try
    {
        if (orchestration.parallelValidators)
        {
            std::vector<std::ostringstream> logs(tasks.size());
            concurrency::StdAsyncExecutor executor;
            std::vector<std::future<void>> futures;
            futures.reserve(tasks.size());

            for (std::size_t i = 0; i < tasks.size(); ++i)
                futures.push_back(executor.submit([&tasks, &logs, i]() { tasks[i](logs[i]); }));

            try
            {
                executor.waitAll(futures);
            }
            catch (...)
            {
                for (const auto& log : logs)
                    os << log.str();
                throw;
            }

            for (const auto& log : logs)
                os << log.str();
        }
        else
        {
            for (const auto& task : tasks)
                task(os);
        }
    }
    catch (...)
    {
        collect();
        throw;
    }

    collect();
}

CandidateReport ValidationOrchestrator::runCandidate(const StrategyCandidate& candidate,
                                                     std::size_t numStrategies,
                                                     std::ostream& os) const
{
    CandidateReport report(candidate.id);
    os << "\n=== Validating candidate " << candidate.id << " (" << candidate.returns.size()
       << " periods) ===\n";

    try
    {
        runValidators(candidate, numStrategies, report, os);
    }
    catch (const std::exception& e)
    {
        report.markAborted(e.what());
    }
    catch (...)
    {
        report.markAborted("unknown exception");
    }

    if (report.isAborted())
        os << "✗ Candidate " << candidate.id << " aborted: " << report.getAbortReason() << "\n";
    else
        os << (report.overallPassed() ? "✓ " : "✗ ") << "Candidate " << candidate.id << ": "
           << report.passedCount() << "/" << CandidateReport::kNumValidators << " validations passed\n";

    return report;
}

BatchReport ValidationOrchestrator::runBatch(const std::vector<StrategyCandidate>& candidates,
                                             std::ostream& os) const
{
    const BonferroniConfig& bonferroniConfig = mConfiguration.getBonferroniConfig();
    const std::size_t numStrategies =
        bonferroniConfig.numStrategies.value_or(std::max<std::size_t>(1, candidates.size()));

    BatchReport batch;
    batch.candidates.resize(candidates.size());

    std::mutex logMutex;
    auto executor = concurrency::makeExecutor(mConfiguration.getOrchestrationConfig().numThreads);

    concurrency::parallel_for(static_cast<uint32_t>(candidates.size()), *executor, [&](uint32_t i) {
        std::ostringstream buffer;
        batch.candidates[i] = runCandidate(candidates[i], numStrategies, buffer);

        std::lock_guard<std::mutex> lock(logMutex);
        os << buffer.str();
    });

    std::vector<std::string> ids;
    std::vector<double> metrics;
    std::vector<double> thresholds;

    for (const auto& report : batch.candidates)
    {
        double metric = std::numeric_limits<double>::quiet_NaN();
        double threshold = 0.0;

        const ValidationResult* result = report.findResult("bonferroni");
        if (result)
        {
            const auto& bonferroniResult = std::get<BonferroniResult>(*result);
            const ValidationStatus status = bonferroniResult.getStatus();
            if (status == ValidationStatus::Pass || status == ValidationStatus::Fail)
            {
                metric = bonferroniResult.getDetails().metric;
                threshold = bonferroniResult.getDetails().context.chosenThreshold;
            }
        }

        ids.push_back(report.getCandidateId());
        metrics.push_back(metric);
        thresholds.push_back(threshold);
    }

    const analysis::BonferroniCorrector corrector(numStrategies,
                                                  bonferroniConfig.familyWiseAlpha,
                                                  bonferroniConfig.conservativeFloor);
    batch.correction = analysis::summarizeStrategySet(corrector, ids, metrics, thresholds);

    const std::size_t passedCandidates = static_cast<std::size_t>(
        std::count_if(batch.candidates.begin(), batch.candidates.end(),
                      [](const CandidateReport& r) { return r.overallPassed(); }));

    os << "\n=== Batch summary ===\n";
    utils::logInfo(os, "Batch", std::to_string(passedCandidates) + "/" + std::to_string(candidates.size()) +
                   " candidates passed all validations");
    utils::logInfo(os, "Batch", std::to_string(batch.correction.significantCount) +
                   " significant after correction, expected false discoveries " +
                   utils::formatNumber(batch.correction.expectedFalseDiscoveries) +
                   ", FWER " + utils::formatNumber(batch.correction.familyWiseErrorRate));

    return batch;
}

} // namespace validation
} // namespace stratvalidator
