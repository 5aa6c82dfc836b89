#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <atomic>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ValidationOrchestrator.h"
#include "TestUtils.h"

using namespace stratvalidator;
using namespace stratvalidator::validation;
using boost::gregorian::date;
using Catch::Approx;

namespace
{
  class ConstantSimulator : public baseline::IBaselineSimulator
  {
  public:
    explicit ConstantSimulator(double sharpe)
      : mSharpe(sharpe),
        mCalls(0)
    {}

    baseline::BaselineRecord simulate(baseline::BaselineId id, const PeriodBounds& bounds) const override
    {
      ++mCalls;
      return baseline::BaselineRecord(id, bounds, mSharpe, 0.07, 0.3, 252);
    }

    int getCalls() const
    {
      return mCalls.load();
    }

  private:
    double mSharpe;
    mutable std::atomic<int> mCalls;
  };

  // Fails outside the upstream exception contract
  class BrokenEvaluator : public IPeriodEvaluator
  {
  public:
    double evaluatePeriod(const PeriodBounds&) const override
    {
      throw std::logic_error("evaluator misconfigured");
    }
  };

  ValidatorConfiguration makeConfiguration(const OrchestrationConfig& orchestration)
  {
    BootstrapConfig bootstrap;
    bootstrap.iterations = 200;

    return ValidatorConfiguration(DataSplitConfig(), WalkForwardConfig(), BonferroniConfig(),
                                  bootstrap, baseline::BaselineConfig(), orchestration);
  }

  OrchestrationConfig seededOrchestration()
  {
    OrchestrationConfig orchestration;
    orchestration.seed = 42;
    return orchestration;
  }

  StrategyCandidate makeCandidate(const std::string& id, ReturnSeries returns,
                                  std::shared_ptr<const IPeriodEvaluator> evaluator = nullptr)
  {
    return StrategyCandidate{id, std::move(returns), std::move(evaluator)};
  }

  const BootstrapResult& bootstrapOf(const CandidateReport& report)
  {
    return std::get<BootstrapResult>(*report.findResult("bootstrap"));
  }
}

TEST_CASE("Every validator reports for a candidate", "[ValidationOrchestrator]")
{
  ValidationOrchestrator orchestrator(makeConfiguration(seededOrchestration()),
                                      makeAnnualizedSharpeMetric(),
                                      std::make_shared<ConstantSimulator>(0.3));
  std::ostringstream os;

  CandidateReport report = orchestrator.runCandidate(
    makeCandidate("steady", makeNormalReturnSeries(1000, 0.0015, 0.01, 31)), 1, os);

  REQUIRE_FALSE(report.isAborted());
  REQUIRE(report.getResults().size() == CandidateReport::kNumValidators);
  for (const char* name : {"data_split", "walk_forward", "bonferroni", "bootstrap", "baseline"})
    REQUIRE(report.findResult(name) != nullptr);

  REQUIRE(report.getCandidateMetric().has_value());
  REQUIRE(report.passedCount() + report.failedCount() == CandidateReport::kNumValidators);
  REQUIRE(report.overallPassed() == (report.passedCount() == CandidateReport::kNumValidators));

  const auto& bonferroni = std::get<BonferroniResult>(*report.findResult("bonferroni"));
  REQUIRE(bonferroni.getDetails().ciLowerClearsThreshold.has_value());
  REQUIRE(os.str().find("steady") != std::string::npos);
}

TEST_CASE("Validation failures never stop the batch", "[ValidationOrchestrator]")
{
  ValidationOrchestrator orchestrator(makeConfiguration(seededOrchestration()),
                                      makeAnnualizedSharpeMetric(),
                                      nullptr);
  std::ostringstream os;

  std::vector<StrategyCandidate> candidates = {
    makeCandidate("steady", makeNormalReturnSeries(1000, 0.0015, 0.01, 31)),
    makeCandidate("short", makeNormalReturnSeries(50, 0.0015, 0.01, 32)),
    makeCandidate("broken", makeNormalReturnSeries(1000, 0.0015, 0.01, 33), std::make_shared<BrokenEvaluator>()),
    makeCandidate("flat", makeReturnSeries(std::vector<double>(300, 0.0)))
  };

  BatchReport batch = orchestrator.runBatch(candidates, os);

  REQUIRE(batch.candidates.size() == 4);
  REQUIRE(batch.candidates[0].getCandidateId() == "steady");

  SECTION("short history is insufficient data, not an error")
  {
    const CandidateReport& shortReport = batch.candidates[1];
    REQUIRE_FALSE(shortReport.isAborted());
    REQUIRE(shortReport.getResults().size() == CandidateReport::kNumValidators);
    REQUIRE(getStatus(*shortReport.findResult("data_split")) == ValidationStatus::InsufficientData);
    REQUIRE(getStatus(*shortReport.findResult("walk_forward")) == ValidationStatus::InsufficientData);
    REQUIRE(getStatus(*shortReport.findResult("bootstrap")) == ValidationStatus::InsufficientData);
    REQUIRE_FALSE(shortReport.overallPassed());
  }

  SECTION("unexpected evaluator exception aborts only that candidate")
  {
    const CandidateReport& brokenReport = batch.candidates[2];
    REQUIRE(brokenReport.isAborted());
    REQUIRE(brokenReport.getAbortReason().find("evaluator misconfigured") != std::string::npos);
    REQUIRE_FALSE(brokenReport.overallPassed());
    REQUIRE(os.str().find("aborted") != std::string::npos);

    REQUIRE_FALSE(batch.candidates[0].isAborted());
    REQUIRE_FALSE(batch.candidates[3].isAborted());
  }

  SECTION("flat returns are degenerate input")
  {
    const CandidateReport& flatReport = batch.candidates[3];
    REQUIRE(getStatus(*flatReport.findResult("bonferroni")) == ValidationStatus::DegenerateInput);
    REQUIRE(getStatus(*flatReport.findResult("bootstrap")) == ValidationStatus::DegenerateInput);
  }

  SECTION("no simulator leaves the baseline comparison unavailable")
  {
    REQUIRE(getStatus(*batch.candidates[0].findResult("baseline")) == ValidationStatus::Unavailable);
    REQUIRE_FALSE(batch.candidates[0].overallPassed());
  }

  SECTION("strategy set correction covers the whole batch")
  {
    const auto& correction = batch.correction;
    REQUIRE(correction.totalStrategies == 4);
    REQUIRE(correction.adjustedAlpha == Approx(0.05 / 4.0));
    REQUIRE(correction.significantCount == correction.significantStrategies.size());

    const auto& significant = correction.significantStrategies;
    REQUIRE(std::find(significant.begin(), significant.end(), "broken") == significant.end());
    REQUIRE(std::find(significant.begin(), significant.end(), "flat") == significant.end());
    REQUIRE(os.str().find("Batch summary") != std::string::npos);
  }
}

TEST_CASE("Batch size sets the number of strategies", "[ValidationOrchestrator]")
{
  ValidationOrchestrator orchestrator(makeConfiguration(seededOrchestration()),
                                      makeAnnualizedSharpeMetric(),
                                      nullptr);
  std::ostringstream os;

  std::vector<StrategyCandidate> candidates;
  for (int i = 0; i < 3; ++i)
    candidates.push_back(makeCandidate("c" + std::to_string(i), makeNormalReturnSeries(300, 0.001, 0.01, 50 + i)));

  BatchReport batch = orchestrator.runBatch(candidates, os);

  for (const auto& report : batch.candidates)
    {
      const auto& bonferroni = std::get<BonferroniResult>(*report.findResult("bonferroni"));
      REQUIRE(bonferroni.getDetails().context.numStrategies == 3);
    }
}

TEST_CASE("Evaluation budget exhaustion is unavailable", "[ValidationOrchestrator]")
{
  OrchestrationConfig orchestration = seededOrchestration();
  orchestration.maxEvaluationsPerCandidate = 2;

  ValidationOrchestrator orchestrator(makeConfiguration(orchestration), makeAnnualizedSharpeMetric(), nullptr);
  auto evaluator = std::make_shared<CallbackPeriodEvaluator>([](const date&, const date&) { return 1.4; });
  std::ostringstream os;

  CandidateReport report = orchestrator.runCandidate(
    makeCandidate("costly", makeNormalReturnSeries(1000, 0.0015, 0.01, 31), evaluator), 1, os);

  REQUIRE_FALSE(report.isAborted());
  REQUIRE(getStatus(*report.findResult("data_split")) == ValidationStatus::Unavailable);
  REQUIRE(getStatus(*report.findResult("walk_forward")) == ValidationStatus::Unavailable);
  REQUIRE(getReason(*report.findResult("data_split")).find("budget") != std::string::npos);
}

TEST_CASE("Short split periods are insufficient data for callback candidates", "[ValidationOrchestrator]")
{
  const ReturnSeries returns = makeNormalReturnSeries(945, 0.0015, 0.01, 31);

  DataSplitConfig dataSplit;
  dataSplit.trainBounds = returns.boundsForIndexRange(0, 20);
  dataSplit.validationBounds = returns.boundsForIndexRange(20, 40);
  dataSplit.testBounds = returns.boundsForIndexRange(40, 60);

  BootstrapConfig bootstrap;
  bootstrap.iterations = 200;
  ValidatorConfiguration configuration(dataSplit, WalkForwardConfig(), BonferroniConfig(), bootstrap,
                                       baseline::BaselineConfig(), seededOrchestration());
  ValidationOrchestrator orchestrator(configuration, makeAnnualizedSharpeMetric(), nullptr);

  auto evaluator = std::make_shared<CallbackPeriodEvaluator>([](const date&, const date&) { return 1.4; });
  std::ostringstream os;

  CandidateReport report = orchestrator.runCandidate(makeCandidate("callback", returns, evaluator), 1, os);

  const auto& split = std::get<DataSplitResult>(*report.findResult("data_split"));
  REQUIRE(split.getStatus() == ValidationStatus::InsufficientData);
  REQUIRE(split.getReason().find("20 observations") != std::string::npos);
  REQUIRE_FALSE(split.passed());
}

TEST_CASE("Seeded runs are reproducible", "[ValidationOrchestrator]")
{
  const ReturnSeries returns = makeNormalReturnSeries(600, 0.001, 0.01, 77);
  std::ostringstream os;

  ValidationOrchestrator sequential(makeConfiguration(seededOrchestration()), makeAnnualizedSharpeMetric(), nullptr);
  CandidateReport first = sequential.runCandidate(makeCandidate("repeat", returns), 1, os);
  CandidateReport second = sequential.runCandidate(makeCandidate("repeat", returns), 1, os);

  REQUIRE(bootstrapOf(first).getDetails().ciLower == bootstrapOf(second).getDetails().ciLower);
  REQUIRE(bootstrapOf(first).getDetails().ciUpper == bootstrapOf(second).getDetails().ciUpper);

  SECTION("parallel validators give the same results")
  {
    OrchestrationConfig orchestration = seededOrchestration();
    orchestration.parallelValidators = true;
    ValidationOrchestrator parallel(makeConfiguration(orchestration), makeAnnualizedSharpeMetric(), nullptr);

    CandidateReport threaded = parallel.runCandidate(makeCandidate("repeat", returns), 1, os);

    REQUIRE(threaded.getResults().size() == first.getResults().size());
    REQUIRE(bootstrapOf(threaded).getDetails().ciLower == bootstrapOf(first).getDetails().ciLower);
    for (const char* name : {"data_split", "walk_forward", "bonferroni", "bootstrap", "baseline"})
      REQUIRE(getStatus(*threaded.findResult(name)) == getStatus(*first.findResult(name)));
  }

  SECTION("candidates with different ids get different seeds")
  {
    CandidateReport other = sequential.runCandidate(makeCandidate("other", returns), 1, os);
    REQUIRE(bootstrapOf(other).getDetails().pointEstimate == bootstrapOf(first).getDetails().pointEstimate);
    REQUIRE(bootstrapOf(other).getDetails().ciLower != bootstrapOf(first).getDetails().ciLower);
  }
}

TEST_CASE("Threaded batches match sequential batches", "[ValidationOrchestrator]")
{
  std::vector<StrategyCandidate> candidates;
  for (int i = 0; i < 6; ++i)
    candidates.push_back(makeCandidate("s" + std::to_string(i), makeNormalReturnSeries(400, 0.001, 0.01, 100 + i)));

  OrchestrationConfig threadedConfig = seededOrchestration();
  threadedConfig.numThreads = 4;

  ValidationOrchestrator sequential(makeConfiguration(seededOrchestration()), makeAnnualizedSharpeMetric(), nullptr);
  ValidationOrchestrator threaded(makeConfiguration(threadedConfig), makeAnnualizedSharpeMetric(), nullptr);
  std::ostringstream os;

  BatchReport a = sequential.runBatch(candidates, os);
  BatchReport b = threaded.runBatch(candidates, os);

  REQUIRE(a.candidates.size() == b.candidates.size());
  for (std::size_t i = 0; i < a.candidates.size(); ++i)
    {
      REQUIRE(a.candidates[i].getCandidateId() == b.candidates[i].getCandidateId());
      REQUIRE(bootstrapOf(a.candidates[i]).getDetails().ciLower ==
              bootstrapOf(b.candidates[i]).getDetails().ciLower);
      REQUIRE(a.candidates[i].passedCount() == b.candidates[i].passedCount());
    }

  REQUIRE(a.correction.significantStrategies == b.correction.significantStrategies);
}

TEST_CASE("Baseline cache is shared by the candidates of a batch", "[ValidationOrchestrator]")
{
  auto simulator = std::make_shared<ConstantSimulator>(0.3);
  ValidationOrchestrator orchestrator(makeConfiguration(seededOrchestration()),
                                      makeAnnualizedSharpeMetric(),
                                      simulator);
  std::ostringstream os;

  // Same calendar, so every candidate compares over the same horizon
  std::vector<StrategyCandidate> candidates = {
    makeCandidate("a", makeNormalReturnSeries(300, 0.001, 0.01, 1)),
    makeCandidate("b", makeNormalReturnSeries(300, 0.002, 0.01, 2)),
    makeCandidate("c", makeNormalReturnSeries(300, 0.0005, 0.01, 3))
  };

  BatchReport batch = orchestrator.runBatch(candidates, os);

  REQUIRE(simulator->getCalls() == 3);
  REQUIRE(orchestrator.getBaselineCache().size() == 3);
  for (const auto& report : batch.candidates)
    REQUIRE(std::get<BaselineComparisonResult>(*report.findResult("baseline")).getDetails().availableCount == 3);
}

TEST_CASE("Orchestrator rejects invalid configuration", "[ValidationOrchestrator]")
{
  WalkForwardConfig walkForward;
  walkForward.stepSize = 0;
  ValidatorConfiguration invalid(DataSplitConfig(), walkForward, BonferroniConfig(), BootstrapConfig(),
                                 baseline::BaselineConfig(), OrchestrationConfig());

  REQUIRE_THROWS_AS(ValidationOrchestrator(invalid, makeAnnualizedSharpeMetric(), nullptr),
                    ValidatorConfigurationException);
  REQUIRE_THROWS_AS(ValidationOrchestrator(ValidatorConfiguration::createDefault(), MetricFunction(), nullptr),
                    ValidatorConfigurationException);
}
