#include "ValidationReportWriter.h"
#include <cmath>
#include <map>
#include <type_traits>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;

namespace stratvalidator
{
namespace reporting
{

using namespace validation;

namespace
{
    const char* const kValidatorNames[] = {
        "data_split", "walk_forward", "bonferroni", "bootstrap", "baseline"
    };

    Value number(double value)
    {
        if (!std::isfinite(value))
            return Value(kNullType);

        return Value(value);
    }

    Value number(const std::optional<double>& value)
    {
        if (!value)
            return Value(kNullType);

        return number(*value);
    }

    Value jsonString(const std::string& text, Document::AllocatorType& allocator)
    {
        return Value(text.c_str(), allocator);
    }

    Value period(const std::optional<PeriodBounds>& bounds, Document::AllocatorType& allocator)
    {
        if (!bounds)
            return Value(kNullType);

        Value value(kObjectType);
        value.AddMember("start", jsonString(boost::gregorian::to_iso_extended_string(bounds->getStartDate()), allocator), allocator);
        value.AddMember("end", jsonString(boost::gregorian::to_iso_extended_string(bounds->getEndDate()), allocator), allocator);
        return value;
    }

    void addDataSplitFields(Value& value, const DataSplitDetails& d, Document::AllocatorType& allocator)
    {
        value.AddMember("consistency", number(d.consistency), allocator);
        value.AddMember("train", number(d.trainMetric), allocator);
        value.AddMember("val", number(d.validationMetric), allocator);
        value.AddMember("test", number(d.testMetric), allocator);
        value.AddMember("degradation_ratio", number(d.degradationRatio), allocator);
        value.AddMember("train_period", period(d.trainBounds, allocator), allocator);
        value.AddMember("validation_period", period(d.validationBounds, allocator), allocator);
        value.AddMember("test_period", period(d.testBounds, allocator), allocator);
        value.AddMember("test_criterion_met", d.testCriterionMet, allocator);
        value.AddMember("consistency_criterion_met", d.consistencyCriterionMet, allocator);
        value.AddMember("degradation_criterion_met", d.degradationCriterionMet, allocator);
    }

    void addWalkForwardFields(Value& value, const WalkForwardDetails& d, Document::AllocatorType& allocator)
    {
        const bool evaluated = d.windowsEvaluated > 0;

        value.AddMember("mean_sharpe", evaluated ? number(d.meanMetric) : Value(kNullType), allocator);
        value.AddMember("std_sharpe", evaluated ? number(d.stdDevMetric) : Value(kNullType), allocator);
        value.AddMember("win_rate", evaluated ? number(d.winRate) : Value(kNullType), allocator);
        value.AddMember("worst_sharpe", evaluated ? number(d.worstMetric) : Value(kNullType), allocator);
        value.AddMember("best_sharpe", evaluated ? number(d.bestMetric) : Value(kNullType), allocator);
        value.AddMember("n_windows", static_cast<uint64_t>(d.windowsEvaluated), allocator);
        value.AddMember("windows_generated", static_cast<uint64_t>(d.windowsGenerated), allocator);

        Value windows(kArrayType);
        for (const auto& evaluation : d.windows)
        {
            const WalkForwardWindow& w = evaluation.window;
            Value window(kObjectType);
            window.AddMember("index", static_cast<uint64_t>(w.index), allocator);
            window.AddMember("train_period", period(w.trainBounds, allocator), allocator);
            window.AddMember("test_period", period(w.testBounds, allocator), allocator);
            window.AddMember("metric", number(evaluation.metric), allocator);
            if (!evaluation.error.empty())
                window.AddMember("error", jsonString(evaluation.error, allocator), allocator);
            windows.PushBack(window, allocator);
        }
        value.AddMember("windows", windows, allocator);
    }

    void addBonferroniFields(Value& value, const BonferroniDetails& d, Document::AllocatorType& allocator)
    {
        const CorrectionContext& c = d.context;
        value.AddMember("num_strategies", static_cast<uint64_t>(c.numStrategies), allocator);
        value.AddMember("alpha", number(c.familyWiseAlpha), allocator);
        value.AddMember("adjusted_alpha", number(c.adjustedAlpha), allocator);
        value.AddMember("threshold", number(c.appliedThreshold), allocator);
        value.AddMember("threshold_mode", jsonString(analysis::toString(c.mode), allocator), allocator);
        value.AddMember("parametric_threshold", number(c.parametricThreshold), allocator);
        value.AddMember("bootstrap_threshold", number(c.bootstrapThreshold), allocator);
        value.AddMember("threshold_divergence", number(c.thresholdDivergence), allocator);
        value.AddMember("conservative_floor", number(c.conservativeFloor), allocator);
        value.AddMember("num_periods", static_cast<uint64_t>(c.numPeriods), allocator);
        value.AddMember("significant", d.significant, allocator);

        if (d.ciLowerClearsThreshold)
            value.AddMember("ci_lower_clears_threshold", *d.ciLowerClearsThreshold, allocator);
        else
            value.AddMember("ci_lower_clears_threshold", Value(kNullType), allocator);
    }

    void addBootstrapFields(Value& value, const BootstrapDetails& d, Document::AllocatorType& allocator)
    {
        const bool computed = d.iterationsRequested > 0;

        value.AddMember("point_estimate", computed ? number(d.pointEstimate) : Value(kNullType), allocator);
        value.AddMember("ci_lower", computed ? number(d.ciLower) : Value(kNullType), allocator);
        value.AddMember("ci_upper", computed ? number(d.ciUpper) : Value(kNullType), allocator);
        value.AddMember("confidence_level", number(d.confidenceLevel), allocator);
        value.AddMember("iterations_requested", static_cast<uint64_t>(d.iterationsRequested), allocator);
        value.AddMember("iterations_used", static_cast<uint64_t>(d.iterationsUsed), allocator);
        value.AddMember("block_length", static_cast<uint64_t>(d.blockLength), allocator);
        value.AddMember("n_observations", static_cast<uint64_t>(d.numObservations), allocator);
        value.AddMember("standard_error", computed ? number(d.standardError) : Value(kNullType), allocator);
        value.AddMember("excludes_zero", d.excludesZero, allocator);
    }

    void addBaselineFields(Value& value, const BaselineComparisonDetails& d, Document::AllocatorType& allocator)
    {
        value.AddMember("candidate_metric", number(d.candidateMetric), allocator);
        value.AddMember("best_alpha", number(d.bestAlpha), allocator);
        value.AddMember("worst_alpha", number(d.worstAlpha), allocator);

        if (d.bestBaseline)
            value.AddMember("best_baseline", jsonString(baseline::toString(*d.bestBaseline), allocator), allocator);
        else
            value.AddMember("best_baseline", Value(kNullType), allocator);

        value.AddMember("available_count", static_cast<uint64_t>(d.availableCount), allocator);
        value.AddMember("horizon", period(d.bounds, allocator), allocator);
        value.AddMember("underperformance_guard_triggered", d.underperformanceGuardTriggered, allocator);

        Value baselines(kObjectType);
        for (const auto& outcome : d.baselines)
        {
            Value entry(kObjectType);
            entry.AddMember("available", outcome.record.has_value(), allocator);
            if (outcome.record)
            {
                entry.AddMember("sharpe", number(outcome.record->getSharpeRatio()), allocator);
                entry.AddMember("annual_return", number(outcome.record->getAnnualizedReturn()), allocator);
                entry.AddMember("max_drawdown", number(outcome.record->getMaxDrawdown()), allocator);
                entry.AddMember("n_periods", static_cast<uint64_t>(outcome.record->getNumPeriods()), allocator);
                entry.AddMember("alpha", number(outcome.alpha), allocator);
            }
            else
            {
                entry.AddMember("error", jsonString(outcome.error, allocator), allocator);
            }

            baselines.AddMember(jsonString(baseline::toString(outcome.id), allocator), entry, allocator);
        }
        value.AddMember("baselines", baselines, allocator);
    }
}

Value ValidationReportWriter::serializeResult(const ValidationResult& result, Allocator& allocator)
{
    const ValidationRecord& record = getRecord(result);

    Value value(kObjectType);
    value.AddMember("pass", record.passed(), allocator);
    value.AddMember("status", jsonString(toString(record.getStatus()), allocator), allocator);
    value.AddMember("reason", jsonString(record.getReason(), allocator), allocator);
    value.AddMember("metric_value", number(record.getMetricValue()), allocator);

    std::visit([&value, &allocator](const auto& r) {
        using T = std::decay_t<decltype(r)>;

        if constexpr (std::is_same_v<T, DataSplitResult>)
            addDataSplitFields(value, r.getDetails(), allocator);
        else if constexpr (std::is_same_v<T, WalkForwardResult>)
            addWalkForwardFields(value, r.getDetails(), allocator);
        else if constexpr (std::is_same_v<T, BonferroniResult>)
            addBonferroniFields(value, r.getDetails(), allocator);
        else if constexpr (std::is_same_v<T, BootstrapResult>)
            addBootstrapFields(value, r.getDetails(), allocator);
        else
            addBaselineFields(value, r.getDetails(), allocator);
    }, result);

    return value;
}

Value ValidationReportWriter::serializeOverallStatus(const CandidateReport& report, Allocator& allocator)
{
    const std::size_t total = report.getResults().size();
    const std::size_t passedCount = report.passedCount();

    Value status(kObjectType);
    status.AddMember("overall_passed", report.overallPassed(), allocator);
    status.AddMember("total_validations", static_cast<uint64_t>(total), allocator);
    status.AddMember("passed_count", static_cast<uint64_t>(passedCount), allocator);
    status.AddMember("failed_count", static_cast<uint64_t>(report.failedCount()), allocator);
    status.AddMember("pass_rate",
                     total > 0 ? Value(static_cast<double>(passedCount) / static_cast<double>(total)) : Value(0.0),
                     allocator);

    Value failures(kArrayType);
    for (const auto& result : report.getResults())
        if (!passed(result))
            failures.PushBack(jsonString(validatorName(result), allocator), allocator);
    status.AddMember("failures", failures, allocator);

    return status;
}

Value ValidationReportWriter::serializeCandidate(const CandidateReport& report, Allocator& allocator)
{
    Value value(kObjectType);
    value.AddMember("candidate_id", jsonString(report.getCandidateId(), allocator), allocator);
    value.AddMember("candidate_metric", number(report.getCandidateMetric()), allocator);
    value.AddMember("aborted", report.isAborted(), allocator);
    if (report.isAborted())
        value.AddMember("abort_reason", jsonString(report.getAbortReason(), allocator), allocator);

    for (const auto& result : report.getResults())
        value.AddMember(jsonString(validatorName(result), allocator), serializeResult(result, allocator), allocator);

    value.AddMember("overall_status", serializeOverallStatus(report, allocator), allocator);
    return value;
}

Value ValidationReportWriter::serializeBatchSummary(const BatchReport& batch, Allocator& allocator)
{
    std::size_t passedCandidates = 0;
    std::size_t abortedCandidates = 0;
    std::map<std::string, std::size_t> validatorPasses;

    for (const auto& report : batch.candidates)
    {
        if (report.overallPassed())
            ++passedCandidates;
        if (report.isAborted())
            ++abortedCandidates;

        for (const auto& result : report.getResults())
            if (passed(result))
                ++validatorPasses[validatorName(result)];
    }

    const std::size_t total = batch.candidates.size();

    Value summary(kObjectType);
    summary.AddMember("total_candidates", static_cast<uint64_t>(total), allocator);
    summary.AddMember("passed_candidates", static_cast<uint64_t>(passedCandidates), allocator);
    summary.AddMember("failed_candidates", static_cast<uint64_t>(total - passedCandidates), allocator);
    summary.AddMember("aborted_candidates", static_cast<uint64_t>(abortedCandidates), allocator);
    summary.AddMember("overall_pass_rate",
                      total > 0 ? Value(static_cast<double>(passedCandidates) / static_cast<double>(total)) : Value(0.0),
                      allocator);

    Value breakdown(kObjectType);
    for (const char* name : kValidatorNames)
        breakdown.AddMember(StringRef(name), static_cast<uint64_t>(validatorPasses[name]), allocator);
    summary.AddMember("validator_pass_counts", breakdown, allocator);

    const analysis::StrategySetCorrection& c = batch.correction;
    Value correction(kObjectType);
    correction.AddMember("total_strategies", static_cast<uint64_t>(c.totalStrategies), allocator);
    correction.AddMember("significant_count", static_cast<uint64_t>(c.significantCount), allocator);
    correction.AddMember("adjusted_alpha", number(c.adjustedAlpha), allocator);
    correction.AddMember("expected_false_discoveries", number(c.expectedFalseDiscoveries), allocator);
    correction.AddMember("estimated_fdr", number(c.estimatedFalseDiscoveryRate), allocator);
    correction.AddMember("family_wise_error_rate", number(c.familyWiseErrorRate), allocator);

    Value significant(kArrayType);
    for (const auto& id : c.significantStrategies)
        significant.PushBack(jsonString(id, allocator), allocator);
    correction.AddMember("significant_strategies", significant, allocator);
    summary.AddMember("strategy_set_correction", correction, allocator);

    return summary;
}

std::string ValidationReportWriter::toJsonString(const CandidateReport& report)
{
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value candidate = serializeCandidate(report, allocator);
    for (auto it = candidate.MemberBegin(); it != candidate.MemberEnd(); ++it)
        doc.AddMember(it->name, it->value, allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
}

std::string ValidationReportWriter::toJsonString(const BatchReport& batch)
{
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value candidates(kArrayType);
    for (const auto& report : batch.candidates)
        candidates.PushBack(serializeCandidate(report, allocator), allocator);
    doc.AddMember("candidates", candidates, allocator);
    doc.AddMember("summary", serializeBatchSummary(batch, allocator), allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
}

} // namespace reporting
} // namespace stratvalidator
