#pragma once

#include <string>
#include <rapidjson/document.h>
#include "ValidationOrchestrator.h"

namespace stratvalidator
{
namespace reporting
{

/**
 * @brief Serializes validation reports to JSON.
 *
 * A candidate report is an object with one member per validator that ran
 * ("data_split", "walk_forward", "bonferroni", "bootstrap", "baseline").
 * Each carries "pass", "status", "reason" and "metric_value" (null when
 * absent) plus its validator specific fields, followed by "overall_status".
 * Non-finite numbers are written as null.
 */
class ValidationReportWriter
{
public:
    static std::string toJsonString(const validation::CandidateReport& report);

    static std::string toJsonString(const validation::BatchReport& batch);

private:
    using Allocator = rapidjson::Document::AllocatorType;

    static rapidjson::Value serializeCandidate(const validation::CandidateReport& report,
                                               Allocator& allocator);

    static rapidjson::Value serializeResult(const validation::ValidationResult& result,
                                            Allocator& allocator);

    static rapidjson::Value serializeOverallStatus(const validation::CandidateReport& report,
                                                   Allocator& allocator);

    static rapidjson::Value serializeBatchSummary(const validation::BatchReport& batch,
                                                  Allocator& allocator);
};

} // namespace reporting
} // namespace stratvalidator
