// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <fstream>
#include <iterator>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "ValidatorConfiguration.h"

using namespace rapidjson;

namespace stratvalidator
{
  using validation::BonferroniConfig;
  using validation::BootstrapConfig;
  using validation::DataSplitConfig;
  using validation::WalkForwardConfig;
  using baseline::BaselineConfig;

  static const Value* getSection(const Value& root, const char* name)
  {
    if (!root.HasMember(name))
      return nullptr;

    const Value& section = root[name];
    if (!section.IsObject())
      throw ValidatorConfigurationException(std::string("Configuration section '") + name + "' must be an object");

    return &section;
  }

  static void readDouble(const Value& section, const char* key, double& target)
  {
    if (!section.HasMember(key))
      return;

    if (!section[key].IsNumber())
      throw ValidatorConfigurationException(std::string("Configuration key '") + key + "' must be a number");

    target = section[key].GetDouble();
  }

  static void readSize(const Value& section, const char* key, std::size_t& target)
  {
    if (!section.HasMember(key))
      return;

    if (!section[key].IsUint64())
      throw ValidatorConfigurationException(std::string("Configuration key '") + key +
					    "' must be a non-negative integer");

    target = static_cast<std::size_t>(section[key].GetUint64());
  }

  static void readBool(const Value& section, const char* key, bool& target)
  {
    if (!section.HasMember(key))
      return;

    if (!section[key].IsBool())
      throw ValidatorConfigurationException(std::string("Configuration key '") + key + "' must be a boolean");

    target = section[key].GetBool();
  }

  static std::string readString(const Value& section, const char* key)
  {
    if (!section[key].IsString())
      throw ValidatorConfigurationException(std::string("Configuration key '") + key + "' must be a string");

    return section[key].GetString();
  }

  static boost::gregorian::date parseDate(const std::string& text)
  {
    try
      {
	boost::gregorian::date d = boost::gregorian::from_string(text);
	if (d.is_special())
	  throw ValidatorConfigurationException("Invalid date: " + text);
	return d;
      }
    catch (const ValidatorConfigurationException&)
      {
	throw;
      }
    catch (const std::exception& e)
      {
	throw ValidatorConfigurationException("Invalid date '" + text + "': " + e.what());
      }
  }

  static void readBounds(const Value& section, const char* key, std::optional<PeriodBounds>& target)
  {
    if (!section.HasMember(key))
      return;

    const Value& bounds = section[key];
    if (!bounds.IsObject() || !bounds.HasMember("start") || !bounds.HasMember("end"))
      throw ValidatorConfigurationException(std::string("Configuration key '") + key +
					    "' must be an object with 'start' and 'end'");

    try
      {
	target = PeriodBounds(parseDate(readString(bounds, "start")), parseDate(readString(bounds, "end")));
      }
    catch (const PeriodBoundsException& e)
      {
	throw ValidatorConfigurationException(std::string("Configuration key '") + key + "': " + e.what());
      }
  }

  static void readDataSplit(const Value& section, DataSplitConfig& config)
  {
    readBounds(section, "train", config.trainBounds);
    readBounds(section, "validation", config.validationBounds);
    readBounds(section, "test", config.testBounds);
    readDouble(section, "min_test_metric", config.minTestMetric);
    readDouble(section, "min_consistency", config.minConsistency);
    readDouble(section, "min_degradation_ratio", config.minDegradationRatio);
    readDouble(section, "consistency_epsilon", config.consistencyEpsilon);
    readSize(section, "min_observations_per_period", config.minObservationsPerPeriod);
  }

  static void readWalkForward(const Value& section, WalkForwardConfig& config)
  {
    readSize(section, "train_length", config.trainLength);
    readSize(section, "test_length", config.testLength);
    readSize(section, "step_size", config.stepSize);
    readSize(section, "min_windows", config.minWindows);
    readDouble(section, "min_mean_metric", config.minMeanMetric);
    readDouble(section, "min_win_rate", config.minWinRate);
    readDouble(section, "min_worst_metric", config.minWorstMetric);
    readDouble(section, "max_std_dev", config.maxStdDev);
  }

  static void readBonferroni(const Value& section, BonferroniConfig& config)
  {
    if (section.HasMember("num_strategies"))
      {
	std::size_t n = 0;
	readSize(section, "num_strategies", n);
	config.numStrategies = n;
      }

    readDouble(section, "alpha", config.familyWiseAlpha);
    readDouble(section, "conservative_floor", config.conservativeFloor);

    if (section.HasMember("threshold_mode"))
      {
	const std::string mode = readString(section, "threshold_mode");
	if (mode == analysis::toString(analysis::ThresholdMode::Parametric))
	  config.mode = analysis::ThresholdMode::Parametric;
	else if (mode == analysis::toString(analysis::ThresholdMode::Bootstrap))
	  config.mode = analysis::ThresholdMode::Bootstrap;
	else
	  throw ValidatorConfigurationException("Unknown threshold mode: " + mode);
      }

    readSize(section, "null_iterations", config.nullSettings.iterations);
    readSize(section, "null_block_length", config.nullSettings.blockLength);
    readDouble(section, "annual_volatility", config.nullSettings.annualVolatility);
    readDouble(section, "periods_per_year", config.nullSettings.periodsPerYear);
    readDouble(section, "max_failure_fraction", config.nullSettings.maxFailureFraction);
    readDouble(section, "divergence_warning", config.divergenceWarning);
  }

  static void readBootstrap(const Value& section, BootstrapConfig& config)
  {
    readSize(section, "iterations", config.iterations);
    readSize(section, "block_length", config.blockLength);
    readDouble(section, "confidence_level", config.confidenceLevel);
    readSize(section, "min_observations", config.minObservations);
    readDouble(section, "max_failure_fraction", config.maxFailureFraction);
    readDouble(section, "min_lower_bound", config.minLowerBound);
    readBool(section, "parallel_replicates", config.parallelReplicates);
  }

  static void readBaseline(const Value& section, BaselineConfig& config)
  {
    if (section.HasMember("baselines"))
      {
	const Value& names = section["baselines"];
	if (!names.IsArray())
	  throw ValidatorConfigurationException("Configuration key 'baselines' must be an array");

	config.baselines.clear();
	for (SizeType i = 0; i < names.Size(); ++i)
	  {
	    if (!names[i].IsString())
	      throw ValidatorConfigurationException("Configuration key 'baselines' must hold strings");

	    try
	      {
		config.baselines.push_back(baseline::baselineIdFromString(names[i].GetString()));
	      }
	    catch (const std::invalid_argument& e)
	      {
		throw ValidatorConfigurationException(e.what());
	      }
	  }
      }

    readDouble(section, "min_alpha", config.minAlpha);
    readBool(section, "underperformance_guard", config.underperformanceGuard);
    readDouble(section, "max_underperformance", config.maxUnderperformance);
    readSize(section, "lookback_periods", config.lookbackPeriods);
  }

  static void readOrchestration(const Value& section, OrchestrationConfig& config)
  {
    readSize(section, "num_threads", config.numThreads);
    readBool(section, "parallel_validators", config.parallelValidators);
    readSize(section, "max_evaluations_per_candidate", config.maxEvaluationsPerCandidate);

    if (section.HasMember("seed"))
      {
	if (section["seed"].IsNull())
	  config.seed.reset();
	else if (section["seed"].IsUint64())
	  config.seed = section["seed"].GetUint64();
	else
	  throw ValidatorConfigurationException("Configuration key 'seed' must be a non-negative integer or null");
      }
  }

  void ValidatorConfiguration::validate() const
  {
    try
      {
	validation::DataSplitValidator dataSplit(mDataSplit);
	validation::WalkForwardAnalyzer walkForward(mWalkForward);
	validation::BootstrapValidator bootstrap(mBootstrap, makeAnnualizedSharpeMetric());
	validation::BonferroniValidator bonferroni(mBonferroni.numStrategies.value_or(1), mBonferroni);
      }
    catch (const std::invalid_argument& e)
      {
	throw ValidatorConfigurationException(e.what());
      }

    if (mBaseline.baselines.empty())
      throw ValidatorConfigurationException("Baseline comparison needs at least one baseline");

    if (mBonferroni.mode == analysis::ThresholdMode::Bootstrap &&
	(mBonferroni.nullSettings.iterations == 0 || mBonferroni.nullSettings.blockLength == 0 ||
	 !(mBonferroni.nullSettings.annualVolatility > 0.0) ||
	 !(mBonferroni.nullSettings.periodsPerYear > 0.0)))
      throw ValidatorConfigurationException("Bootstrap null settings need positive iterations, block length, "
					    "volatility and periods per year");
  }

  ValidatorConfigurationFileReader::ValidatorConfigurationFileReader (const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  ValidatorConfiguration ValidatorConfigurationFileReader::readConfigurationFile() const
  {
    if (!boost::filesystem::exists(mConfigurationFileName))
      throw ValidatorConfigurationException("Configuration file not found: " + mConfigurationFileName);

    std::ifstream file(mConfigurationFileName);
    if (!file.is_open())
      throw ValidatorConfigurationException("Cannot open configuration file: " + mConfigurationFileName);

    std::string jsonStr((std::istreambuf_iterator<char>(file)),
			std::istreambuf_iterator<char>());

    return fromString(jsonStr);
  }

  ValidatorConfiguration ValidatorConfigurationFileReader::fromString(const std::string& json)
  {
    Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError())
      throw ValidatorConfigurationException("Configuration JSON parse error at offset " +
					    std::to_string(doc.GetErrorOffset()));

    if (!doc.IsObject())
      throw ValidatorConfigurationException("Configuration JSON must be an object");

    DataSplitConfig dataSplit;
    WalkForwardConfig walkForward;
    BonferroniConfig bonferroni;
    BootstrapConfig bootstrap;
    BaselineConfig baselineConfig;
    OrchestrationConfig orchestration;

    if (const Value* section = getSection(doc, "data_split"))
      readDataSplit(*section, dataSplit);
    if (const Value* section = getSection(doc, "walk_forward"))
      readWalkForward(*section, walkForward);
    if (const Value* section = getSection(doc, "bonferroni"))
      readBonferroni(*section, bonferroni);
    if (const Value* section = getSection(doc, "bootstrap"))
      readBootstrap(*section, bootstrap);
    if (const Value* section = getSection(doc, "baseline"))
      readBaseline(*section, baselineConfig);
    if (const Value* section = getSection(doc, "orchestration"))
      readOrchestration(*section, orchestration);

    ValidatorConfiguration configuration(dataSplit, walkForward, bonferroni, bootstrap,
					 baselineConfig, orchestration);
    configuration.validate();
    return configuration;
  }

  static Value serializeBounds(const PeriodBounds& bounds, Document::AllocatorType& allocator)
  {
    Value value(kObjectType);
    value.AddMember("start", Value(boost::gregorian::to_iso_extended_string(bounds.getStartDate()).c_str(), allocator), allocator);
    value.AddMember("end", Value(boost::gregorian::to_iso_extended_string(bounds.getEndDate()).c_str(), allocator), allocator);
    return value;
  }

  std::string ValidatorConfigurationFileReader::toJsonString(const ValidatorConfiguration& configuration)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    const DataSplitConfig& ds = configuration.getDataSplitConfig();
    Value dataSplit(kObjectType);
    if (ds.trainBounds)
      dataSplit.AddMember("train", serializeBounds(*ds.trainBounds, allocator), allocator);
    if (ds.validationBounds)
      dataSplit.AddMember("validation", serializeBounds(*ds.validationBounds, allocator), allocator);
    if (ds.testBounds)
      dataSplit.AddMember("test", serializeBounds(*ds.testBounds, allocator), allocator);
    dataSplit.AddMember("min_test_metric", ds.minTestMetric, allocator);
    dataSplit.AddMember("min_consistency", ds.minConsistency, allocator);
    dataSplit.AddMember("min_degradation_ratio", ds.minDegradationRatio, allocator);
    dataSplit.AddMember("consistency_epsilon", ds.consistencyEpsilon, allocator);
    dataSplit.AddMember("min_observations_per_period", static_cast<uint64_t>(ds.minObservationsPerPeriod), allocator);
    doc.AddMember("data_split", dataSplit, allocator);

    const WalkForwardConfig& wf = configuration.getWalkForwardConfig();
    Value walkForward(kObjectType);
    walkForward.AddMember("train_length", static_cast<uint64_t>(wf.trainLength), allocator);
    walkForward.AddMember("test_length", static_cast<uint64_t>(wf.testLength), allocator);
    walkForward.AddMember("step_size", static_cast<uint64_t>(wf.stepSize), allocator);
    walkForward.AddMember("min_windows", static_cast<uint64_t>(wf.minWindows), allocator);
    walkForward.AddMember("min_mean_metric", wf.minMeanMetric, allocator);
    walkForward.AddMember("min_win_rate", wf.minWinRate, allocator);
    walkForward.AddMember("min_worst_metric", wf.minWorstMetric, allocator);
    walkForward.AddMember("max_std_dev", wf.maxStdDev, allocator);
    doc.AddMember("walk_forward", walkForward, allocator);

    const BonferroniConfig& bf = configuration.getBonferroniConfig();
    Value bonferroni(kObjectType);
    if (bf.numStrategies)
      bonferroni.AddMember("num_strategies", static_cast<uint64_t>(*bf.numStrategies), allocator);
    bonferroni.AddMember("alpha", bf.familyWiseAlpha, allocator);
    bonferroni.AddMember("conservative_floor", bf.conservativeFloor, allocator);
    bonferroni.AddMember("threshold_mode", Value(analysis::toString(bf.mode).c_str(), allocator), allocator);
    bonferroni.AddMember("null_iterations", static_cast<uint64_t>(bf.nullSettings.iterations), allocator);
    bonferroni.AddMember("null_block_length", static_cast<uint64_t>(bf.nullSettings.blockLength), allocator);
    bonferroni.AddMember("annual_volatility", bf.nullSettings.annualVolatility, allocator);
    bonferroni.AddMember("periods_per_year", bf.nullSettings.periodsPerYear, allocator);
    bonferroni.AddMember("max_failure_fraction", bf.nullSettings.maxFailureFraction, allocator);
    bonferroni.AddMember("divergence_warning", bf.divergenceWarning, allocator);
    doc.AddMember("bonferroni", bonferroni, allocator);

    const BootstrapConfig& bs = configuration.getBootstrapConfig();
    Value bootstrap(kObjectType);
    bootstrap.AddMember("iterations", static_cast<uint64_t>(bs.iterations), allocator);
    bootstrap.AddMember("block_length", static_cast<uint64_t>(bs.blockLength), allocator);
    bootstrap.AddMember("confidence_level", bs.confidenceLevel, allocator);
    bootstrap.AddMember("min_observations", static_cast<uint64_t>(bs.minObservations), allocator);
    bootstrap.AddMember("max_failure_fraction", bs.maxFailureFraction, allocator);
    bootstrap.AddMember("min_lower_bound", bs.minLowerBound, allocator);
    bootstrap.AddMember("parallel_replicates", bs.parallelReplicates, allocator);
    doc.AddMember("bootstrap", bootstrap, allocator);

    const BaselineConfig& bl = configuration.getBaselineConfig();
    Value baselineValue(kObjectType);
    Value names(kArrayType);
    for (baseline::BaselineId id : bl.baselines)
      names.PushBack(Value(baseline::toString(id).c_str(), allocator), allocator);
    baselineValue.AddMember("baselines", names, allocator);
    baselineValue.AddMember("min_alpha", bl.minAlpha, allocator);
    baselineValue.AddMember("underperformance_guard", bl.underperformanceGuard, allocator);
    baselineValue.AddMember("max_underperformance", bl.maxUnderperformance, allocator);
    baselineValue.AddMember("lookback_periods", static_cast<uint64_t>(bl.lookbackPeriods), allocator);
    doc.AddMember("baseline", baselineValue, allocator);

    const OrchestrationConfig& oc = configuration.getOrchestrationConfig();
    Value orchestration(kObjectType);
    orchestration.AddMember("num_threads", static_cast<uint64_t>(oc.numThreads), allocator);
    orchestration.AddMember("parallel_validators", oc.parallelValidators, allocator);
    orchestration.AddMember("max_evaluations_per_candidate", static_cast<uint64_t>(oc.maxEvaluationsPerCandidate), allocator);
    if (oc.seed)
      orchestration.AddMember("seed", static_cast<uint64_t>(*oc.seed), allocator);
    else
      orchestration.AddMember("seed", Value(kNullType), allocator);
    doc.AddMember("orchestration", orchestration, allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
  }
}
