// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include "BaselineComparator.h"
#include "BonferroniValidator.h"
#include "BootstrapValidator.h"
#include "DataSplitValidator.h"
#include "PerformanceMetrics.h"
#include "WalkForwardAnalyzer.h"

namespace stratvalidator
{
  class ValidatorConfigurationException : public std::runtime_error
  {
  public:
  ValidatorConfigurationException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~ValidatorConfigurationException()
      {}
  };

  struct OrchestrationConfig
  {
    std::size_t numThreads = 1;                   // candidates validated concurrently, 0 = hardware
    bool parallelValidators = false;              // run one candidate's validators concurrently
    std::size_t maxEvaluationsPerCandidate = 0;   // period evaluations per candidate, 0 = unlimited
    std::optional<uint64_t> seed;                 // empty = nondeterministic
  };

  /**
   * @brief Complete configuration of one validation run.
   *
   * Holds one config block per validator plus the orchestration settings.
   * Every field has a default, so createDefault() is a valid configuration.
   */
  class ValidatorConfiguration
  {
  public:
    ValidatorConfiguration(const validation::DataSplitConfig& dataSplit,
			   const validation::WalkForwardConfig& walkForward,
			   const validation::BonferroniConfig& bonferroni,
			   const validation::BootstrapConfig& bootstrap,
			   const baseline::BaselineConfig& baseline,
			   const OrchestrationConfig& orchestration)
      : mDataSplit(dataSplit),
	mWalkForward(walkForward),
	mBonferroni(bonferroni),
	mBootstrap(bootstrap),
	mBaseline(baseline),
	mOrchestration(orchestration)
    {}

    static ValidatorConfiguration createDefault()
    {
      return ValidatorConfiguration(validation::DataSplitConfig(),
				    validation::WalkForwardConfig(),
				    validation::BonferroniConfig(),
				    validation::BootstrapConfig(),
				    baseline::BaselineConfig(),
				    OrchestrationConfig());
    }

    const validation::DataSplitConfig& getDataSplitConfig() const
    {
      return mDataSplit;
    }

    const validation::WalkForwardConfig& getWalkForwardConfig() const
    {
      return mWalkForward;
    }

    const validation::BonferroniConfig& getBonferroniConfig() const
    {
      return mBonferroni;
    }

    const validation::BootstrapConfig& getBootstrapConfig() const
    {
      return mBootstrap;
    }

    const baseline::BaselineConfig& getBaselineConfig() const
    {
      return mBaseline;
    }

    const OrchestrationConfig& getOrchestrationConfig() const
    {
      return mOrchestration;
    }

    /**
     * @brief Check every block by constructing its validator.
     * @throws ValidatorConfigurationException naming the offending block
     */
    void validate() const;

  private:
    validation::DataSplitConfig mDataSplit;
    validation::WalkForwardConfig mWalkForward;
    validation::BonferroniConfig mBonferroni;
    validation::BootstrapConfig mBootstrap;
    baseline::BaselineConfig mBaseline;
    OrchestrationConfig mOrchestration;
  };

  /**
   * @brief Reads a ValidatorConfiguration from JSON.
   *
   * Top-level objects "data_split", "walk_forward", "bonferroni",
   * "bootstrap", "baseline" and "orchestration" are all optional, as is
   * every key inside them. Unknown keys are ignored; a known key of the
   * wrong type is an error. Dates are ISO "YYYY-MM-DD".
   */
  class ValidatorConfigurationFileReader
  {
  public:
    ValidatorConfigurationFileReader (const std::string& configurationFileName);
    ~ValidatorConfigurationFileReader()
      {}

    // @throws ValidatorConfigurationException if the file cannot be read or is invalid
    ValidatorConfiguration readConfigurationFile() const;

    static ValidatorConfiguration fromString(const std::string& json);

    static std::string toJsonString(const ValidatorConfiguration& configuration);

  private:
    std::string mConfigurationFileName;
  };
}
