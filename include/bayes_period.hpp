#ifndef BAYES_PERIOD_HPP
#define BAYES_PERIOD_HPP

// Include all library headers here
#include "consensus.hpp"
#include "hypothesis.hpp"
#include "inference_config.hpp"
#include "inference_engine.hpp"
#include "inference_result.hpp"
#include "json_io.hpp"
#include "measurement.hpp"
#include "measurement_source.hpp"
#include "number_theory.hpp"
#include "posterior.hpp"
#include "progressive_controller.hpp"

#include "bayes_period/period_extraction.hpp"
#include "bayes_period/period_finding.hpp"
#include "bayes_period/phase_estimation.hpp"
#include "bayes_period/search_hypotheses.hpp"

// This is the main header file for the bayes_period library
// Include this single header to access all functionality

#endif // BAYES_PERIOD_HPP
