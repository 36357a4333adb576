#ifndef ABCPOP_ABCSMC_H
#define ABCPOP_ABCSMC_H

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <json/json.h>
#include <gsl/gsl_rng.h>

#include <AbcPop/TypeDefs.h>
#include <AbcPop/Parameter.h>
#include <AbcPop/Particle.h>
#include <AbcPop/Priors.h>
#include <AbcPop/Transition.h>
#include <AbcPop/AbcSim.h>
#include <AbcPop/Distance.h>
#include <AbcPop/Epsilon.h>
#include <AbcPop/History.h>
#include <AbcPop/Generation.h>
#include <AbcPop/Sampler.h>
#include <AbcPop/MemoCell.h>

namespace ABCPOP {

// a generation could not be filled, and the run was asked to treat that as fatal
struct IncompleteSampleError : public std::runtime_error {
    IncompleteSampleError(const std::string & msg) : std::runtime_error(msg) {}
};

// An `AbcSmc` evolves weighted populations of (model, parameter) particles toward the
// joint posterior, one generation at a time.
//
// Conventions:
//  - internal state fields: _field_name
//  - private methods: _method_name()
//  - public methods: method_name()
//
// Usage: construct, `set_data`, then `run` (possibly several times; each `run` resumes
// from the history's next generation).
class AbcSmc {
    public:
        // throws std::invalid_argument on mismatched model / prior / kernel counts, zero particles,
        // or `min_nr_particles_per_population > nr_particles`
        AbcSmc(
            const ModelVec & models,
            const ModelPrior & model_prior,
            const ModelPerturbationKernel & model_perturbation_kernel,
            const std::vector<ParameterPriorPtr> & parameter_priors,
            const std::vector<TransitionPtr> & transitions,
            const DistancePtr & distance,
            const EpsilonPtr & epsilon,
            const size_t nr_particles,
            const SamplerPtr & sampler,
            const size_t max_nr_allowed_sample_attempts_per_particle = 500,
            const size_t min_nr_particles_per_population = 1
        );

        void do_not_stop_when_only_single_model_alive() { _stop_if_only_single_model_alive = false; }
        bool stop_if_only_single_model_alive() const { return _stop_if_only_single_model_alive; }

        // throw IncompleteSampleError instead of stopping quietly when a generation can't be filled
        void fail_on_incomplete(const bool fail) { _fail_on_incomplete = fail; }
        bool incomplete() const { return _incomplete; }

        void set_seed(const unsigned long int seed) { gsl_rng_set(_rng.get(), seed); }
        void set_verbose(const size_t verbose) { _verbose = verbose; }
        void set_max_eval(const size_t max_eval) { _max_eval = max_eval; }
        void set_summary_statistics(const SumStatsTransform & transform) { _transform = transform; }
        void set_show_progress(const bool show) { _sampler.set_show_progress(show); }

        // computes the prior sample, initializes distance and epsilon, and records the initial data in `history`
        void set_data(
            const SumStats & observed,
            const std::shared_ptr<History> & history,
            const std::optional<size_t> ground_truth_model = std::nullopt,
            const Parameter & ground_truth_parameter = Parameter(),
            const Json::Value & options = Json::Value()
        );

        // `nr_particles` (model, parameter) draws from the priors, with their summary statistics;
        // computed once, until `reset_prior_sample`
        const Sample & prior_sample();
        void reset_prior_sample() { _prior_sample.reset(); }

        // Evolve populations, one generation per entry of `attempts_schedule` (the number of
        // simulations per particle), stopping early when a population is empty or incomplete,
        // when epsilon reaches `min_epsilon`, or when only one model is left alive.
        const History & run(const std::vector<size_t> & attempts_schedule, const float_type min_epsilon);

        size_t nr_models() const { return _models.size(); }
        size_t nr_particles() const { return _nr_particles; }
        std::vector<std::string> model_names() const;
        const ModelVec & models() const { return _models; }
        const std::vector<ParameterPriorPtr> & parameter_priors() const { return _parameter_priors; }
        const SumStats & observed() const { return _observed; }
        const Distance & distance() const { return *_distance; }
        const std::shared_ptr<History> & history() const { return _history; }
        CheckedSampler & sampler() { return _sampler; }

        // distance between `x` and the observed data, under the current distance
        float_type distance_to_observed(const SumStats & x) const { return (*_distance)(x, _observed); }

    private:
        Sample _sample_from_prior();
        // fresh kernels, fitted to generation t-1; null for extinct models
        std::vector<TransitionPtr> _fit_transitions(const size_t t) const;
        Population _make_population(const size_t t, const float_type eps, const Sample & sample) const;
        void _report(const size_t t, const Population & pop) const;

        const ModelVec _models;
        const ModelPrior _model_prior;
        const ModelPerturbationKernel _model_perturbation_kernel;
        const std::vector<ParameterPriorPtr> _parameter_priors;
        const std::vector<TransitionPtr> _transitions; // unfitted prototypes
        DistancePtr _distance;
        EpsilonPtr _epsilon;
        const size_t _nr_particles;
        CheckedSampler _sampler;
        const size_t _max_nr_allowed_sample_attempts_per_particle;
        const size_t _min_nr_particles_per_population;

        bool _stop_if_only_single_model_alive = true;
        bool _fail_on_incomplete = false;
        bool _incomplete = false;
        size_t _verbose = 0;
        size_t _max_eval = UNLIMITED;
        SumStatsTransform _transform = identity;

        SumStats _observed;
        std::shared_ptr<History> _history;
        MemoCell<Sample> _prior_sample;
        std::unique_ptr<gsl_rng, decltype(&gsl_rng_free)> _rng;
};

}

#endif // ABCPOP_ABCSMC_H
