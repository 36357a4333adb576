#ifndef ABCPOP_GENERATION_H
#define ABCPOP_GENERATION_H

#include <memory>
#include <optional>
#include <vector>
#include <json/json.h>
#include <gsl/gsl_rng.h>
#include <gsl/gsl_randist.h>

#include <AbcPop/TypeDefs.h>
#include <AbcPop/Particle.h>
#include <AbcPop/Priors.h>
#include <AbcPop/Transition.h>
#include <AbcPop/AbcSim.h>
#include <AbcPop/History.h>

// The per-generation pieces a `Sampler` drives: propose, evaluate (simulate + weigh), accept.
// Each is an immutable value bound to one generation, so workers can share them freely.

namespace ABCPOP {

// Draws (model, parameter) candidates for generation `t`.
class Proposer {
    public:
        // proposals that keep landing outside the prior support give up after this many redraws
        static constexpr size_t MAX_PROPOSAL_ATTEMPTS = 1000000;

        // for the prior (t = 0) sample: draws straight from the priors
        Proposer(const ModelPrior & model_prior, const std::vector<ParameterPriorPtr> & parameter_priors);

        // for t > 0: `kernels` were fitted to generation t-1 of `history` (null for extinct models)
        Proposer(
            const size_t t,
            const ModelPrior & model_prior,
            const std::vector<ParameterPriorPtr> & parameter_priors,
            const ModelPerturbationKernel & model_kernel,
            const std::vector<TransitionPtr> & kernels,
            const History & history
        );

        // throws std::runtime_error if no proposal with positive prior density is found
        Proposal operator()(const gsl_rng * rng) const;

        size_t t() const { return _t; }

    private:
        Proposal _from_prior(const gsl_rng * rng) const;

        const size_t _t;
        const ModelPrior _model_prior;
        const std::vector<ParameterPriorPtr> _priors;
        const std::optional<ModelPerturbationKernel> _model_kernel;
        const std::vector<TransitionPtr> _kernels;
        std::vector<float_type> _prev_model_probs;
        // source model draws over `_prev_model_probs`; null when no model was alive at t-1
        std::shared_ptr<gsl_ran_discrete_t> _source_models;
};

// everything a simulation needs to know about its generation; travels to remote workers as JSON
struct SimulationContext {
    size_t t = 0;
    float_type epsilon = 0.0;
    size_t budget = 1;          // simulations per particle
    size_t max_attempts = 500;  // per particle cap
    bool stats_only = false;    // prior sample: record summary statistics, no acceptance test
    Json::Value distance;       // the initialized distance, for workers that compute their own

    Json::Value to_json() const;
    static SimulationContext from_json(const Json::Value & json);
};

// The importance weight of an accepted particle.
//
// t = 0: the accepted fraction f. t > 0:
//     model_prior(m) * prior_m(theta) * f / (sum_j P_{t-1}(j) K(m | j) * kernel_m(theta))
class Weigher {
    public:
        // t = 0
        Weigher(const size_t budget) : _t(0), _budget(budget) {}

        Weigher(
            const size_t t, const size_t budget,
            const ModelPrior & model_prior,
            const std::vector<ParameterPriorPtr> & parameter_priors,
            const ModelPerturbationKernel & model_kernel,
            const std::vector<TransitionPtr> & kernels,
            const std::vector<float_type> & prev_model_probs
        );

        // sets the particle weight, and flags a zero normalization (the weight is then 0)
        void operator()(Evaluation & ev) const;

    private:
        const size_t _t;
        const size_t _budget;
        std::optional<ModelPrior> _model_prior;
        std::vector<ParameterPriorPtr> _priors;
        std::optional<ModelPerturbationKernel> _model_kernel;
        std::vector<TransitionPtr> _kernels;
        std::vector<float_type> _prev_model_probs;
};

// Simulates a proposal against the observed data, then weighs the outcome.
class Evaluator {
    public:
        Evaluator(
            const ModelVec & models,
            const SimulationContext & context,
            const DistanceToObserved & distance_to_observed,
            const SumStatsTransform & transform,
            const Weigher & weigher,
            const size_t verbose = 0
        );

        // the simulation half: runs the simulation budget for `proposal`; simulation `i` gets `seed + i`.
        // Exceptions from the model propagate.
        Evaluation simulate(const Proposal & proposal, const unsigned long int seed, const size_t serial) const;

        // the weighting half: only needs what the engine process holds
        void weigh(Evaluation & ev) const;

        Evaluation operator()(const Proposal & proposal, const gsl_rng * rng, const size_t serial) const;

        const SimulationContext & context() const { return _context; }

    private:
        const ModelVec _models;
        const SimulationContext _context;
        const DistanceToObserved _distance_to_observed;
        const SumStatsTransform _transform;
        const Weigher _weigher;
        const size_t _verbose;
};

// accepts evaluations with at least one accepted simulation, or everything
class Acceptor {
    public:
        Acceptor(const bool accept_all = false) : _accept_all(accept_all) {}
        bool operator()(const Evaluation & ev) const { return _accept_all or (ev.evaluated and ev.particle.valid()); }

    private:
        const bool _accept_all;
};

}

#endif // ABCPOP_GENERATION_H
