#ifndef ABCPOP_SAMPLER_H
#define ABCPOP_SAMPLER_H

#include <memory>
#include <stdexcept>
#include <string>
#include <gsl/gsl_rng.h>

#include <AbcPop/TypeDefs.h>
#include <AbcPop/Particle.h>
#include <AbcPop/Generation.h>

namespace ABCPOP {

struct SamplingOptions {
    size_t max_eval = UNLIMITED;   // proposal / evaluate cycles allowed for this call
    bool all_accepted = false;     // every evaluation is known to be accepted; skip the acceptor
    bool record_rejected = false;
};

// a sampler strategy broke its contract
struct SamplerError : public std::logic_error {
    SamplerError(const std::string & msg) : std::logic_error(msg) {}
};

// Sampler: the strategy for scheduling propose / evaluate / accept cycles until `n`
// evaluations are accepted (or `max_eval` cycles are spent, in which case the sample is
// returned with `ok() == false`).
//
// Strategies only schedule; checking and normalizing the result is left to `CheckedSampler`.
class Sampler {
    public:
        virtual ~Sampler() {}

        // @param rng: the caller's generator; strategies may draw seeds for their own generators from it
        virtual Sample sample(
            const size_t n,
            const Proposer & proposer,
            const Evaluator & evaluator,
            const Acceptor & acceptor,
            const SamplingOptions & options,
            const gsl_rng * rng
        ) = 0;

        // release held execution resources
        virtual void stop() {}

        virtual std::string name() const = 0;

        // evaluations performed by the last `sample` call
        size_t nr_evaluations() const { return _nr_evaluations; }

        bool show_progress = false;

    protected:
        // propose, evaluate and decide acceptance for one slot. Failures inside the simulation
        // are isolated: the evaluation is returned rejected. Failures to propose propagate.
        Evaluation evaluate_one(
            const size_t serial,
            const Proposer & proposer,
            const Evaluator & evaluator,
            const Acceptor & acceptor,
            const SamplingOptions & options,
            const gsl_rng * rng
        ) const;

        void progress(const size_t accepted, const size_t n) const;

        size_t _nr_evaluations = 0;
};

typedef std::shared_ptr<Sampler> SamplerPtr;

// Wraps a `Sampler` strategy with the validation every sample must pass.
class CheckedSampler {
    public:
        CheckedSampler(const SamplerPtr & strategy);

        // the strategy's sample, validated and normalized; throws SamplerError if the strategy misbehaved
        Sample sample_until_n_accepted(
            const size_t n,
            const Proposer & proposer,
            const Evaluator & evaluator,
            const Acceptor & acceptor,
            const SamplingOptions & options,
            const gsl_rng * rng
        );

        // throws SamplerError if `sample` does not hold `n` accepted evaluations (unless it is flagged degraded),
        // holds unevaluated evaluations, or carries negative / non-finite weights; then normalizes
        static void validate_sample(const size_t n, Sample & sample);

        void stop() { _strategy->stop(); }
        size_t nr_evaluations() const { return _strategy->nr_evaluations(); }
        void set_show_progress(const bool show) { _strategy->show_progress = show; }
        const Sampler & strategy() const { return *_strategy; }

    private:
        SamplerPtr _strategy;
};

// propose -> evaluate -> accept, one at a time
class SingleCoreSampler : public Sampler {
    public:
        Sample sample(
            const size_t n, const Proposer & proposer, const Evaluator & evaluator,
            const Acceptor & acceptor, const SamplingOptions & options, const gsl_rng * rng
        ) override;

        std::string name() const override { return "SINGLE"; }
};

// Dynamic scheduling over `n_procs` threads. Each worker claims `batch_size` consecutive
// serial numbers at a time and evaluates all of them; once `n` acceptances are recorded no
// new serials are claimed. The first `n` accepted evaluations by serial are kept, so fast
// simulations are not favoured.
class MulticoreSampler : public Sampler {
    public:
        // `n_procs` 0 means one per hardware thread
        MulticoreSampler(const size_t n_procs = 0, const size_t batch_size = 1);

        Sample sample(
            const size_t n, const Proposer & proposer, const Evaluator & evaluator,
            const Acceptor & acceptor, const SamplingOptions & options, const gsl_rng * rng
        ) override;

        std::string name() const override { return "MULTICORE"; }
        size_t n_procs() const { return _n_procs; }
        size_t batch_size() const { return _batch_size; }

    private:
        size_t _n_procs;
        const size_t _batch_size;
};

}

#endif // ABCPOP_SAMPLER_H
