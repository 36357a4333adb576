#ifndef ABCPOP_PARTICLE_H
#define ABCPOP_PARTICLE_H

#include <string>
#include <vector>

#include <AbcPop/TypeDefs.h>
#include <AbcPop/Parameter.h>
#include <AbcPop/Metric.h>

namespace ABCPOP {

// One (model, parameter) sample with its evaluation outcome and importance weight.
// Valid only if at least one simulation for it was accepted.
struct Particle {
    size_t model = 0;
    Parameter parameter;
    float_type weight = 0.0;
    std::vector<float_type> distances;  // every accepted distance
    std::vector<SumStats> sum_stats;    // summary statistics matching `distances` (or, for prior samples, every simulation)

    bool valid() const { return not distances.empty(); }
    // mean of the accepted distances; NaN for an invalid particle
    float_type mean_distance() const;
};

// What a `Proposer` hands to an `Evaluator`
struct Proposal {
    size_t model = 0;
    Parameter parameter;
};

// The outcome of evaluating one `Proposal`
struct Evaluation {
    size_t serial = 0;            // order in which the evaluation was started, within one sampling call
    size_t model = 0;
    size_t nr_simulations = 0;    // simulation attempts consumed
    bool evaluated = false;       // false only while pending; samplers must never return pending evaluations
    bool exhausted = false;       // hit the per-particle simulation cap
    bool degenerate_weight = false; // importance weight normalization was 0
    bool accepted = false;
    Particle particle;
};

// The raw output of one sampling call for one generation.
class Sample {
    public:
        Sample(const bool record_rejected = false) : _record_rejected(record_rejected) {}

        // records `ev` as accepted or (if recording) rejected
        void append(const Evaluation & ev);

        const std::vector<Evaluation> & accepted() const { return _accepted; }
        const std::vector<Evaluation> & rejected() const { return _rejected; }
        std::vector<Particle> accepted_particles() const;
        size_t n_accepted() const { return _accepted.size(); }

        // drop all but the first `n` accepted evaluations (by serial)
        void keep_first_accepted(const size_t n);

        // false iff the sampler could not deliver the requested number of acceptances
        bool ok() const { return _ok; }
        void set_ok(const bool ok) { _ok = ok; }

        bool record_rejected() const { return _record_rejected; }

        // rescales accepted weights to sum to 1; returns the pre-normalization sum
        float_type normalize_weights();

        size_t nr_evaluations = 0;  // proposal / evaluate cycles
        size_t nr_simulations = 0;  // individual simulator calls

    private:
        bool _record_rejected;
        bool _ok = true;
        std::vector<Evaluation> _accepted;
        std::vector<Evaluation> _rejected;
};

// The accepted, weighted particles of one generation.
class Population {
    public:
        Population() {}
        Population(const size_t t, const float_type eps, const std::vector<Particle> & particles)
        : _t(t), _epsilon(eps), _particles(particles) {}

        size_t t() const { return _t; }
        float_type epsilon() const { return _epsilon; }
        const std::vector<Particle> & particles() const { return _particles; }
        size_t size() const { return _particles.size(); }
        bool empty() const { return _particles.empty(); }

        float_type total_weight() const;
        // sum of the weights of each model's particles, indexed by model; length `nr_models`
        std::vector<float_type> model_probabilities(const size_t nr_models) const;

        size_t nr_evaluations = 0;
        size_t nr_simulations = 0;
        size_t nr_accepted = 0;         // includes zero-weight particles dropped from `particles()`
        size_t nr_degenerate_weights = 0;

    private:
        size_t _t = 0;
        float_type _epsilon = 0.0;
        std::vector<Particle> _particles;
};

}

#endif // ABCPOP_PARTICLE_H
