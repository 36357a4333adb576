#ifndef ABCPOP_HISTORY_H
#define ABCPOP_HISTORY_H

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <json/json.h>
#include <gsl/gsl_rng.h>

#include <AbcPop/TypeDefs.h>
#include <AbcPop/Parameter.h>
#include <AbcPop/Metric.h>
#include <AbcPop/Particle.h>

namespace ABCPOP {

// what a run was started with; kept for provenance
struct InitialData {
    SumStats observed;
    std::vector<std::string> model_names;
    std::optional<size_t> ground_truth_model;
    Parameter ground_truth_parameter;
    Json::Value options;
    Json::Value distance;
    Json::Value epsilon;

    Json::Value to_json() const;
};

// History: the append-only record of a run's populations.
//
// Storage implementations provide the primitives (initial data, append, population lookup, done);
// the queries the engine needs between generations are built on top of them here.
// Writes happen once per generation, from the engine only; all queries are const, so samplers
// may read concurrently while a generation is being sampled.
class History {
    public:
        virtual ~History() {}

        virtual void store_initial_data(const InitialData & data) = 0;

        // stores `pop` as generation `t`, which must be `next_t()`.
        // @return true iff the stored population has at least `min_nr_particles_per_population()` particles
        virtual bool append_population(
            const size_t t, const float_type eps,
            const Population & pop, const std::vector<std::string> & model_names
        ) = 0;

        // throws std::out_of_range for an unknown generation
        virtual const Population & population(const size_t t) const = 0;
        virtual size_t nr_populations() const = 0;
        virtual const InitialData & initial_data() const = 0;

        // marks the run as finished
        virtual void done() = 0;

        size_t nr_models() const { return initial_data().model_names.size(); }

        // normalized, indexed by model; extinct models have probability 0
        std::vector<float_type> get_model_probabilities(const size_t t) const;
        size_t sample_from_models(const size_t t, const gsl_rng * rng) const;
        // the parameters and weights of the particles of `model` in generation `t`, columns ordered by name
        WeightedParameters weighted_particles(const size_t t, const size_t model) const;
        // per particle mean accepted distance, and particle weight
        std::pair<Col, Col> get_weighted_distances(const size_t t) const;

        size_t nr_of_models_alive(const size_t t) const;
        size_t nr_of_models_alive() const;

        // -1 if nothing has been stored
        int max_t() const { return static_cast<int>(nr_populations()) - 1; }
        // the generation a (resumed) run starts from
        size_t next_t() const { return nr_populations(); }
        size_t total_nr_simulations() const;

        size_t min_nr_particles_per_population() const { return _min_nr_particles; }
        void set_min_nr_particles_per_population(const size_t n) { _min_nr_particles = n; }

    protected:
        size_t _min_nr_particles = 1;
};

// An in-process `History`
class MemoryHistory : public History {
    public:
        MemoryHistory(const size_t min_nr_particles_per_population = 1) { _min_nr_particles = min_nr_particles_per_population; }

        void store_initial_data(const InitialData & data) override;
        bool append_population(
            const size_t t, const float_type eps,
            const Population & pop, const std::vector<std::string> & model_names
        ) override;
        const Population & population(const size_t t) const override { return _populations.at(t); }
        size_t nr_populations() const override { return _populations.size(); }
        const InitialData & initial_data() const override { return _initial; }
        void done() override;

        bool is_done() const { return _done; }
        std::chrono::system_clock::time_point start_time() const { return _start; }
        std::chrono::system_clock::time_point end_time() const { return _end; }

    private:
        InitialData _initial;
        std::vector<Population> _populations;
        bool _done = false;
        std::chrono::system_clock::time_point _start, _end;
};

}

#endif // ABCPOP_HISTORY_H
