#include <AbcPop/History.h>
#include <AbcPop/AbcUtil.h>

#include <stdexcept>

using std::string;
using std::vector;

namespace ABCPOP {

Json::Value InitialData::to_json() const {
    Json::Value res;
    for (auto & [key, val] : observed) { res["observed"][key] = val; }
    for (auto & name : model_names) { res["models"].append(name); }
    if (ground_truth_model) { res["ground_truth_model"] = Json::UInt64(*ground_truth_model); }
    for (auto & [key, val] : ground_truth_parameter) { res["ground_truth_parameter"][key] = val; }
    res["options"] = options;
    res["distance"] = distance;
    res["epsilon"] = epsilon;
    return res;
}

vector<float_type> History::get_model_probabilities(const size_t t) const {
    vector<float_type> probs = population(t).model_probabilities(nr_models());
    float_type total = 0.0;
    for (auto p : probs) { total += p; }
    if (total > 0) {
        for (auto & p : probs) { p /= total; }
    }
    return probs;
}

size_t History::sample_from_models(const size_t t, const gsl_rng * rng) const {
    const vector<float_type> probs = get_model_probabilities(t);
    float_type total = 0.0;
    for (auto p : probs) { total += p; }
    if (not (total > 0)) { throw std::logic_error("History::sample_from_models: no model alive at t = " + std::to_string(t)); }
    return gsl_rng_weighted_index(rng, probs);
}

WeightedParameters History::weighted_particles(const size_t t, const size_t model) const {
    WeightedParameters res;
    vector<const Particle *> selected;
    for (auto & p : population(t).particles()) {
        if (p.model == model) { selected.push_back(&p); }
    }
    if (selected.empty()) { return res; }

    for (auto & [key, val] : selected.front()->parameter) { res.names.push_back(key); }
    res.values = Mat2D(selected.size(), res.names.size());
    res.weights = Col(selected.size());
    for (size_t i = 0; i < selected.size(); ++i) {
        res.values.row(i) = as_row(selected[i]->parameter, res.names);
        res.weights[i] = selected[i]->weight;
    }
    return res;
}

std::pair<Col, Col> History::get_weighted_distances(const size_t t) const {
    const vector<Particle> & particles = population(t).particles();
    Col distances(particles.size()), weights(particles.size());
    for (size_t i = 0; i < particles.size(); ++i) {
        distances[i] = particles[i].mean_distance();
        weights[i] = particles[i].weight;
    }
    return { distances, weights };
}

size_t History::nr_of_models_alive(const size_t t) const {
    size_t alive = 0;
    for (auto p : get_model_probabilities(t)) { if (p > 0) { ++alive; } }
    return alive;
}

size_t History::nr_of_models_alive() const {
    if (nr_populations() == 0) { return nr_models(); }
    return nr_of_models_alive(nr_populations() - 1);
}

size_t History::total_nr_simulations() const {
    size_t total = 0;
    for (size_t t = 0; t < nr_populations(); ++t) { total += population(t).nr_simulations; }
    return total;
}

void MemoryHistory::store_initial_data(const InitialData & data) {
    _initial = data;
    _populations.clear();
    _done = false;
    _start = std::chrono::system_clock::now();
}

bool MemoryHistory::append_population(
    const size_t t, const float_type eps,
    const Population & pop, const vector<string> & model_names
) {
    if (t != next_t()) {
        throw std::invalid_argument("MemoryHistory: expected generation " + std::to_string(next_t()) + ", got " + std::to_string(t));
    }
    if (_initial.model_names.empty()) { _initial.model_names = model_names; }
    Population stored(t, eps, pop.particles());
    stored.nr_evaluations = pop.nr_evaluations;
    stored.nr_simulations = pop.nr_simulations;
    stored.nr_accepted = pop.nr_accepted;
    stored.nr_degenerate_weights = pop.nr_degenerate_weights;
    _populations.push_back(stored);
    return stored.size() >= _min_nr_particles;
}

void MemoryHistory::done() {
    _done = true;
    _end = std::chrono::system_clock::now();
}

}
