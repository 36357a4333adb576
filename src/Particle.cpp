#include <AbcPop/Particle.h>

#include <algorithm>
#include <limits>
#include <numeric>

namespace ABCPOP {

float_type Particle::mean_distance() const {
    if (distances.empty()) { return std::numeric_limits<float_type>::quiet_NaN(); }
    return std::accumulate(distances.begin(), distances.end(), 0.0) / distances.size();
}

void Sample::append(const Evaluation & ev) {
    if (ev.accepted) {
        _accepted.push_back(ev);
    } else if (_record_rejected) {
        _rejected.push_back(ev);
    }
}

std::vector<Particle> Sample::accepted_particles() const {
    std::vector<Particle> particles;
    particles.reserve(_accepted.size());
    for (const auto & ev : _accepted) { particles.push_back(ev.particle); }
    return particles;
}

void Sample::keep_first_accepted(const size_t n) {
    std::sort(_accepted.begin(), _accepted.end(), [](const Evaluation & a, const Evaluation & b) { return a.serial < b.serial; });
    if (_accepted.size() > n) { _accepted.resize(n); }
}

float_type Sample::normalize_weights() {
    float_type total = 0.0;
    for (const auto & ev : _accepted) { total += ev.particle.weight; }
    if (total > 0) {
        for (auto & ev : _accepted) { ev.particle.weight /= total; }
    }
    return total;
}

float_type Population::total_weight() const {
    float_type total = 0.0;
    for (const auto & p : _particles) { total += p.weight; }
    return total;
}

std::vector<float_type> Population::model_probabilities(const size_t nr_models) const {
    std::vector<float_type> probs(nr_models, 0.0);
    const float_type total = total_weight();
    if (total <= 0) { return probs; }
    for (const auto & p : _particles) {
        if (p.model < nr_models) { probs[p.model] += p.weight / total; }
    }
    return probs;
}

}
