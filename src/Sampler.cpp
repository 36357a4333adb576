#include <AbcPop/Sampler.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using std::vector;
using std::cerr;
using std::endl;

namespace ABCPOP {

Evaluation Sampler::evaluate_one(
    const size_t serial,
    const Proposer & proposer,
    const Evaluator & evaluator,
    const Acceptor & acceptor,
    const SamplingOptions & options,
    const gsl_rng * rng
) const {
    const Proposal proposal = proposer(rng);
    Evaluation ev;
    try {
        ev = evaluator.simulate(proposal, gsl_rng_get(rng), serial);
    } catch (const std::exception & e) {
        cerr << "WARNING: particle " << serial << " (model " << proposal.model << ", " << to_string(proposal.parameter)
             << ") failed: " << e.what() << endl;
        ev = Evaluation();
        ev.serial = serial;
        ev.model = proposal.model;
        ev.particle.model = proposal.model;
        ev.particle.parameter = proposal.parameter;
        ev.evaluated = true;
        return ev;
    }
    evaluator.weigh(ev);
    ev.accepted = options.all_accepted or acceptor(ev);
    return ev;
}

void Sampler::progress(const size_t accepted, const size_t n) const {
    if (show_progress) { cerr << "\rAccepted " << accepted << " / " << n << (accepted >= n ? "\n" : "") << std::flush; }
}

CheckedSampler::CheckedSampler(const SamplerPtr & strategy) : _strategy(strategy) {
    if (not strategy) { throw std::invalid_argument("CheckedSampler: no sampler strategy"); }
}

Sample CheckedSampler::sample_until_n_accepted(
    const size_t n,
    const Proposer & proposer,
    const Evaluator & evaluator,
    const Acceptor & acceptor,
    const SamplingOptions & options,
    const gsl_rng * rng
) {
    Sample sample = _strategy->sample(n, proposer, evaluator, acceptor, options, rng);
    validate_sample(n, sample);
    return sample;
}

void CheckedSampler::validate_sample(const size_t n, Sample & sample) {
    if (sample.ok() and sample.n_accepted() != n) {
        throw SamplerError(
            "sampler returned " + std::to_string(sample.n_accepted()) + " accepted particles, " + std::to_string(n) + " requested"
        );
    }
    if (sample.n_accepted() > n) {
        throw SamplerError("sampler returned more than " + std::to_string(n) + " accepted particles");
    }
    for (auto evs : { &sample.accepted(), &sample.rejected() }) {
        for (auto & ev : *evs) {
            if (not ev.evaluated) { throw SamplerError("sampler returned an unevaluated particle (serial " + std::to_string(ev.serial) + ")"); }
        }
    }
    for (auto & ev : sample.accepted()) {
        const float_type w = ev.particle.weight;
        if (not std::isfinite(w) or w < 0) {
            throw SamplerError("particle " + std::to_string(ev.serial) + " has invalid weight " + std::to_string(w));
        }
    }
    // all-zero weights (every particle degenerate) are left for the engine to drop
    sample.normalize_weights();
}

Sample SingleCoreSampler::sample(
    const size_t n, const Proposer & proposer, const Evaluator & evaluator,
    const Acceptor & acceptor, const SamplingOptions & options, const gsl_rng * rng
) {
    Sample res(options.record_rejected);
    _nr_evaluations = 0;
    while (res.n_accepted() < n and _nr_evaluations < options.max_eval) {
        const Evaluation ev = evaluate_one(_nr_evaluations, proposer, evaluator, acceptor, options, rng);
        ++_nr_evaluations;
        res.nr_simulations += ev.nr_simulations;
        res.append(ev);
        if (ev.accepted) { progress(res.n_accepted(), n); }
    }
    res.nr_evaluations = _nr_evaluations;
    res.set_ok(res.n_accepted() >= n);
    return res;
}

MulticoreSampler::MulticoreSampler(const size_t n_procs, const size_t batch_size) : _n_procs(n_procs), _batch_size(batch_size) {
    if (_n_procs == 0) { _n_procs = std::max(1u, std::thread::hardware_concurrency()); }
    if (batch_size == 0) { throw std::invalid_argument("MulticoreSampler: batch_size must be positive"); }
}

Sample MulticoreSampler::sample(
    const size_t n, const Proposer & proposer, const Evaluator & evaluator,
    const Acceptor & acceptor, const SamplingOptions & options, const gsl_rng * rng
) {
    std::atomic<size_t> next_serial(0), n_accepted(0);
    std::atomic<bool> abort(false);
    std::mutex results_mutex;
    vector<Evaluation> results;
    std::exception_ptr failure;

    // each worker gets its own generator, seeded from the caller's
    vector<std::unique_ptr<gsl_rng, decltype(&gsl_rng_free)>> rngs;
    for (size_t i = 0; i < _n_procs; ++i) {
        rngs.emplace_back(gsl_rng_alloc(gsl_rng_taus2), gsl_rng_free);
        gsl_rng_set(rngs.back().get(), gsl_rng_get(rng));
    }

    auto worker = [&](const gsl_rng * local_rng) {
        try {
            while (not abort and n_accepted < n) {
                const size_t first = next_serial.fetch_add(_batch_size);
                if (first >= options.max_eval) break;
                const size_t last = std::min(first + _batch_size, options.max_eval);
                // claimed serials are always evaluated, so the evaluated serials form a prefix
                for (size_t serial = first; serial < last and not abort; ++serial) {
                    Evaluation ev = evaluate_one(serial, proposer, evaluator, acceptor, options, local_rng);
                    std::lock_guard<std::mutex> lock(results_mutex);
                    if (ev.accepted) { progress(++n_accepted, n); }
                    results.push_back(std::move(ev));
                }
            }
        } catch (...) {
            std::lock_guard<std::mutex> lock(results_mutex);
            if (not failure) { failure = std::current_exception(); }
            abort = true;
        }
    };

    vector<std::thread> threads;
    for (size_t i = 0; i < _n_procs; ++i) { threads.emplace_back(worker, rngs[i].get()); }
    for (auto & th : threads) { th.join(); }
    if (failure) { std::rethrow_exception(failure); }

    std::sort(results.begin(), results.end(), [](const Evaluation & a, const Evaluation & b) { return a.serial < b.serial; });
    Sample res(options.record_rejected);
    for (auto & ev : results) {
        res.nr_simulations += ev.nr_simulations;
        res.append(ev);
    }
    _nr_evaluations = results.size();
    res.nr_evaluations = _nr_evaluations;
    res.set_ok(res.n_accepted() >= n);
    res.keep_first_accepted(n);
    return res;
}

}
