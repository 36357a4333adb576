#include "testing.h"
#include "test_models.h"
#include <AbcPop/Sampler.h>
#include <AbcPop/History.h>
#include <AbcPop/Transition.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

using namespace ABCPOP;
using namespace testmodels;
using std::vector;
using std::make_shared;

struct Fixture {
    ModelVec models;
    ModelPrior model_prior = ModelPrior::uniform(1);
    vector<ParameterPriorPtr> priors;
    gsl_rng * rng;

    Fixture(const ModelPtr & model) : models({ model }), priors({ uniform_mu(-2.0, 2.0) }) {
        rng = gsl_rng_alloc(gsl_rng_taus2);
        gsl_rng_set(rng, 2024);
    }
    ~Fixture() { gsl_rng_free(rng); }

    Proposer proposer() const { return Proposer(model_prior, priors); }

    Evaluator evaluator(const float_type eps, const size_t budget = 1) const {
        SimulationContext ctx;
        ctx.epsilon = eps;
        ctx.budget = budget;
        return Evaluator(models, ctx, abs_y, identity, Weigher(budget));
    }
};

float_type total_weight(const Sample & s) {
    float_type total = 0.0;
    for (auto & ev : s.accepted()) { total += ev.particle.weight; }
    return total;
}

void series_single_core() {
    Fixture fx(fragile("fragile"));
    CheckedSampler sampler(make_shared<SingleCoreSampler>());

    const Sample s = sampler.sample_until_n_accepted(20, fx.proposer(), fx.evaluator(1.0), Acceptor(), SamplingOptions(), fx.rng);
    IS_TRUE(s.ok());
    IS_TRUE(s.n_accepted() == 20);
    IS_TRUE(std::fabs(total_weight(s) - 1.0) < 1e-12);
    IS_TRUE(s.nr_evaluations >= 20 and s.nr_evaluations == sampler.nr_evaluations());
    bool within = true;
    for (auto & ev : s.accepted()) { within = within and (ev.particle.distances[0] <= 1.0) and (ev.particle.parameter.at("mu") >= 0); }
    // failures (mu < 0) are isolated and never accepted
    IS_TRUE(within);
}

void series_max_eval() {
    Fixture fx(constant("far", 100.0));
    CheckedSampler sampler(make_shared<SingleCoreSampler>());
    SamplingOptions options;
    options.max_eval = 30;
    options.record_rejected = true;

    const Sample s = sampler.sample_until_n_accepted(10, fx.proposer(), fx.evaluator(1.0), Acceptor(), options, fx.rng);
    IS_TRUE(not s.ok());
    IS_TRUE(s.n_accepted() == 0);
    IS_TRUE(s.nr_evaluations == 30 and s.rejected().size() == 30);
}

void series_all_accepted() {
    Fixture fx(constant("far", 100.0));
    CheckedSampler sampler(make_shared<SingleCoreSampler>());
    SamplingOptions options;
    options.all_accepted = true;
    SimulationContext ctx;
    ctx.stats_only = true;
    const Evaluator stats(fx.models, ctx, abs_y, identity, Weigher(1));

    const Sample s = sampler.sample_until_n_accepted(5, fx.proposer(), stats, Acceptor(), options, fx.rng);
    IS_TRUE(s.n_accepted() == 5 and s.nr_evaluations == 5);
    IS_TRUE(s.accepted()[0].particle.sum_stats.size() == 1 and s.accepted()[0].particle.sum_stats[0].at("y") == 100.0);
    IS_TRUE(std::fabs(s.accepted()[0].particle.weight - 0.2) < 1e-12);
}

// strategies that break the contract in one way or another
struct RogueSampler : public Sampler {
    enum FLAW { TOO_FEW, UNEVALUATED, NEGATIVE_WEIGHT, ALL_ZERO };
    FLAW flaw;
    RogueSampler(const FLAW f) : flaw(f) {}
    std::string name() const override { return "ROGUE"; }

    Sample sample(
        const size_t n, const Proposer &, const Evaluator &,
        const Acceptor &, const SamplingOptions &, const gsl_rng *
    ) override {
        Sample s;
        for (size_t i = 0; i < n; ++i) {
            Evaluation ev;
            ev.serial = i;
            ev.evaluated = true;
            ev.accepted = true;
            ev.particle.distances = { 0.0 };
            ev.particle.weight = (flaw == ALL_ZERO) ? 0.0 : 1.0;
            if (flaw == UNEVALUATED and i == 0) { ev.evaluated = false; }
            if (flaw == NEGATIVE_WEIGHT and i == 0) { ev.particle.weight = -1.0; }
            if (flaw == TOO_FEW and i == 0) continue;
            s.append(ev);
        }
        return s;
    }
};

void series_validation() {
    Fixture fx(constant("near", 0.0));
    for (auto flaw : { RogueSampler::TOO_FEW, RogueSampler::UNEVALUATED, RogueSampler::NEGATIVE_WEIGHT }) {
        CheckedSampler sampler(make_shared<RogueSampler>(flaw));
        THROWS(sampler.sample_until_n_accepted(4, fx.proposer(), fx.evaluator(1.0), Acceptor(), SamplingOptions(), fx.rng), SamplerError);
    }

    // all-zero weights are not a contract violation; they stay 0
    CheckedSampler zero(make_shared<RogueSampler>(RogueSampler::ALL_ZERO));
    const Sample s = zero.sample_until_n_accepted(4, fx.proposer(), fx.evaluator(1.0), Acceptor(), SamplingOptions(), fx.rng);
    IS_TRUE(s.n_accepted() == 4 and total_weight(s) == 0.0);

    Sample degraded;
    degraded.set_ok(false);
    CheckedSampler::validate_sample(3, degraded);
    IS_TRUE(degraded.n_accepted() == 0);

    THROWS(CheckedSampler(nullptr), std::invalid_argument);
}

void series_multicore() {
    Fixture fx(gaussian("gauss"));
    CheckedSampler sampler(make_shared<MulticoreSampler>(4, 3));
    SamplingOptions options;
    options.record_rejected = true;

    const size_t n = 50;
    const Sample s = sampler.sample_until_n_accepted(n, fx.proposer(), fx.evaluator(0.5), Acceptor(), options, fx.rng);
    IS_TRUE(s.ok());
    IS_TRUE(s.n_accepted() == n);
    IS_TRUE(std::fabs(total_weight(s) - 1.0) < 1e-12);

    // kept acceptances are the earliest ones: every serial before the last kept one was evaluated
    std::set<size_t> serials;
    size_t last_kept = 0;
    for (auto & ev : s.accepted()) { serials.insert(ev.serial); last_kept = std::max(last_kept, ev.serial); }
    for (auto & ev : s.rejected()) { serials.insert(ev.serial); }
    bool prefix = true;
    for (size_t serial = 0; serial <= last_kept; ++serial) { prefix = prefix and serials.count(serial) == 1; }
    IS_TRUE(prefix);
    IS_TRUE(std::is_sorted(s.accepted().begin(), s.accepted().end(), [](const Evaluation & a, const Evaluation & b) { return a.serial < b.serial; }));

    SamplingOptions capped;
    capped.max_eval = 7;
    Fixture far(constant("far", 100.0));
    const Sample d = sampler.sample_until_n_accepted(n, far.proposer(), far.evaluator(0.5), Acceptor(), capped, far.rng);
    IS_TRUE(not d.ok() and d.nr_evaluations == 7);
}

void series_multicore_isolation() {
    Fixture fx(fragile("fragile"));
    CheckedSampler sampler(make_shared<MulticoreSampler>(3, 2));
    const Sample s = sampler.sample_until_n_accepted(30, fx.proposer(), fx.evaluator(2.0), Acceptor(), SamplingOptions(), fx.rng);
    IS_TRUE(s.ok() and s.n_accepted() == 30);
    bool non_negative = true;
    for (auto & ev : s.accepted()) { non_negative = non_negative and ev.particle.parameter.at("mu") >= 0; }
    IS_TRUE(non_negative);
}

Particle mu_particle(const size_t model, const float_type mu, const float_type weight) {
    Particle p;
    p.model = model;
    p.parameter = { { "mu", mu } };
    p.weight = weight;
    p.distances = { 0.1 };
    p.sum_stats = { { { "y", mu } } };
    return p;
}

// generation 0 of a two model run, from `particles`
std::shared_ptr<MemoryHistory> two_model_history(const vector<Particle> & particles) {
    auto history = make_shared<MemoryHistory>();
    InitialData data;
    data.model_names = { "m0", "m1" };
    data.observed = { { "y", 0.0 } };
    history->store_initial_data(data);
    Population pop(0, 1.0, particles);
    pop.nr_accepted = particles.size();
    IS_TRUE(history->append_population(0, 1.0, pop, data.model_names) == not particles.empty());
    return history;
}

// kernels fitted to generation 0, null where a model has no particles
vector<TransitionPtr> fitted_kernels(const History & history) {
    vector<TransitionPtr> kernels(2);
    for (size_t m = 0; m < 2; ++m) {
        const WeightedParameters wp = history.weighted_particles(0, m);
        if (wp.empty()) continue;
        kernels[m] = IndependentNormalTransition().clone();
        kernels[m]->fit(wp);
    }
    return kernels;
}

Evaluation evaluated(const size_t model, const float_type mu, const vector<float_type> & distances) {
    Evaluation ev;
    ev.model = model;
    ev.evaluated = true;
    ev.particle.model = model;
    ev.particle.parameter = { { "mu", mu } };
    ev.particle.distances = distances;
    return ev;
}

void series_perturbed_weights() {
    auto history = two_model_history({
        mu_particle(0, -0.5, 0.3), mu_particle(0, 0.5, 0.3), mu_particle(1, 0.8, 0.2), mu_particle(1, 1.2, 0.2)
    });
    const vector<float_type> prev = history->get_model_probabilities(0);
    IS_TRUE(std::fabs(prev[0] - 0.6) < 1e-12 and std::fabs(prev[1] - 0.4) < 1e-12);

    const vector<ParameterPriorPtr> priors(2, uniform_mu(-2.0, 2.0));
    const vector<TransitionPtr> kernels = fitted_kernels(*history);
    const ModelPrior model_prior = ModelPrior::uniform(2);
    const ModelPerturbationKernel model_kernel(2, 0.7);
    const size_t budget = 4;
    const Weigher weigher(1, budget, model_prior, priors, model_kernel, kernels, prev);

    // two of four simulations accepted; prior density 1/4 on [-2, 2]
    Evaluation ev0 = evaluated(0, 0.3, { 0.1, 0.2 });
    weigher(ev0);
    const float_type expected0 = 0.5 * 0.25 * 0.5 / ((0.6 * 0.7 + 0.4 * 0.3) * kernels[0]->pdf(ev0.particle.parameter));
    IS_TRUE(not ev0.degenerate_weight);
    IS_TRUE(std::fabs(ev0.particle.weight - expected0) < 1e-9 * expected0);

    Evaluation ev1 = evaluated(1, 1.0, { 0.1, 0.2, 0.3 });
    weigher(ev1);
    const float_type expected1 = 0.5 * 0.25 * 0.75 / ((0.6 * 0.3 + 0.4 * 0.7) * kernels[1]->pdf(ev1.particle.parameter));
    IS_TRUE(std::fabs(ev1.particle.weight - expected1) < 1e-9 * expected1);

    // invalid particles weigh nothing, and are not degenerate
    Evaluation rejected = evaluated(0, 0.3, {});
    weigher(rejected);
    IS_TRUE(rejected.particle.weight == 0.0 and not rejected.degenerate_weight);

    // no kernel for model 1: the normalization is 0
    const Weigher without_kernel(1, budget, model_prior, priors, model_kernel, { kernels[0], nullptr }, prev);
    Evaluation orphan = evaluated(1, 1.0, { 0.1 });
    without_kernel(orphan);
    IS_TRUE(orphan.degenerate_weight and orphan.particle.weight == 0.0);
    // and so is it for a model nothing could have moved to
    const Weigher no_source(1, budget, model_prior, priors, model_kernel, kernels, { 0.0, 0.0 });
    Evaluation stranded = evaluated(0, 0.3, { 0.1 });
    no_source(stranded);
    IS_TRUE(stranded.degenerate_weight and stranded.particle.weight == 0.0);
}

void series_attempt_cap() {
    Fixture fx(constant("near", 0.0));
    SimulationContext ctx;
    ctx.epsilon = 1.0;
    ctx.budget = 5;
    ctx.max_attempts = 2;
    const Evaluator capped(fx.models, ctx, abs_y, identity, Weigher(ctx.budget));

    Proposal proposal;
    proposal.parameter = { { "mu", 0.0 } };
    Evaluation ev = capped.simulate(proposal, 7, 0);
    IS_TRUE(ev.exhausted and ev.evaluated);
    IS_TRUE(ev.nr_simulations == 2);
    IS_TRUE(not ev.particle.valid() and ev.particle.sum_stats.empty());
    capped.weigh(ev);
    IS_TRUE(ev.particle.weight == 0.0);
    IS_TRUE(not Acceptor()(ev));

    ctx.max_attempts = 5;
    const Evaluator enough(fx.models, ctx, abs_y, identity, Weigher(ctx.budget));
    Evaluation full = enough.simulate(proposal, 7, 0);
    IS_TRUE(not full.exhausted and full.nr_simulations == 5 and full.particle.distances.size() == 5);
    IS_TRUE(Acceptor()(full));
}

void series_extinct_routing() {
    // model 1 has no particles in generation 0
    auto history = two_model_history({ mu_particle(0, -0.5, 0.5), mu_particle(0, 0.5, 0.5) });
    const vector<ParameterPriorPtr> priors(2, uniform_mu(-2.0, 2.0));
    const vector<TransitionPtr> kernels = fitted_kernels(*history);
    IS_TRUE(kernels[0] and not kernels[1]);

    // the model kernel moves half of all draws towards model 1
    const Proposer proposer(1, ModelPrior::uniform(2), priors, ModelPerturbationKernel(2, 0.5), kernels, *history);
    gsl_rng * rng = gsl_rng_alloc(gsl_rng_taus2);
    gsl_rng_set(rng, 11);
    bool never_extinct = true;
    bool in_support = true;
    for (size_t i = 0; i < 500; ++i) {
        const Proposal p = proposer(rng);
        never_extinct = never_extinct and p.model == 0;
        in_support = in_support and std::fabs(p.parameter.at("mu")) <= 2.0;
    }
    IS_TRUE(never_extinct);
    IS_TRUE(in_support);

    // nothing to perturb after an empty generation
    auto empty = two_model_history({});
    IS_TRUE(empty->nr_of_models_alive(0) == 0);
    const Proposer stranded(1, ModelPrior::uniform(2), priors, ModelPerturbationKernel(2, 0.5), { nullptr, nullptr }, *empty);
    THROWS(stranded(rng), std::logic_error);
    THROWS(Proposer(0, ModelPrior::uniform(2), priors, ModelPerturbationKernel(2), kernels, *history), std::invalid_argument);
    gsl_rng_free(rng);
}

int main(void) {
    series_single_core();
    series_max_eval();
    series_all_accepted();
    series_validation();
    series_multicore();
    series_multicore_isolation();
    series_perturbed_weights();
    series_attempt_cap();
    series_extinct_routing();
    return test_status();
}
