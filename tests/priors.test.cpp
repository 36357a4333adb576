#include "testing.h"
#include <AbcPop/Priors.h>

#include <cmath>
#include <stdexcept>

using namespace ABCPOP;
using std::make_shared;

void series_marginal_priors() {
    const DiscreteUniformPrior dice("number of dice", "ndice", 1, 4);
    IS_TRUE(dice.likelihood(2) == 0.25);
    IS_TRUE(dice.likelihood(2.5) == 0.0);
    IS_TRUE(dice.likelihood(5) == 0.0);
    IS_TRUE(dice.recast(2.4) == 2.0);
    IS_TRUE(dice.valid(4) and not dice.valid(0));

    const ContinuousUniformPrior unif("loading", "", 0.0, 2.0);
    IS_TRUE(unif.get_short_name() == "loading");
    IS_TRUE(unif.likelihood(1.3) == 0.5);
    IS_TRUE(unif.recast(1.3) == 1.3);

    const GaussianPrior norm("location", "mu", 1.0, 2.0);
    IS_TRUE(std::fabs(norm.likelihood(1.0) - 1.0 / (2.0 * std::sqrt(2 * M_PI))) < 1e-12);
    IS_TRUE(norm.get_mean() == 1.0 and norm.get_sd() == 2.0);

    // a lattice straddling zero
    const DiscreteUniformPrior offset("offset", "off", -3, 3);
    gsl_rng * rng = gsl_rng_alloc(gsl_rng_taus2);
    bool in_range = true;
    bool reaches_min = false;
    for (size_t i = 0; i < 500; ++i) {
        const float_type v = offset.sample(rng);
        in_range = in_range and (-3 <= v) and (v <= 3) and (offset.likelihood(v) > 0);
        reaches_min = reaches_min or (v == -3);
    }
    gsl_rng_free(rng);
    IS_TRUE(in_range);
    IS_TRUE(reaches_min);
    IS_TRUE(std::fabs(offset.likelihood(-2) - 1.0 / 7) < 1e-12);

    THROWS(GaussianPrior("bad", "bad", 0.0, 0.0), std::invalid_argument);
    THROWS(DiscreteUniformPrior("bad", "bad", 3, 3), std::invalid_argument);
}

void series_parameter_prior() {
    ParameterPrior pp({
        make_shared<DiscreteUniformPrior>("number of dice", "ndice", 1, 4),
        make_shared<ContinuousUniformPrior>("loading", "bias", 0.0, 1.0)
    });
    IS_TRUE(pp.size() == 2);
    IS_TRUE(pp.names()[0] == "ndice" and pp.names()[1] == "bias");

    IS_TRUE(pp.pdf({ { "ndice", 3 }, { "bias", 0.5 } }) == 0.25);
    IS_TRUE(pp.pdf({ { "ndice", 3 } }) == 0.0);
    IS_TRUE(pp.pdf({ { "ndice", 3.5 }, { "bias", 0.5 } }) == 0.0);

    const Parameter recast = pp.recast({ { "ndice", 2.6 }, { "bias", 0.25 } });
    IS_TRUE(recast.at("ndice") == 3 and recast.at("bias") == 0.25);

    gsl_rng * rng = gsl_rng_alloc(gsl_rng_taus2);
    bool all_valid = true;
    for (size_t i = 0; i < 100; ++i) { all_valid = all_valid and (pp.pdf(pp.rvs(rng)) > 0); }
    IS_TRUE(all_valid);
    gsl_rng_free(rng);

    THROWS(pp.add_next_parameter(make_shared<GaussianPrior>("again", "bias", 0.0, 1.0)), std::invalid_argument);
}

void series_model_prior() {
    const ModelPrior mp({ 1.0, 3.0, 0.0 });
    IS_TRUE(mp.size() == 3);
    IS_TRUE(mp.pmf(0) == 0.25 and mp.pmf(1) == 0.75 and mp.pmf(2) == 0.0);
    IS_TRUE(mp.pmf(7) == 0.0);

    gsl_rng * rng = gsl_rng_alloc(gsl_rng_taus2);
    bool never_zero = true;
    for (size_t i = 0; i < 200; ++i) { never_zero = never_zero and (mp.rvs(rng) != 2); }
    IS_TRUE(never_zero);
    gsl_rng_free(rng);

    IS_TRUE(ModelPrior::uniform(4).pmf(3) == 0.25);
    THROWS(ModelPrior({ 0.0, 0.0 }), std::invalid_argument);
    THROWS(ModelPrior({ 1.0, -1.0 }), std::invalid_argument);
    THROWS(ModelPrior(std::vector<float_type>{}), std::invalid_argument);
}

int main(void) {
    series_marginal_priors();
    series_parameter_prior();
    series_model_prior();
    return test_status();
}
