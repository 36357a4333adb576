#include <AbcPop/AbcSmc.h>
#include <AbcPop/AbcLog.h>
#include "dice.h"

#include <cstdlib>
#include <iostream>

using namespace std;
using namespace ABCPOP;

// this version of a main program demonstrates:
//  - using the AbcSmc class without a configuration file
//  - simulators defined inline, as callables
//  - model selection between a fair and a loaded dice game

int main(int argc, char* argv[]) {

    if (argc != 3) {
        cerr << "\n\tUsage: examples/direct sum_val sd_val\n\n";
        return 100;
    }

    const SumStats observed = { { "sum", atof(argv[1]) }, { "sd", atof(argv[2]) } };
    const vector<string> met_names = { "sum", "sd" };

    auto fair_prior = make_shared<ParameterPrior>(vector<PriorPtr>{
        make_shared<DiscreteUniformPrior>("number of dice", "ndice", 1, 20),
        make_shared<DiscreteUniformPrior>("sides per die", "sides", 2, 20)
    });
    auto loaded_prior = make_shared<ParameterPrior>(vector<PriorPtr>{
        make_shared<ContinuousUniformPrior>("loading", "bias", 0.0, 1.0),
        make_shared<DiscreteUniformPrior>("number of dice", "ndice", 1, 20),
        make_shared<DiscreteUniformPrior>("sides per die", "sides", 2, 20)
    });

    auto fair_sim = make_shared<SimFunction>([](vector<float_type> pars, const unsigned long int seed, const unsigned long int) {
        return dice::fair(pars[0], pars[1], seed);
    });
    auto loaded_sim = make_shared<SimFunction>([](vector<float_type> pars, const unsigned long int seed, const unsigned long int) {
        return dice::loaded(pars[1], pars[2], pars[0], seed);
    });

    const ModelVec models = {
        make_shared<SimulatorModel>("fair", fair_prior->names(), met_names, fair_sim),
        make_shared<SimulatorModel>("loaded", loaded_prior->names(), met_names, loaded_sim)
    };

    AbcSmc abc(
        models, ModelPrior::uniform(2), ModelPerturbationKernel(2, 0.7),
        { fair_prior, loaded_prior },
        { make_shared<MultivariateNormalTransition>(), make_shared<MultivariateNormalTransition>() },
        make_shared<ZScoreDistance>(), MedianEpsilon::from_sample(),
        500, make_shared<MulticoreSampler>()
    );
    abc.set_seed(42);
    abc.set_verbose(1);

    auto history = make_shared<MemoryHistory>();
    abc.set_data(observed, history);
    abc.run({ 1, 1, 1, 1, 1, 1, 1, 1 }, 0.05);

    const size_t t = history->max_t();
    AbcLog::model_probabilities(abc.model_names(), history->get_model_probabilities(t), cout);
    return abc.incomplete() ? 1 : 0;
}
