#include <vector>
#include "dice.h"

// simulator entry point for a shared object: parameters (bias, ndice, sides) => metrics (sum, sd)
// n.b. parameters arrive in the order the configuration lists them
extern "C" std::vector<double> simulator(
    std::vector<double> args,
    const unsigned long int rng_seed,
    const unsigned long int /* serial */
) {
    return dice::loaded(static_cast<size_t>(args[1]), static_cast<size_t>(args[2]), args[0], rng_seed);
}
