#include <vector>
#include "dice.h"

// simulator entry point for a shared object: parameters (ndice, sides) => metrics (sum, sd)
extern "C" std::vector<double> simulator(
    std::vector<double> args,
    const unsigned long int rng_seed,
    const unsigned long int /* serial */
) {
    return dice::fair(static_cast<size_t>(args[0]), static_cast<size_t>(args[1]), rng_seed);
}
