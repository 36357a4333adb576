#ifndef ABCPOP_EXAMPLES_DICE_H
#define ABCPOP_EXAMPLES_DICE_H

#include <memory>
#include <vector>
#include <gsl/gsl_rng.h>
#include <gsl/gsl_statistics_double.h>

// Dice games used by the example programs. Each returns the metrics { sum, sd } of one game.
// Every call owns its generator, so these are safe to call concurrently.
namespace dice {

    typedef std::unique_ptr<gsl_rng, decltype(&gsl_rng_free)> RngPtr;

    inline RngPtr seeded(const unsigned long int rng_seed) {
        RngPtr rng(gsl_rng_alloc(gsl_rng_taus2), gsl_rng_free);
        gsl_rng_set(rng.get(), rng_seed); // seed the rng using the seed
        return rng;
    }

    inline std::vector<double> summarize(const std::vector<double> & results) {
        std::vector<double> metrics(2, 0.0);
        for (auto r : results) { metrics[0] += r; }
        if (results.size() > 1) { metrics[1] = gsl_stats_sd(results.data(), 1, results.size()); }
        return metrics;
    }

    // `ndice` fair dice with `sides` sides each
    inline std::vector<double> fair(const size_t ndice, const size_t sides, const unsigned long int rng_seed) {
        RngPtr rng = seeded(rng_seed);
        std::vector<double> results(ndice, 0);
        for (size_t i = 0; i < ndice; i++) { results[i] = gsl_rng_uniform_int(rng.get(), sides) + 1; }
        return summarize(results);
    }

    // as `fair`, but each die shows its highest face with extra probability `bias`
    inline std::vector<double> loaded(const size_t ndice, const size_t sides, const double bias, const unsigned long int rng_seed) {
        RngPtr rng = seeded(rng_seed);
        std::vector<double> results(ndice, 0);
        for (size_t i = 0; i < ndice; i++) {
            results[i] = (gsl_rng_uniform(rng.get()) < bias) ? sides : gsl_rng_uniform_int(rng.get(), sides) + 1;
        }
        return summarize(results);
    }

}

#endif // ABCPOP_EXAMPLES_DICE_H
