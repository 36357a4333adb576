#ifndef ABCPOP_ABCUTIL_H
#define ABCPOP_ABCUTIL_H

#include <string>
#include <vector>
#include <gsl/gsl_rng.h>
#include <gsl/gsl_vector.h>
#include <gsl/gsl_matrix.h>

#include <AbcPop/TypeDefs.h>

namespace ABCPOP {

    std::string slurp(const std::string & filename);

    bool file_exists(const std::string & filename);

    float_type median(const Col & data);

    // the smallest value v such that the weights of values <= v sum to at least half the total weight
    float_type weighted_median(const Col & data, const Col & weights);

    float_type variance(const Col & data, const float_type _mean);

    // weighted mean of each column of `data`; `weights` need not be normalized
    Row weighted_mean(const Mat2D & data, const Col & weights);

    // weighted (biased, i.e. normalized by sum of weights) variance-covariance matrix of the columns of `data`
    Mat2D weighted_covariance(const Mat2D & data, const Col & weights);

    // normalized copy of `weights`; falls back to uniform weights if the sum is not positive and finite
    Col safe_normalize(const Col & weights);

    // a single weighted-random index in [0, weights.size())
    size_t gsl_rng_weighted_index(const gsl_rng * RNG, const std::vector<float_type> & weights);

    gsl_vector * to_gsl_v(const Row & from);

    gsl_matrix * to_gsl_m(const Mat2D & from);

}

#endif // ABCPOP_ABCUTIL_H
