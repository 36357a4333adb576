#include <AbcPop/AbcUtil.h>

#include <algorithm>
#include <cassert>
#include <cmath>
#include <fstream>
#include <iostream>
#include <numeric>
#include <sstream>
#include <gsl/gsl_randist.h>

using std::string;
using std::vector;
using std::cerr;
using std::endl;
using std::stringstream;
using std::ifstream;

namespace ABCPOP {

    string slurp(const string & filename) {
        ifstream ifs(filename.c_str());
        stringstream sstr;
        sstr << ifs.rdbuf();
        return sstr.str();
    }

    bool file_exists(const string & filename) {
        ifstream infile(filename.c_str());
        return infile.good();
    }

    float_type median(const Col & data) {
        assert(data.size() > 0);
        // copy & sort data
        vector<float_type> vdata(data.data(), data.data()+data.size());
        const int n = vdata.size();
        sort(vdata.begin(), vdata.end());

        float_type median;

        if (n % 2 == 0) {
            median = (vdata[n / 2 - 1] + vdata[n / 2]) / 2;
        } else {
            median = vdata[n / 2];
        }

        return median;
    }

    float_type weighted_median(const Col & data, const Col & weights) {
        assert(data.size() > 0);
        assert(data.size() == weights.size());
        vector<size_t> order(data.size());
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(), [&data](size_t a, size_t b) { return data[a] < data[b]; });

        const Col w = safe_normalize(weights);
        float_type cumulative = 0.0;
        for (auto idx : order) {
            cumulative += w[idx];
            if (cumulative >= 0.5) { return data[idx]; }
        }
        return data[order.back()]; // only reachable through round-off
    }

    float_type variance(const Col & data, const float_type _mean) {
        if (data.size() < 2) {
            cerr << "WARNING: Variance called with " << data.size() << " data values. Returning 0." << endl;
            return 0;
        } else {
            return (data.array() - _mean).square().sum() / (data.size() - 1);
        }
    }

    Col safe_normalize(const Col & weights) {
        const float_type total = weights.sum();
        if (weights.size() == 0) { return weights; }
        if (not (std::isfinite(total) and (total > 0))) {
            return Col::Constant(weights.size(), 1.0 / weights.size());
        }
        return weights / total;
    }

    Row weighted_mean(const Mat2D & data, const Col & weights) {
        assert(data.rows() == weights.size());
        const Col w = safe_normalize(weights);
        return w.transpose() * data;
    }

    Mat2D weighted_covariance(const Mat2D & data, const Col & weights) {
        assert(data.rows() == weights.size());
        const Col w = safe_normalize(weights);
        const Row mu = w.transpose() * data;
        const Mat2D centered = data.rowwise() - mu;
        return centered.transpose() * w.asDiagonal() * centered;
    }

    size_t gsl_rng_weighted_index(const gsl_rng * RNG, const vector<float_type> & weights) {
        assert(not weights.empty());
        gsl_ran_discrete_t * gslweights = gsl_ran_discrete_preproc(weights.size(), weights.data());
        const size_t res = gsl_ran_discrete(RNG, gslweights);
        gsl_ran_discrete_free(gslweights);
        return res;
    }

    gsl_vector * to_gsl_v(const Row & from) {
        gsl_vector * res = gsl_vector_alloc(from.size());
        for (size_t i = 0; i < static_cast<size_t>(from.size()); i++) {
            gsl_vector_set(res, i, from[i]);
        }
        return res;
    }

    gsl_matrix * to_gsl_m(const Mat2D & from) {
        gsl_matrix * res = gsl_matrix_alloc(from.rows(), from.cols());
        for (size_t i = 0; i < static_cast<size_t>(from.rows()); i++) {
            for (size_t j = 0; j < static_cast<size_t>(from.cols()); j++) {
                gsl_matrix_set(res, i, j, from(i,j));
            }
        }
        return res;
    }

}
