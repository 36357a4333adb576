#ifndef ABCPOP_ABCLOG_H
#define ABCPOP_ABCLOG_H

#include <iostream>
#include <string>
#include <vector>

#include <AbcPop/Particle.h>
#include <AbcPop/Priors.h>
#include <AbcPop/History.h>

namespace ABCPOP {

// Human readable run reports. Everything takes the pieces it reports on explicitly.
struct AbcLog {

    static void generation_report(
        const Population & pop, const size_t nr_requested,
        std::ostream & os = std::cerr
    );

    static void model_probabilities(
        const std::vector<std::string> & model_names,
        const std::vector<float_type> & probs,
        std::ostream & os = std::cerr
    );

    // weighted means and sds of `model`'s parameters at `t`, against the prior and generation t-1
    static void report_convergence_data(
        const History & history, const size_t t, const size_t model,
        const ParameterPrior & prior,
        std::ostream & os = std::cerr
    );

    static void print_stats(
        const std::string & str1, const std::string & str2,
        const double val1, const double val2,
        const double delta, const double pct_chg,
        const std::string & tail,
        std::ostream & os = std::cerr
    );

    static void warning(const std::string & msg, std::ostream & os = std::cerr) { os << "WARNING: " << msg << std::endl; }

    inline static const int WIDTH = 12;
    inline static const std::string double_bar = "=========================================================================================";

    private:
        AbcLog() {};

};

}

#endif // ABCPOP_ABCLOG_H
