#include <AbcPop/AbcLog.h>
#include <AbcPop/AbcUtil.h>

#include <cmath>
#include <iomanip>

using std::setw;
using std::endl;
using std::ostream;
using std::string;
using std::vector;

namespace ABCPOP {

void AbcLog::print_stats(
    const std::string &str1, const std::string &str2,
    const double val1, const double val2, const double delta, const double pct_chg,
    const std::string &tail, ostream &os
) {
    os << "    " + str1 + ", " + str2 + "  ( delta, % ): "  << setw(WIDTH) << val1 << ", " << setw(WIDTH) << val2
                                                      << " ( " << setw(WIDTH) << delta << ", " << setw(WIDTH) << pct_chg  << "% )\n" + tail;
}

void AbcLog::generation_report(const Population & pop, const size_t nr_requested, ostream & os) {
    const double acceptance = pop.nr_evaluations > 0 ? static_cast<double>(pop.nr_accepted) / pop.nr_evaluations : 0.0;
    os << double_bar << endl << "Generation " << pop.t() << endl << double_bar << endl;
    os << setw(WIDTH) << "epsilon" << setw(WIDTH) << "accepted" << setw(WIDTH) << "requested"
       << setw(WIDTH) << "kept" << setw(WIDTH) << "evals" << setw(WIDTH) << "sims" << setw(WIDTH) << "acc. rate" << endl;
    os << setw(WIDTH) << pop.epsilon() << setw(WIDTH) << pop.nr_accepted << setw(WIDTH) << nr_requested
       << setw(WIDTH) << pop.size() << setw(WIDTH) << pop.nr_evaluations << setw(WIDTH) << pop.nr_simulations
       << setw(WIDTH) << acceptance << endl;
    if (pop.nr_degenerate_weights > 0) {
        warning(std::to_string(pop.nr_degenerate_weights) + " particle(s) had a zero importance weight normalization and were dropped", os);
    }
}

void AbcLog::model_probabilities(const vector<string> & model_names, const vector<float_type> & probs, ostream & os) {
    os << "Model probabilities:" << endl;
    for (size_t m = 0; m < probs.size(); ++m) {
        const string name = m < model_names.size() ? model_names[m] : std::to_string(m);
        os << "  " << setw(WIDTH) << std::left << name << std::right << setw(WIDTH) << probs[m] << (probs[m] == 0 ? "  (extinct)" : "") << endl;
    }
}

void AbcLog::report_convergence_data(
    const History & history, const size_t t, const size_t model,
    const ParameterPrior & prior, ostream & os
) {
    const WeightedParameters current = history.weighted_particles(t, model);
    if (current.empty()) return;
    const Row current_means = weighted_mean(current.values, current.weights);
    const Row current_sds = weighted_covariance(current.values, current.weights).diagonal().array().sqrt().matrix().transpose();

    WeightedParameters last;
    Row last_means, last_sds;
    if (t > 0) {
        last = history.weighted_particles(t - 1, model);
        if (not last.empty()) {
            last_means = weighted_mean(last.values, last.weights);
            last_sds = weighted_covariance(last.values, last.weights).diagonal().array().sqrt().matrix().transpose();
        }
    }

    os << (t == 0 ? "Predictive prior summary statistics" : "Convergence data for predictive priors")
       << " (model " << model << "):\n";
    for (size_t priorIdx = 0; priorIdx < prior.size(); priorIdx++) {
        const PriorPtr & par = prior.at(priorIdx);
        // columns of `current` are sorted by name
        size_t parIdx = 0;
        while (parIdx < current.names.size() and current.names[parIdx] != par->get_short_name()) { ++parIdx; }
        if (parIdx == current.names.size()) continue;

        const double prior_mean = par->get_mean();
        const double prior_mean_delta = current_means[parIdx] - prior_mean;
        const double prior_mean_pct_chg = prior_mean != 0 ? 100 * prior_mean_delta / prior_mean : INFINITY;

        const double prior_stdev = par->get_sd();
        const double prior_stdev_delta = current_sds[parIdx] - prior_stdev;
        const double prior_stdev_pct_chg = prior_stdev != 0 ? 100 * prior_stdev_delta / prior_stdev : INFINITY;
        os << "  Par " << priorIdx << ": \"" << par->get_name() << "\"\n";
        os << "  Means:\n";
        print_stats("Prior", "current", prior_mean, current_means[parIdx], prior_mean_delta, prior_mean_pct_chg, "", os);

        if (last_means.size() > 0) {
            double delta = current_means[parIdx] - last_means[parIdx];
            double pct_chg = last_means[parIdx] != 0 ? 100 * delta / last_means[parIdx] : INFINITY;
            print_stats("Last", " current", last_means[parIdx], current_means[parIdx], delta, pct_chg, "\n", os);
        }

        os << "  Standard deviations:\n";
        print_stats("Prior", "current", prior_stdev, current_sds[parIdx], prior_stdev_delta, prior_stdev_pct_chg, "\n", os);

        if (last_sds.size() > 0) {
            double delta = current_sds[parIdx] - last_sds[parIdx];
            double pct_chg = last_sds[parIdx] != 0 ? 100 * delta / last_sds[parIdx] : INFINITY;
            print_stats("Last", " current", last_sds[parIdx], current_sds[parIdx], delta, pct_chg, "\n", os);
        }
    }
}

}
