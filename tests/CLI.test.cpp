#include "testing.h"
#include <AbcPop/CLI.h>
#include <string>

using namespace ABCPOP;
using namespace std;

// Records the calls made by `run`, for some object that implements the fitting *verbs*:
// - parse(a configuration file, a verbosity level)
// - fit(an optional seed, an optional thread count, a verbosity level)
// - report(a verbosity level)
struct MockAbcPop {
    string parsed;
    optional<unsigned long int> seed;
    optional<size_t> threads;
    size_t fits = 0;
    size_t reports = 0;

    void parse(const string &config_file, const size_t verbosity = 1) {
        if (verbosity > 0) {
            cout << "parse(" << config_file << ")" << endl;
        }
        parsed = config_file;
    }
    void fit(const optional<unsigned long int> rng_seed, const optional<size_t> nthreads, const size_t verbosity = 1) {
        if (verbosity > 0) {
            cout << "fitting, verbosity = " << verbosity << endl;
        }
        seed = rng_seed;
        threads = nthreads;
        ++fits;
    }
    void report(const size_t verbosity = 1) {
        if (verbosity > 0) {
            cout << "reporting" << endl;
        }
        ++reports;
    }
};

void series_help() {
    MockAbcPop abc;
    const char* useargs[] = {"./CLI.test", "config.json", "-h"};
    cerr << "Should print usage message:" << endl;
    auto args = parse_args(3, useargs);
    cerr << endl;
    IS_TRUE(args.help);
    run(&abc, args);
    IS_TRUE(abc.fits == 0 and abc.parsed.empty());
}

void series_defaults() {
    MockAbcPop abc;
    const char* bargs[] = {"./CLI.test", "config.json"};
    auto args = parse_args(2, bargs);
    IS_TRUE(args.config_file == "config.json");
    IS_TRUE(not args.seed and not args.threads and args.verbose == 0);
    run(&abc, args);
    IS_TRUE(abc.parsed == "config.json" and abc.fits == 1 and abc.reports == 1);
    IS_TRUE(not abc.seed and not abc.threads);
}

void series_overrides() {
    MockAbcPop abc;
    const char* sargs[] = {"./CLI.test", "config.json", "-v", "--seed", "42", "-t", "8", "--verbose"};
    auto args = parse_args(8, sargs);
    IS_TRUE(args.verbose == 2);
    IS_TRUE(args.seed == optional<unsigned long int>(42));
    IS_TRUE(args.threads == optional<size_t>(8));
    cerr << "Should be fitting with seed 42 and 8 threads:" << endl;
    run(&abc, args);
    cerr << endl;
    IS_TRUE(abc.seed == optional<unsigned long int>(42) and abc.threads == optional<size_t>(8));
}

int main() {
    series_help();
    series_defaults();
    series_overrides();
    return test_status();
}
