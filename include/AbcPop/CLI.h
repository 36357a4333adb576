#ifndef ABCPOP_CLI_H
#define ABCPOP_CLI_H

#include <iostream>
#include <optional>
#include <string>

namespace ABCPOP {

// A "usage" function for the built-in AbcPop CLI
// @param cmd the name of the executable
// @param msg an optional message to print before the usage
// @param status if non-zero, will exit with this status
void usage(
    const std::string &cmd,
    const std::string &msg = "",
    const int status = 0
);

// Container for the parsed command line arguments
// @var config_file the path to the configuration file
// @var seed overrides the configured seed
// @var threads overrides the configured sampler with a multicore one using this many threads
// @var verbose the verbosity level (0 = quiet, 1 = generation reports, 2 = + convergence, 3 = + per simulation timing)
struct CLIArgs {
    CLIArgs() = delete;
    CLIArgs(const std::string & cf) : config_file(cf) {};

    std::string config_file;                 // based on config file ...
    std::optional<unsigned long int> seed;   // ... with the configured seed
    std::optional<size_t> threads;           // ... and the configured sampler
    size_t verbose = 0;                      // ... quietly
    bool help = false;
};

// parses the args passed to a typical main() function for an AbcPop program
// @param argc the number of arguments (per typical main() signature)
// @param argv the arguments (per typical main() signature)
CLIArgs parse_args(const size_t argc, const char * argv[]);

// Runs the fitting process, for some object that implements the verbs:
// - parse(a string [configuration file path], a size_t [verbosity level])
// - fit(an optional seed, optional thread count, a verbosity level)
// - report(a verbosity level)
template<typename ABC>
inline void run(
    ABC* abc, const CLIArgs &args
) {
    if (args.help) return;

    abc->parse(args.config_file, args.verbose);

    if (args.verbose > 0) {
        std::cerr << "Running AbcPop with " << args.config_file;
        if (args.seed) { std::cerr << ", seed " << *args.seed; }
        if (args.threads) { std::cerr << ", " << *args.threads << " threads"; }
        std::cerr << std::endl;
    }

    abc->fit(args.seed, args.threads, args.verbose);
    abc->report(args.verbose);
};

}

#endif // ABCPOP_CLI_H
