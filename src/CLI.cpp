#include <AbcPop/CLI.h>

#include <cstring>
#include <cstdlib>
#include <algorithm>

using std::cerr;
using std::endl;
using std::string;

namespace ABCPOP {

void usage(
    const string &cmd,
    const string &msg,
    const int status
) {
    const string ident = "\t";
    if (not msg.empty()) { cerr << msg << endl; }
    cerr << "Usage: " << cmd << " config.json [-option|--option (each space separated)]" << endl << endl;
    cerr << "Options:" << endl;
    cerr << ident << "-(-s)eed 1234    : seed the run; overrides the configuration's `seed`." << endl;
    cerr << ident << "-(-t)hreads 4    : sample with 4 threads; overrides the configuration's `sampler`." << endl;
    cerr << ident << "-(-v)erbose      : when working, be effusive; repeat for more detail." << endl;
    cerr << ident << "-(-h)elp         : print this message; ignore all other options." << endl;
    cerr << endl;
    cerr << "Example uses:" << endl;
    cerr << "$ " << cmd << " config.json -v" << endl;
    cerr << "$ " << cmd << " config.json -s 42 -t 8 -v -v" << endl;
    cerr << "$ mpirun -n 16 " << cmd << " config.json # with an MPI sampler configured" << endl;
    if (status != 0) { exit(status); }
}

// non-exported helper function for finding argument flags
bool argcheck(const char * arg, const char * short_arg, const char * long_arg) {
    return (strcmp(arg, short_arg) == 0) or (strcmp(arg, long_arg) == 0);
}

// non-exported helper: the positive integer following flag `i`, or usage + exit
unsigned long int positive_arg(const string & cmd, const size_t argc, const char * argv[], size_t & i, const string & flag) {
    const string msg = "Error: " + flag + " must be followed by a positive integer.";
    // this will occur if the flag is the last argument, i.e. no number provided after
    if (i == (argc - 1)) { usage(cmd, msg, 103); }
    char * end = nullptr;
    const char * val = argv[++i];
    const long long res = strtoll(val, &end, 10);
    // this will occur if provided a negative number or a non-integer
    if ((*end != '\0') or (res < 1)) { usage(cmd, msg, 103); }
    return static_cast<unsigned long int>(res);
}

CLIArgs parse_args(const size_t argc, const char * argv[]) {

    // assert argv[0] = this program
    const string cmd = string(argv[0]);

    // check for help requested
    for (size_t i = 1; i < argc; ++i) {
        if (argcheck(argv[i], "-h", "--help")) {
            usage(cmd);
            CLIArgs args("");
            args.help = true;
            return args;
        }
    }

    if (argc < 2) { usage(cmd, "Error: a configuration file is required.", 101); }

    auto args = CLIArgs(string(argv[1]));

    for (size_t i = 2; i < argc; i++) {
        if (argcheck(argv[i], "-s", "--seed")) {
            args.seed.emplace(positive_arg(cmd, argc, argv, i, "-(-s)eed"));
        } else if (argcheck(argv[i], "-t", "--threads")) {
            args.threads.emplace(positive_arg(cmd, argc, argv, i, "-(-t)hreads"));
        } else if (argcheck(argv[i], "-v", "--verbose")) {
            args.verbose += 1;
        } else {
            usage(cmd, "Error: unrecognized argument: " + string(argv[i]), 104);
        }
    }

    return args;
};

} // namespace ABCPOP
