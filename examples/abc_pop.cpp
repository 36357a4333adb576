#include <AbcPop/AbcSmc.h>
#include <AbcPop/AbcLog.h>
#include <AbcPop/AbcMPI.h>
#include <AbcPop/CLI.h>
#include <AbcPop/Config.h>

#include <iostream>

using namespace std;
using namespace ABCPOP;

// The command line front end: fits the models of a JSON configuration and reports the last population.
struct AbcPopApp {
    AbcPopApp(MPI_par * mp) : _mp(mp) {}

    void parse(const string & config_file, const size_t /* verbose */) {
        _config = make_unique<JsonConfig>(config_file);
        _settings = _config->settings();
    }

    void fit(const optional<unsigned long int> seed, const optional<size_t> threads, const size_t verbose) {
        if (_mp->mpi_rank != mpi_root) {
            // worker ranks only simulate
            particle_worker(_config->models(), _config->observed(), identity, _mp, verbose);
            return;
        }

        const SamplerPtr sampler = threads ? make_shared<MulticoreSampler>(*threads) : nullptr;
        _abc = _config->make_abc(_mp, sampler);
        if (seed) { _abc->set_seed(*seed); }
        _abc->set_verbose(verbose);
        _abc->set_show_progress(verbose > 1);

        // worker ranks have nothing to do unless the sampler is the MPI one
        if (_mp->mpi_size > 1 and _abc->sampler().strategy().name() != "MPI") {
            AbcLog::warning("sampling with " + _abc->sampler().strategy().name() + "; releasing the MPI worker ranks");
            release();
        }

        _history = make_shared<MemoryHistory>();
        _abc->set_data(_config->observed(), _history, nullopt, Parameter(), _config->root());
        _abc->run(_settings.nr_samples_per_particle, _settings.min_epsilon);
    }

    // lets the worker ranks leave `particle_worker`; must precede MPI_Finalize, whether or not `fit` succeeded
    void release() {
        if (_released or _mp->mpi_rank != mpi_root) return;
        if (_abc) {
            _abc->sampler().stop();
        }
        if (not _abc or _abc->sampler().strategy().name() != "MPI") {
            release_workers(_mp);
        }
        _released = true;
    }

    void report(const size_t /* verbose */) {
        if (not _abc or _history->max_t() < 0) return;
        const size_t t = _history->max_t();
        const Population & pop = _history->population(t);
        cout << "generations: " << t + 1 << ", epsilon: " << pop.epsilon() << ", simulations: " << _history->total_nr_simulations() << endl;
        AbcLog::model_probabilities(_abc->model_names(), _history->get_model_probabilities(t), cout);
        for (size_t m = 0; m < _abc->nr_models(); ++m) {
            AbcLog::report_convergence_data(*_history, t, m, *_abc->parameter_priors()[m], cout);
        }
        if (_abc->incomplete()) { cout << "WARNING: the last generation is incomplete" << endl; }
    }

    private:
        MPI_par * _mp;
        unique_ptr<JsonConfig> _config;
        RunSettings _settings;
        unique_ptr<AbcSmc> _abc;
        shared_ptr<MemoryHistory> _history;
        bool _released = false;
};

int main(int argc, const char* argv[]) {
    MPI_par mp;
#ifdef ABCPOP_USE_MPI
    MPI_Init(&argc, const_cast<char***>(&argv));
    mp.comm = MPI_COMM_WORLD;
    mp.info = MPI_INFO_NULL;
    MPI_Comm_size(mp.comm, &mp.mpi_size);
    MPI_Comm_rank(mp.comm, &mp.mpi_rank);
#endif

    int status = 0;
    const CLIArgs args = parse_args(argc, argv);
    AbcPopApp app(&mp);
    try {
        run(&app, args);
    } catch (const exception & e) {
        cerr << "ERROR: " << e.what() << endl;
        status = 1;
    }
    app.release();

#ifdef ABCPOP_USE_MPI
    MPI_Finalize();
#endif
    return status;
}
