#ifndef ABCPOP_MPI_H
#define ABCPOP_MPI_H

#include <json/json.h>

#include <AbcPop/AbcMPIPar.h> // for the MPI_par struct
#include <AbcPop/AbcSim.h>
#include <AbcPop/Distance.h>
#include <AbcPop/Sampler.h>

// Distributes simulations over MPI ranks. The root rank proposes, weighs and accepts;
// the other ranks run `particle_worker`, which only simulates. Messages are JSON documents.
namespace ABCPOP {

    // wire format of one unit of work, and of its result
    Json::Value work_message(const SimulationContext & context, const Proposal & proposal, const unsigned long int seed, const size_t serial);
    Json::Value result_message(const Evaluation & ev, const std::string & error = "");
    // rebuilds the simulated part of an evaluation; `error` receives the worker's failure message, if any
    Evaluation from_result_message(const Json::Value & msg, std::string & error);

    // sends every worker rank its stop message; a no-op on a worker rank, without workers,
    // after MPI_Finalize, or in a build without MPI
    void release_workers(MPI_par * mp);

#ifdef ABCPOP_USE_MPI
    class MPISampler : public Sampler {
        public:
            // throws std::invalid_argument if there is no worker rank
            MPISampler(MPI_par * mp);
            ~MPISampler() { stop(); }

            Sample sample(
                const size_t n, const Proposer & proposer, const Evaluator & evaluator,
                const Acceptor & acceptor, const SamplingOptions & options, const gsl_rng * rng
            ) override;

            // tells the workers they're done
            void stop() override;

            std::string name() const override { return "MPI"; }

        private:
            MPI_par * _mp;
            bool _stopped = false;
    };
#endif // ABCPOP_USE_MPI

    // the worker rank loop: simulate whatever the root sends, until told to stop.
    // The distance to `observed` is rebuilt from each message's context.
    void particle_worker(
        const ModelVec & models,
        const SumStats & observed,
        const SumStatsTransform & transform,
        MPI_par * mp,
        const size_t verbose = 0
    );

}

#endif // ABCPOP_MPI_H
