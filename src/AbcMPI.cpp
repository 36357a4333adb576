#include <AbcPop/AbcMPI.h> // pre declarations for MPI functions / types

#include <algorithm>
#include <iostream>
#include <map>
#include <stdexcept>

using std::string;
using std::vector;
using std::cerr;
using std::endl;

namespace ABCPOP {

    Json::Value work_message(const SimulationContext & context, const Proposal & proposal, const unsigned long int seed, const size_t serial) {
        Json::Value msg;
        msg["context"] = context.to_json();
        msg["serial"] = Json::UInt64(serial);
        msg["seed"] = Json::UInt64(seed);
        msg["model"] = Json::UInt64(proposal.model);
        msg["parameter"] = Json::objectValue;
        for (auto & [key, val] : proposal.parameter) { msg["parameter"][key] = val; }
        return msg;
    }

    Json::Value result_message(const Evaluation & ev, const string & error) {
        Json::Value msg;
        msg["serial"] = Json::UInt64(ev.serial);
        msg["model"] = Json::UInt64(ev.model);
        msg["nr_simulations"] = Json::UInt64(ev.nr_simulations);
        msg["exhausted"] = ev.exhausted;
        if (not error.empty()) { msg["error"] = error; }
        msg["distances"] = Json::arrayValue;
        for (auto d : ev.particle.distances) { msg["distances"].append(d); }
        msg["sum_stats"] = Json::arrayValue;
        for (auto & ss : ev.particle.sum_stats) {
            Json::Value jss = Json::objectValue;
            for (auto & [key, val] : ss) { jss[key] = val; }
            msg["sum_stats"].append(jss);
        }
        return msg;
    }

    Evaluation from_result_message(const Json::Value & msg, string & error) {
        Evaluation ev;
        ev.serial = msg["serial"].asUInt64();
        ev.model = msg["model"].asUInt64();
        ev.particle.model = ev.model;
        ev.nr_simulations = msg["nr_simulations"].asUInt64();
        ev.exhausted = msg["exhausted"].asBool();
        ev.evaluated = true;
        error = msg.isMember("error") ? msg["error"].asString() : "";
        for (const Json::Value & d : msg["distances"]) { ev.particle.distances.push_back(d.asDouble()); }
        for (const Json::Value & jss : msg["sum_stats"]) {
            SumStats ss;
            for (auto & key : jss.getMemberNames()) { ss[key] = jss[key].asDouble(); }
            ev.particle.sum_stats.push_back(ss);
        }
        return ev;
    }

#ifdef ABCPOP_USE_MPI
    namespace {

        void send_json(const Json::Value & msg, const int dest, const int tag, MPI_Comm comm) {
            Json::StreamWriterBuilder builder;
            builder["indentation"] = "";
            const string buffer = Json::writeString(builder, msg);
            MPI_Send(buffer.data(), buffer.size(), MPI_CHAR, dest, tag, comm);
        }

        Json::Value recv_json(const int source, MPI_Status & status, MPI_Comm comm) {
            MPI_Probe(source, MPI_ANY_TAG, comm, &status);
            int count = 0;
            MPI_Get_count(&status, MPI_CHAR, &count);
            string buffer(count, '\0');
            MPI_Recv(buffer.data(), count, MPI_CHAR, status.MPI_SOURCE, status.MPI_TAG, comm, &status);

            Json::Value msg;
            Json::Reader reader;
            if (not reader.parse(buffer, msg)) {
                throw std::runtime_error("failed to parse MPI message: " + reader.getFormattedErrorMessages());
            }
            return msg;
        }

    }

    MPISampler::MPISampler(MPI_par * mp) : _mp(mp) {
        if (mp == nullptr or mp->mpi_size < 2) { throw std::invalid_argument("MPISampler: needs at least one worker rank"); }
        if (mp->mpi_rank != mpi_root) { throw std::invalid_argument("MPISampler: must be constructed on the root rank"); }
    }

    Sample MPISampler::sample(
        const size_t n, const Proposer & proposer, const Evaluator & evaluator,
        const Acceptor & acceptor, const SamplingOptions & options, const gsl_rng * rng
    ) {
        if (_stopped) { throw std::logic_error("MPISampler: workers already released"); }

        std::map<size_t, Proposal> outstanding;
        vector<Evaluation> results;
        size_t serial = 0, n_accepted = 0;

        // Seed the workers with the first jobs, then hand a new one to every worker that reports back
        auto dispatch = [&](const int rank) {
            if (n_accepted >= n or serial >= options.max_eval) return false;
            const Proposal proposal = proposer(rng);
            send_json(work_message(evaluator.context(), proposal, gsl_rng_get(rng), serial), rank, WORK_TAG, _mp->comm);
            outstanding[serial] = proposal;
            ++serial;
            return true;
        };

        size_t busy = 0;
        for (int rank = 1; rank < _mp->mpi_size; ++rank) { if (dispatch(rank)) { ++busy; } }

        while (busy > 0) {
            MPI_Status status;
            const Json::Value msg = recv_json(MPI_ANY_SOURCE, status, _mp->comm);
            --busy;

            string error;
            Evaluation ev = from_result_message(msg, error);
            auto it = outstanding.find(ev.serial);
            if (it == outstanding.end()) { throw std::runtime_error("MPISampler: result for unknown serial " + std::to_string(ev.serial)); }
            ev.particle.parameter = it->second.parameter;
            outstanding.erase(it);

            if (not error.empty()) {
                cerr << "WARNING: particle " << ev.serial << " failed on rank " << status.MPI_SOURCE << ": " << error << endl;
                ev.particle.distances.clear();
                ev.particle.sum_stats.clear();
            } else {
                evaluator.weigh(ev);
                ev.accepted = options.all_accepted or acceptor(ev);
                if (ev.accepted) { progress(++n_accepted, n); }
            }
            results.push_back(ev);

            if (dispatch(status.MPI_SOURCE)) { ++busy; }
        }

        std::sort(results.begin(), results.end(), [](const Evaluation & a, const Evaluation & b) { return a.serial < b.serial; });
        Sample res(options.record_rejected);
        for (auto & ev : results) {
            res.nr_simulations += ev.nr_simulations;
            res.append(ev);
        }
        _nr_evaluations = results.size();
        res.nr_evaluations = _nr_evaluations;
        res.set_ok(res.n_accepted() >= n);
        res.keep_first_accepted(n);
        return res;
    }

    void MPISampler::stop() {
        if (_stopped) return;
        release_workers(_mp);
        _stopped = true;
    }
#endif // ABCPOP_USE_MPI

    void release_workers(MPI_par * mp) {
#ifdef ABCPOP_USE_MPI
        if (mp == nullptr or mp->mpi_rank != mpi_root) return;
        int finalized = 0;
        MPI_Finalized(&finalized);
        if (finalized) return;
        for (int rank = 1; rank < mp->mpi_size; ++rank) {
            MPI_Send(0, 0, MPI_INT, rank, STOP_TAG, mp->comm);
        }
#else
        (void) mp;
#endif // ABCPOP_USE_MPI
    }

    void particle_worker(
        const ModelVec & models,
        const SumStats & observed,
        const SumStatsTransform & transform,
        MPI_par * mp,
        const size_t verbose
    ) {
#ifdef ABCPOP_USE_MPI
        while (true) {
            MPI_Status status;
            MPI_Probe(mpi_root, MPI_ANY_TAG, mp->comm, &status);

            // Check the tag of the received message.
            if (status.MPI_TAG == STOP_TAG) {
                MPI_Recv(0, 0, MPI_INT, mpi_root, STOP_TAG, mp->comm, &status);
                return;
            }

            const Json::Value msg = recv_json(mpi_root, status, mp->comm);
            const SimulationContext context = SimulationContext::from_json(msg["context"]);
            const DistancePtr distance = distance_from_json(context.distance);
            const DistanceToObserved distance_to_observed = [&distance, &observed](const SumStats & x) { return (*distance)(x, observed); };
            const Evaluator evaluator(models, context, distance_to_observed, transform, Weigher(context.budget), verbose);

            Proposal proposal;
            proposal.model = msg["model"].asUInt64();
            for (auto & key : msg["parameter"].getMemberNames()) { proposal.parameter[key] = msg["parameter"][key].asDouble(); }
            const size_t serial = msg["serial"].asUInt64();

            Json::Value reply;
            try {
                reply = result_message(evaluator.simulate(proposal, msg["seed"].asUInt64(), serial));
            } catch (const std::exception & e) {
                Evaluation failed;
                failed.serial = serial;
                failed.model = proposal.model;
                reply = result_message(failed, e.what());
            }
            send_json(reply, mpi_root, RESULT_TAG, mp->comm);
        }
#else
        (void) models; (void) observed; (void) transform; (void) mp; (void) verbose;
        throw std::logic_error("particle_worker: built without MPI support");
#endif // ABCPOP_USE_MPI
    }

}
