// MPI bookkeeping shared by the sampler, the worker loop and the front end
#ifndef ABCPOP_MPI_PAR_H
#define ABCPOP_MPI_PAR_H

#ifdef ABCPOP_USE_MPI
#include <mpi.h>
#endif // ABCPOP_USE_MPI

// add MPI management to the ABCPOP namespace
namespace ABCPOP {

    const int mpi_root = 0;

    enum MPI_TAG { WORK_TAG = 1, RESULT_TAG = 2, STOP_TAG = 3 };

    struct MPI_par {
#ifdef ABCPOP_USE_MPI
        MPI_Comm comm;
        MPI_Info info;
        int mpi_size, mpi_rank;
#else
        const static int mpi_size = 1;
        const static int mpi_rank = 0;
#endif // ABCPOP_USE_MPI
    };

}

#endif // ABCPOP_MPI_PAR_H
