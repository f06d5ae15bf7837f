#ifndef STITCHING_BLOCKTASKPOOL_HXX
#define STITCHING_BLOCKTASKPOOL_HXX

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

#include <boost/exception_ptr.hpp>
#include <boost/thread.hpp>
#include <boost/thread/mutex.hpp>

namespace Stitching {

// serializes HDF5 access and console output of worker threads
extern boost::mutex io_mutex;

/*
 * Runs task(0) ... task(n-1) on a group of worker threads.
 *
 * TASK has to provide void operator()(size_t). Every call must only write to
 * state owned by its own index; the pool itself hands out indices under a
 * mutex. The first exception thrown by a task stops the distribution of new
 * indices and is rethrown by run() once all threads have joined.
 */
template<class TASK >
class BlockTaskPool
{
public:
    BlockTaskPool(int num_threads, int verbose = 0, const std::string &prefix = "BlockTaskPool: ")
    : num_threads(std::max(1, num_threads)), verbose(verbose), prefix(prefix) {}

    void run(size_t num_tasks, TASK &task)
    {
        if (num_tasks == 0)
            return ;

        State state(task, num_tasks);
        int n = std::min<size_t>(num_threads, num_tasks);

        if (verbose) {
            boost::mutex::scoped_lock lock(io_mutex);
            std::cerr << prefix << "totally " << num_tasks << " tasks on " << n << " threads" << std::endl;
            std::cerr << prefix << "completed: ";
        }

        boost::thread_group threadGroup;
        for (int iThread = 0; iThread < n; iThread ++)
            threadGroup.create_thread(Worker(&state, verbose));
        threadGroup.join_all();

        if (verbose) {
            boost::mutex::scoped_lock lock(io_mutex);
            std::cerr << std::endl << prefix << "all threads finished" << std::endl;
        }

        if (state.failed)
            boost::rethrow_exception(state.error);
    }

private:
    struct State {
        State(TASK &task, size_t total)
        : task(&task), next(0), total(total), completed(0), failed(false) {}

        boost::mutex task_mutex;
        TASK *task;
        size_t next, total, completed;
        bool failed;
        boost::exception_ptr error;
    };

    struct Worker {
        Worker(State *state, int verbose) : state(state), verbose(verbose) {}

        void operator()() {
            while (1) {
                size_t index;
                {
                    boost::mutex::scoped_lock lock(state->task_mutex);
                    if (state->failed || state->next >= state->total)
                        return ;
                    index = state->next ++;
                }

                try {
                    (*state->task)(index);
                }
                catch (...) {
                    boost::mutex::scoped_lock lock(state->task_mutex);
                    if (!state->failed) {
                        state->failed = true;
                        state->error = boost::current_exception();
                    }
                    return ;
                }

                boost::mutex::scoped_lock lock(state->task_mutex);
                state->completed ++;
                if (verbose && state->completed % 4 == 0) {
                    boost::mutex::scoped_lock lock2(io_mutex);
                    std::cerr << floor (0.5+state->completed/float(state->total)*100.0) << "%-";
                }
            }
        }

        State *state;
        int verbose;
    };

    int num_threads;
    int verbose;
    std::string prefix;
};

} /* namespace Stitching */

#endif /* STITCHING_BLOCKTASKPOOL_HXX */
