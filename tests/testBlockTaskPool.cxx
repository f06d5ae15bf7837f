#include <vector>

#include <boost/throw_exception.hpp>

#define BOOST_TEST_MODULE TestBlockTaskPool
#include <boost/test/unit_test.hpp>

#include "stitching/blockTaskPool.hxx"
#include "stitching/errors.hxx"

using namespace Stitching;


namespace {
    struct SquareTask {
        SquareTask(size_t n) : results(n, 0) {}

        void operator()(size_t k) {
            results[k] = k * k;
        }

        std::vector<size_t > results;
    };

    struct FailingTask {
        FailingTask(size_t failAt) : failAt(failAt) {}

        void operator()(size_t k) {
            if (k == failAt)
                boost::throw_exception(MalformedBoundaryGroup("task failed"));
        }

        size_t failAt;
    };
}


BOOST_AUTO_TEST_SUITE(BlockTaskPools)

BOOST_AUTO_TEST_CASE( EveryTaskRunsOnce )
{
    for (int threads = 1; threads <= 4; threads++) {
        SquareTask task(37);
        BlockTaskPool<SquareTask > pool(threads);
        pool.run(task.results.size(), task);
        for (size_t k = 0; k < task.results.size(); k++)
            BOOST_REQUIRE_EQUAL(task.results[k], k * k);
    }

    SquareTask none(0);
    BlockTaskPool<SquareTask > pool(3);
    pool.run(0, none);
    BOOST_CHECK(none.results.empty());
}

BOOST_AUTO_TEST_CASE( FirstFailureIsRethrown )
{
    FailingTask task(5);
    BlockTaskPool<FailingTask > pool(4);
    BOOST_CHECK_THROW(pool.run(20, task), MalformedBoundaryGroup);

    BlockTaskPool<FailingTask > single(1);
    BOOST_CHECK_THROW(single.run(20, task), MalformedBoundaryGroup);
}

BOOST_AUTO_TEST_SUITE_END()
