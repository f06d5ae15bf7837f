#include <map>
#include <vector>

#include <boost/shared_ptr.hpp>
#include <vigra/multi_array.hxx>

#define BOOST_TEST_MODULE TestOverlapTable
#include <boost/test/unit_test.hpp>

#include "stitching/errors.hxx"
#include "stitching/overlapTable.hxx"

using namespace Stitching;


namespace {
    // a: 1 1 1 2 2 0     b: 4 4 3 3 3 0
    void fillVolumes(label_volume &a, label_volume &b)
    {
        a.reshape(volume_shape(6, 1, 1));
        b.reshape(volume_shape(6, 1, 1));
        label_type va[] = {1, 1, 1, 2, 2, 0};
        label_type vb[] = {4, 4, 3, 3, 3, 0};
        for (int i = 0; i < 6; i++) {
            a[i] = va[i];
            b[i] = vb[i];
        }
    }
}


BOOST_AUTO_TEST_SUITE(OverlapTables)

BOOST_AUTO_TEST_CASE( CountsAndRowSums )
{
    label_volume a, b;
    fillVolumes(a, b);

    for (int sparse = 0; sparse < 2; sparse++) {
        boost::shared_ptr<OverlapTable> table = buildOverlap(a, b, sparse != 0);
        BOOST_CHECK_EQUAL(table->count(1, 4), 2u);
        BOOST_CHECK_EQUAL(table->count(1, 3), 1u);
        BOOST_CHECK_EQUAL(table->count(2, 3), 2u);
        BOOST_CHECK_EQUAL(table->count(0, 0), 1u);
        BOOST_CHECK_EQUAL(table->count(2, 4), 0u);
        BOOST_CHECK_EQUAL(table->count(9, 9), 0u);
        BOOST_CHECK_EQUAL(table->rows(), 3u);
        BOOST_CHECK_EQUAL(table->cols(), 5u);

        // row sums are the label sizes of the first volume
        std::map<label_type, count_type> sums = table->rowSums();
        BOOST_REQUIRE_EQUAL(sums.size(), 3u);
        BOOST_CHECK_EQUAL(sums[0], 1u);
        BOOST_CHECK_EQUAL(sums[1], 3u);
        BOOST_CHECK_EQUAL(sums[2], 2u);
    }
}

BOOST_AUTO_TEST_CASE( NonzeroEntriesInRowMajorOrder )
{
    label_volume a, b;
    fillVolumes(a, b);

    std::vector<OverlapTable::entry_key> dense = buildOverlap(a, b, false)->nonzeroEntries();
    std::vector<OverlapTable::entry_key> sparse = buildOverlap(a, b, true)->nonzeroEntries();
    BOOST_REQUIRE_EQUAL(dense.size(), 4u);
    BOOST_CHECK(dense == sparse);
    BOOST_CHECK(dense[0] == OverlapTable::entry_key(0, 0));
    BOOST_CHECK(dense[1] == OverlapTable::entry_key(1, 3));
    BOOST_CHECK(dense[2] == OverlapTable::entry_key(1, 4));
    BOOST_CHECK(dense[3] == OverlapTable::entry_key(2, 3));
}

BOOST_AUTO_TEST_CASE( ArgmaxTieGoesToLowestColumn )
{
    // label 1 overlaps 6 and 2 with two voxels each
    label_volume a(volume_shape(5, 1, 1)), b(volume_shape(5, 1, 1));
    label_type va[] = {1, 1, 1, 1, 2};
    label_type vb[] = {6, 6, 2, 2, 6};
    for (int i = 0; i < 5; i++) {
        a[i] = va[i];
        b[i] = vb[i];
    }

    for (int sparse = 0; sparse < 2; sparse++) {
        TotalMapping argmax = buildOverlap(a, b, sparse != 0)->argmaxPerRow();
        BOOST_CHECK_EQUAL(argmax.size(), 2u);
        BOOST_CHECK_EQUAL(argmax(1), 2u);
        BOOST_CHECK_EQUAL(argmax(2), 6u);
        // no voxel of label 0
        BOOST_CHECK(!argmax.contains(0));
    }
}

BOOST_AUTO_TEST_CASE( ShapesMustAgree )
{
    label_volume a(volume_shape(2, 2, 2)), b(volume_shape(2, 2, 3));
    BOOST_CHECK_THROW(buildOverlap(a, b, true), ShapeMismatch);
    BOOST_CHECK_THROW(buildOverlap(a, b, false), ShapeMismatch);
}

BOOST_AUTO_TEST_SUITE_END()
