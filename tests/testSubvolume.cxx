#include <vector>

#define BOOST_TEST_MODULE TestSubvolume
#include <boost/test/unit_test.hpp>

#include "stitching/errors.hxx"
#include "stitching/subvolume.hxx"

using namespace Stitching;


BOOST_AUTO_TEST_SUITE(Subvolumes)

BOOST_AUTO_TEST_CASE( BoxGeometry )
{
    Box box(0, 4, 2, 6, 1, 3);
    BOOST_CHECK_EQUAL(box.lower(1), 2);
    BOOST_CHECK_EQUAL(box.upper(2), 3);
    BOOST_CHECK(box.shape() == volume_shape(4, 4, 2));
    BOOST_CHECK(box.grown(1) == Box(-1, 5, 1, 7, 0, 4));

    Subvolume sv(3, box, 2);
    BOOST_CHECK(sv.interiorShape() == volume_shape(4, 4, 2));
    BOOST_CHECK(sv.shape() == volume_shape(8, 8, 6));

    BOOST_CHECK(Subvolume::touches(0, 4, 4, 8));
    BOOST_CHECK(Subvolume::touches(4, 8, 0, 4));
    BOOST_CHECK(!Subvolume::touches(0, 4, 0, 4));
    BOOST_CHECK(!Subvolume::touches(0, 4, 5, 8));
}

BOOST_AUTO_TEST_CASE( GridPartition )
{
    std::vector<Subvolume> subvolumes = partitionGrid(volume_shape(10, 4, 6), volume_shape(4, 4, 4), 1);
    BOOST_REQUIRE_EQUAL(subvolumes.size(), 6u);

    // x outer, z inner
    BOOST_CHECK(subvolumes[0].box() == Box(0, 4, 0, 4, 0, 4));
    BOOST_CHECK(subvolumes[1].box() == Box(0, 4, 0, 4, 4, 6));
    BOOST_CHECK(subvolumes[2].box() == Box(4, 8, 0, 4, 0, 4));
    BOOST_CHECK(subvolumes[5].box() == Box(8, 10, 0, 4, 4, 6));
    for (size_t i = 0; i < subvolumes.size(); i++) {
        BOOST_CHECK_EQUAL(subvolumes[i].index(), int(i));
        BOOST_CHECK_EQUAL(subvolumes[i].border(), 1);
    }

    BOOST_CHECK_THROW(partitionGrid(volume_shape(10, 4, 6), volume_shape(4, 0, 4), 1), ConfigurationError);
    BOOST_CHECK_THROW(partitionGrid(volume_shape(10, 4, 6), volume_shape(4, 4, 4), -1), ConfigurationError);
}

BOOST_AUTO_TEST_CASE( NeighborsAreSymmetric )
{
    std::vector<Subvolume> subvolumes = partitionGrid(volume_shape(8, 8, 4), volume_shape(4, 4, 4), 1);
    findNeighbors(subvolumes);
    BOOST_REQUIRE_EQUAL(subvolumes.size(), 4u);

    // faces and the diagonal edge: everybody borders everybody
    for (size_t i = 0; i < subvolumes.size(); i++) {
        BOOST_CHECK_EQUAL(subvolumes[i].neighbors().size(), 3u);
        for (size_t n = 0; n < subvolumes[i].neighbors().size(); n++) {
            const NeighborRecord &record = subvolumes[i].neighbors()[n];
            BOOST_CHECK(record.index != subvolumes[i].index());
            BOOST_CHECK(record.box == subvolumes[record.index].box());
            BOOST_CHECK_EQUAL(record.border, 1);
        }
    }

    // without a border only touching faces remain, and they do not share voxels
    std::vector<Subvolume> plain = partitionGrid(volume_shape(8, 8, 4), volume_shape(4, 4, 4), 0);
    findNeighbors(plain);
    for (size_t i = 0; i < plain.size(); i++)
        BOOST_CHECK(plain[i].neighbors().empty());

    // distant blocks are not linked
    Subvolume a(0, Box(0, 4, 0, 4, 0, 4), 1);
    Subvolume b(1, Box(8, 12, 0, 4, 0, 4), 1);
    BOOST_CHECK(!a.recordBorder(b));
    BOOST_CHECK(a.neighbors().empty());
    BOOST_CHECK(b.neighbors().empty());
}

BOOST_AUTO_TEST_SUITE_END()
