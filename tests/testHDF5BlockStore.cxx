#include <vector>

#include <vigra/hdf5impex.hxx>
#include <vigra/multi_array.hxx>

#define BOOST_TEST_MODULE TestHDF5BlockStore
#include <boost/test/unit_test.hpp>

#include "stitching/errors.hxx"
#include "stitching/HDF5BlockStore.hxx"
#include "stitching/subvolume.hxx"

using namespace Stitching;


namespace {
    label_volume rampVolume()
    {
        label_volume vol(volume_shape(10, 6, 5));
        for (int i = 0; i < 10; i++)
            for (int j = 0; j < 6; j++)
                for (int k = 0; k < 5; k++)
                    vol(i,j,k) = 1 + i + 10*j + 100*k;
        return vol;
    }
}


BOOST_AUTO_TEST_SUITE(HDF5BlockStores)

BOOST_AUTO_TEST_CASE( ReadBorderedBlocks )
{
    label_volume vol = rampVolume();
    {
        vigra::HDF5File f("testHDF5BlockStore.h5", vigra::HDF5File::New);
        f.cd_mk("/segmentation");
        f.write("volume", vol);
        f.flushToDisk();
    }

    HDF5BlockStore store("testHDF5BlockStore.h5", "/segmentation", "volume", "/stitched", "labels");
    BOOST_CHECK(store.shape() == volume_shape(10, 6, 5));

    // corner block: the border outside the volume is zero
    Subvolume corner(0, Box(0, 4, 0, 4, 0, 4), 1);
    label_volume block = store.readLabels(corner);
    BOOST_REQUIRE(block.shape() == volume_shape(6, 6, 6));
    BOOST_CHECK_EQUAL(block(0, 1, 1), 0u);
    BOOST_CHECK_EQUAL(block(1, 0, 1), 0u);
    BOOST_CHECK_EQUAL(block(1, 1, 1), vol(0, 0, 0));
    BOOST_CHECK_EQUAL(block(5, 5, 5), vol(4, 4, 4));

    // clipped last block
    Subvolume last(1, Box(8, 10, 4, 6, 4, 5), 2);
    block = store.readLabels(last);
    BOOST_REQUIRE(block.shape() == volume_shape(6, 6, 5));
    BOOST_CHECK_EQUAL(block(0, 0, 0), vol(6, 2, 2));
    BOOST_CHECK_EQUAL(block(3, 3, 2), vol(9, 5, 4));
    BOOST_CHECK_EQUAL(block(4, 4, 2), 0u);
    BOOST_CHECK_EQUAL(block(3, 3, 3), 0u);
}

BOOST_AUTO_TEST_CASE( WriteInteriors )
{
    label_volume vol = rampVolume();
    hdf5WriteLabels(vol, "testHDF5BlockStore.h5", "/segmentation", "volume");

    HDF5BlockStore store("testHDF5BlockStore.h5", "/segmentation", "volume", "/stitched", "labels", 4, 1);
    store.createOutput();

    std::vector<Subvolume> subvolumes = partitionGrid(store.shape(), volume_shape(4, 4, 4), 1);
    for (size_t k = 0; k < subvolumes.size(); k++)
        store.writeLabels(subvolumes[k], store.readLabels(subvolumes[k]));

    label_volume out;
    hdf5ReadLabels("testHDF5BlockStore.h5", "/stitched", "labels", out);
    BOOST_CHECK(out == vol);

    label_volume wrong(volume_shape(4, 4, 4));
    BOOST_CHECK_THROW(store.writeLabels(subvolumes[0], wrong), ShapeMismatch);
}

BOOST_AUTO_TEST_CASE( MappingDataset )
{
    TotalMapping mapping;
    mapping.set(5, 5);
    mapping.set(10, 5);
    mapping.set(11, 7);
    hdf5WriteMapping(mapping, "testHDF5BlockStore.h5", "/stitched", "new_to_orig");

    BOOST_CHECK(hdf5ReadMapping("testHDF5BlockStore.h5", "/stitched", "new_to_orig") == mapping);

    // N x 2 on disk
    vigra::HDF5File f("testHDF5BlockStore.h5", vigra::HDF5File::OpenReadOnly);
    f.cd("/stitched");
    vigra::ArrayVector<hsize_t> shape = f.getDatasetShape("new_to_orig");
    BOOST_REQUIRE_EQUAL(shape.size(), 2u);
    BOOST_CHECK_EQUAL(shape[0] * shape[1], 6u);
    f.close();

    // nothing split: the dataset exists but holds no rows
    hdf5WriteMapping(TotalMapping(), "testHDF5BlockStore.h5", "/stitched", "new_to_orig");
    BOOST_CHECK(hdf5ReadMapping("testHDF5BlockStore.h5", "/stitched", "new_to_orig").empty());

    vigra::HDF5File g("testHDF5BlockStore.h5", vigra::HDF5File::OpenReadOnly);
    g.cd("/stitched");
    shape = g.getDatasetShape("new_to_orig");
    BOOST_REQUIRE_EQUAL(shape.size(), 2u);
    BOOST_CHECK_EQUAL(shape[0] * shape[1], 0u);
    BOOST_CHECK_EQUAL(shape[0] + shape[1], 2u);
}

BOOST_AUTO_TEST_SUITE_END()
