#include <string>

#include <vigra/hdf5impex.hxx>
#include <vigra/multi_array.hxx>

#define BOOST_TEST_MODULE TestStitchPipeline
#include <boost/test/unit_test.hpp>

#include "stitching/HDF5BlockStore.hxx"
#include "stitching/stitchPipeline.hxx"

using namespace Stitching;


namespace {
    // a bar along x through two blocks, a plate inside one block and label 7 in two pieces
    label_volume createVolume()
    {
        label_volume vol(volume_shape(8, 8, 8));
        for (int i = 0; i < 8; i++)
            vol(i, 1, 1) = 3;
        vol.subarray(volume_shape(5, 4, 4), volume_shape(7, 8, 8)).init(9);
        vol(0, 5, 5) = 7;
        vol(2, 5, 5) = 7;
        return vol;
    }

    StitchConfiguration createConfiguration(const std::string &filename)
    {
        StitchConfiguration conf(filename, 4, 1);
        conf.Threads = 2;

        vigra::HDF5File f(filename, vigra::HDF5File::New);
        f.cd_mk(conf.InputGroup);
        f.write(conf.InputVariable, createVolume());
        f.flushToDisk();
        return conf;
    }
}


BOOST_AUTO_TEST_SUITE(StitchPipelines)

BOOST_AUTO_TEST_CASE( RelabeledBlocksAreStitched )
{
    StitchConfiguration conf = createConfiguration("testStitchPipeline.h5");
    StitchPipeline pipeline(conf);
    pipeline.run();

    BOOST_CHECK_EQUAL(pipeline.subvolumes().size(), 8u);
    BOOST_CHECK(pipeline.newToOrig().empty());

    label_volume out;
    hdf5ReadLabels("testStitchPipeline.h5", conf.OutputGroup, conf.OutputVariable, out);
    BOOST_REQUIRE(out.shape() == volume_shape(8, 8, 8));

    label_type bar = out(0, 1, 1);
    BOOST_CHECK(bar != 0);
    for (int i = 0; i < 8; i++)
        BOOST_REQUIRE_EQUAL(out(i, 1, 1), bar);

    label_type plate = out(5, 4, 4);
    BOOST_CHECK(plate != 0);
    BOOST_CHECK(plate != bar);
    BOOST_CHECK_EQUAL(out(6, 7, 7), plate);

    // per-block connected components already separate the two pieces of 7
    BOOST_CHECK(out(0, 5, 5) != 0);
    BOOST_CHECK(out(0, 5, 5) != out(2, 5, 5));
    BOOST_CHECK_EQUAL(out(3, 3, 3), 0u);
}

BOOST_AUTO_TEST_CASE( SplitAfterStitching )
{
    StitchConfiguration conf = createConfiguration("testStitchPipeline.h5");
    conf.RelabelBlocks = false;
    conf.SplitDisconnected = true;
    StitchPipeline pipeline(conf);
    pipeline.run();

    label_volume out;
    hdf5ReadLabels("testStitchPipeline.h5", conf.OutputGroup, conf.OutputVariable, out);

    BOOST_CHECK_EQUAL(out(0, 1, 1), out(7, 1, 1));
    BOOST_CHECK(out(0, 5, 5) != out(2, 5, 5));

    // the two pieces of 7 share their original label in the mapping
    TotalMapping newToOrig = hdf5ReadMapping("testStitchPipeline.h5", conf.OutputGroup, conf.MappingVariable);
    BOOST_CHECK(newToOrig == pipeline.newToOrig());
    BOOST_REQUIRE_EQUAL(newToOrig.size(), 2u);
    BOOST_CHECK_EQUAL(newToOrig(out(0, 5, 5)), newToOrig(out(2, 5, 5)));
}

BOOST_AUTO_TEST_SUITE_END()
