#include <exception>
#include <iostream>
#include <string>

#include <vigra/timing.hxx>

#include "ArgParser.hxx"
#include "stitching/HDF5BlockStore.hxx"
#include "stitching/splitBodies.hxx"

using namespace Stitching;

int main(int argc, char* argv[]) {
    USETICTOC;

    // print help
    if (argc == 1) {
        std::cerr << "Syntax: ./split_bodies " << std::endl;
        std::cerr << "\t\tfile=[hdf5 file]" << std::endl;
        std::cerr << "\t\tgroup=[group of the label volume]" << std::endl;
        std::cerr << "\t\tvariable=[label volume]" << std::endl;
        std::cerr << "\t\tout=[variable for the split volume, written to the same group]" << std::endl;
        std::cerr << "\t\tmapping=[variable for the new -> original mapping, default: <out>_new_to_orig]" << std::endl;
        std::cerr << "\t\tconn=[6 or 26]" << std::endl;

        std::cerr << "Example: ./split_bodies file=seg.h5 group=/stitched variable=labels out=split conn=6" << std::endl << std::endl;
        return 0;
    }

    // parse arguments
    ArgParser p(argc, argv);
    p.addRequiredArg("file", ArgParser::String, "HDF5 file with the label volume.");
    p.addRequiredArg("group", ArgParser::String, "Group of the label volume.");
    p.addRequiredArg("variable", ArgParser::String, "Name of the label volume.");
    p.addRequiredArg("out", ArgParser::String, "Name of the split label volume.");
    p.addOptionalArg("mapping", ArgParser::String, "Name of the new -> original mapping.");
    p.addOptionalArg("conn", ArgParser::Integer, "Connectivity, 6 or 26.");
    if (!p.parse()) {
        p.usage();
        return 1;
    }

    std::string file = p.getString("file");
    std::string group = p.getString("group");
    std::string out = p.getString("out");
    std::string mapping = p.getString("mapping", out + "_new_to_orig");
    int conn = p.getInt("conn", 6);

    try {
        TIC;
        label_volume labels;
        hdf5ReadLabels(file, group, p.getString("variable"), labels);
        std::cerr << "split_bodies: label volume of size " << labels.shape() << std::endl;

        SplitResult split = splitDisconnectedBodies(labels, conn);
        hdf5WriteLabels(split.labels, file, group, out);
        hdf5WriteMapping(split.newToOrig, file, group, mapping);
        std::cerr << "split_bodies: " << split.newToOrig.size() << " labels involved in splits, done in "
                  << TOCS << std::endl;
    }
    catch (std::exception &e) {
        std::cerr << "split_bodies: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
