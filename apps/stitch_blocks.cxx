#include <exception>
#include <iostream>
#include <string>

#include "ArgParser.hxx"
#include "stitching/iniConfiguration.hxx"
#include "stitching/stitchPipeline.hxx"

using namespace Stitching;

int main(int argc, char* argv[]) {
    // print help
    if (argc == 1) {
        std::cerr << "Syntax: ./stitch_blocks " << std::endl;
        std::cerr << "\t\tfile=[ini file]" << std::endl;
        std::cerr << "\t\tnum_threads=[number of threads to use]" << std::endl;
        std::cerr << "\t\tverbose=[verbose mode]" << std::endl;

        std::cerr << "Example: ./stitch_blocks file=stitch.ini num_threads=8 verbose=1" << std::endl << std::endl;
        return 0;
    }

    // parse arguments
    ArgParser p(argc, argv);
    p.addRequiredArg("file", ArgParser::String, "Ini file that describes the stitching job.");
    p.addOptionalArg("num_threads", ArgParser::Integer, "Number of threads to use.");
    p.addOptionalArg("verbose", ArgParser::Integer, "Use verbose mode.");
    if (!p.parse()) {
        p.usage();
        return 1;
    }

    try {
        StitchConfiguration conf = loadStitchConfiguration(p.getString("file"));
        if (p.hasKey("num_threads"))
            conf.Threads = p.getInt("num_threads");
        if (p.hasKey("verbose"))
            conf.Verbose = p.getInt("verbose");

        StitchPipeline pipeline(conf);
        pipeline.print();
        pipeline.run();
    }
    catch (std::exception &e) {
        std::cerr << "stitch_blocks: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
