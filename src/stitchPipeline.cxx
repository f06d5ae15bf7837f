#include <iostream>

#include <vigra/timing.hxx>

#include "stitching/blockLabeling.hxx"
#include "stitching/blockTaskPool.hxx"
#include "stitching/HDF5BlockStore.hxx"
#include "stitching/splitBodies.hxx"
#include "stitching/stitcher.hxx"
#include "stitching/stitchPipeline.hxx"

namespace Stitching {

namespace {
    struct LoadTask {
        LoadTask(BlockStore &store, const std::vector<Subvolume > &subvolumes, bool relabel, int conn)
        : store(store), subvolumes(subvolumes), relabel(relabel), conn(conn),
          labels(subvolumes.size()), maxLabels(subvolumes.size(), 0) {}

        void operator()(size_t k) {
            label_volume block = store.readLabels(subvolumes[k]);
            if (relabel) {
                labels[k].reshape(block.shape());
                maxLabels[k] = labelConnectedComponents(block, labels[k], conn);
            }
            else {
                maxLabels[k] = maxLabel(block);
                labels[k].swap(block);
            }
        }

        BlockStore &store;
        const std::vector<Subvolume > &subvolumes;
        bool relabel;
        int conn;
        std::vector<label_volume > labels;
        std::vector<label_type > maxLabels;
    };

    struct WriteTask {
        WriteTask(BlockStore &store, const std::vector<Subvolume > &subvolumes, const std::vector<label_volume > &labels)
        : store(store), subvolumes(subvolumes), labels(labels) {}

        void operator()(size_t k) {
            store.writeLabels(subvolumes[k], labels[k]);
        }

        BlockStore &store;
        const std::vector<Subvolume > &subvolumes;
        const std::vector<label_volume > &labels;
    };
} /* anonymous namespace */

StitchPipeline::StitchPipeline(const StitchConfiguration &conf)
: conf(conf)
{
    prefix = "StitchPipeline: ";
}

void StitchPipeline::print()
{
    std::cerr << prefix << "parameters ->" << std::endl;
    std::cerr << "\t\t\t\t Filename = " << conf.Filename << std::endl;
    std::cerr << "\t\t\t\t InputGroup = " << conf.InputGroup << std::endl;
    std::cerr << "\t\t\t\t InputVariable = " << conf.InputVariable << std::endl;
    std::cerr << "\t\t\t\t OutputGroup = " << conf.OutputGroup << std::endl;
    std::cerr << "\t\t\t\t OutputVariable = " << conf.OutputVariable << std::endl;
    std::cerr << "\t\t\t\t MappingVariable = " << conf.MappingVariable << std::endl;
    std::cerr << "\t\t\t\t BlockSize = " << conf.BlockSize << std::endl;
    std::cerr << "\t\t\t\t Border = " << conf.Border << std::endl;
    std::cerr << "\t\t\t\t Connectivity = " << conf.Connectivity << std::endl;
    std::cerr << "\t\t\t\t RelabelBlocks = " << conf.RelabelBlocks << std::endl;
    std::cerr << "\t\t\t\t SplitDisconnected = " << conf.SplitDisconnected << std::endl;
    std::cerr << "\t\t\t\t Threads = " << conf.Threads << std::endl;
    std::cerr << "\t\t\t\t Verbose = " << conf.Verbose << std::endl;
    std::cerr << "\t\t\t\t ChunkSize = " << conf.ChunkSize << std::endl;
    std::cerr << "\t\t\t\t CompressionParameter = " << conf.CompressionParameter << std::endl;
}

void StitchPipeline::run()
{
    USETICTOC;

    HDF5BlockStore store(conf.Filename,
                         conf.InputGroup, conf.InputVariable,
                         conf.OutputGroup, conf.OutputVariable,
                         conf.ChunkSize, conf.CompressionParameter);
    volume_shape shape = store.shape();
    std::cerr << prefix << "raw data size = " << shape << std::endl;

    // partition
    subvolumes_ = partitionGrid(shape, conf.BlockSize, conf.Border);
    findNeighbors(subvolumes_);
    std::cerr << prefix << "totally " << subvolumes_.size() << " blocks" << std::endl;

    // load blocks
    TIC;
    LoadTask load(store, subvolumes_, conf.RelabelBlocks, conf.Connectivity);
    BlockTaskPool<LoadTask > loadPool(conf.Threads, conf.Verbose, prefix);
    loadPool.run(subvolumes_.size(), load);
    maxLabels_ = load.maxLabels;
    std::cerr << prefix << "blocks loaded in " << TOCS << std::endl;

    // stitch
    TIC;
    Stitcher stitcher(conf.Threads, conf.Verbose);
    if (conf.Verbose)
        stitcher.print();
    std::vector<label_volume > stitched = stitcher.stitch(subvolumes_, load.labels, maxLabels_);
    std::cerr << prefix << stitcher.mergeEdges().size() << " merge edges, "
              << stitcher.equivalence().size() << " labels merged in " << TOCS << std::endl;

    // write
    TIC;
    store.createOutput();
    WriteTask write(store, subvolumes_, stitched);
    BlockTaskPool<WriteTask > writePool(conf.Threads, conf.Verbose, prefix);
    writePool.run(subvolumes_.size(), write);
    std::cerr << prefix << "stitched labels written to " << conf.OutputGroup << "/" << conf.OutputVariable
              << " in " << TOCS << std::endl;

    newToOrig_ = TotalMapping();
    if (!conf.SplitDisconnected)
        return ;

    // split disconnected bodies of the stitched volume
    TIC;
    label_volume labels;
    hdf5ReadLabels(conf.Filename, conf.OutputGroup, conf.OutputVariable, labels);
    SplitResult split = splitDisconnectedBodies(labels, conf.Connectivity);
    hdf5WriteLabels(split.labels, conf.Filename, conf.OutputGroup, conf.OutputVariable,
                    conf.ChunkSize, conf.CompressionParameter);
    hdf5WriteMapping(split.newToOrig, conf.Filename, conf.OutputGroup, conf.MappingVariable);
    newToOrig_ = split.newToOrig;
    std::cerr << prefix << split.newToOrig.size() << " labels involved in splits, done in " << TOCS << std::endl;
}

} /* namespace Stitching */
