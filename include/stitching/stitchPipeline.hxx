#ifndef STITCHING_STITCHPIPELINE_HXX
#define STITCHING_STITCHPIPELINE_HXX

#include <string>
#include <vector>

#include "stitching/ConfigStitching.hxx"
#include "stitching/labelMapping.hxx"
#include "stitching/subvolume.hxx"

namespace Stitching {

/*
 * Block-wise stitching of one HDF5 dataset:
 *
 *  partition -> load (and optionally relabel) blocks -> stitch -> write
 *  -> optionally split disconnected bodies of the stitched result
 */
class StitchPipeline
{
public:
    StitchPipeline(const StitchConfiguration &conf);

    void print();

    void run();

    // available after run()
    const std::vector<Subvolume > &subvolumes() const { return subvolumes_; }
    const std::vector<label_type > &maxLabels() const { return maxLabels_; }
    const TotalMapping &newToOrig() const { return newToOrig_; }

private:
    std::string prefix;
    StitchConfiguration conf;

    std::vector<Subvolume > subvolumes_;
    std::vector<label_type > maxLabels_;
    TotalMapping newToOrig_;
};

} /* namespace Stitching */

#endif /* STITCHING_STITCHPIPELINE_HXX */
