#ifndef STITCHING_CONFIGSTITCHING_HXX
#define STITCHING_CONFIGSTITCHING_HXX

#include <string>

#include "vigra/multi_array.hxx"
#include "vigra/sized_int.hxx"

namespace Stitching {

// Datatypes used for labeled volumes

typedef vigra::UInt64 label_type;
typedef vigra::MultiArray<3,label_type> label_volume;
typedef vigra::MultiArrayView<3,label_type> label_view;


// Shape of 3D MultiArray

typedef vigra::MultiArrayShape<3>::type volume_shape;


// Datatype for global coordinates (may be negative inside the border)

typedef long coordinate_type;


// Voxel counts in overlap tables

typedef vigra::UInt64 count_type;


// Datatype of the N x 2 label mapping datasets

typedef vigra::MultiArray<2,label_type> mapping_matrix;
typedef vigra::MultiArrayShape<2>::type matrix_shape;


// Configuration structures

/** Stitching configuration
  *
  * This structure contains everything the block stitching pipeline needs:
  *
  * - HDF5 file with the input segmentation and the stitched output
  * - Block size and border (halo) of the partition
  * - Connectivity used for per-block and split labeling
  * - Post processing and runtime settings
  */
struct StitchConfiguration
{
    StitchConfiguration():
            Filename(""),
            InputGroup("/segmentation"),
            InputVariable("volume"),
            OutputGroup("/stitched"),
            OutputVariable("labels"),
            MappingVariable("new_to_orig"),
            BlockSize(64,64,64),
            Border(1),
            Connectivity(6),
            RelabelBlocks(true),
            SplitDisconnected(false),
            Threads(1),
            Verbose(0),
            ChunkSize(32),
            CompressionParameter(2) {};
    StitchConfiguration(std::string filename, unsigned int blocksize,
                        int border = 1):
            Filename(filename),
            InputGroup("/segmentation"),
            InputVariable("volume"),
            OutputGroup("/stitched"),
            OutputVariable("labels"),
            MappingVariable("new_to_orig"),
            BlockSize(blocksize,blocksize,blocksize),
            Border(border),
            Connectivity(6),
            RelabelBlocks(true),
            SplitDisconnected(false),
            Threads(1),
            Verbose(0),
            ChunkSize(32),
            CompressionParameter(2) {};

    std::string Filename;
    std::string InputGroup;
    std::string InputVariable;
    std::string OutputGroup;
    std::string OutputVariable;
    std::string MappingVariable;
    volume_shape BlockSize;
    int Border;
    int Connectivity;
    bool RelabelBlocks;
    bool SplitDisconnected;
    int Threads;
    int Verbose;
    int ChunkSize;
    int CompressionParameter;
};

} /* namespace Stitching */

#endif //STITCHING_CONFIGSTITCHING_HXX
