#ifndef STITCHING_HDF5BLOCKSTORE_HXX
#define STITCHING_HDF5BLOCKSTORE_HXX

#include <string>

#include <vigra/hdf5impex.hxx>
#include <vigra/multi_array.hxx>

#include "stitching/ConfigStitching.hxx"
#include "stitching/labelMapping.hxx"
#include "stitching/subvolume.hxx"

namespace Stitching {

/** Access to the labels of one subvolume in global coordinates.
  *
  * readLabels() returns the bordered block, zero padded where it reaches
  * outside the volume; writeLabels() stores the interior of the block.
  */
class BlockStore {
 public:
  virtual ~BlockStore() {}

  virtual volume_shape shape() const = 0;
  virtual label_volume readLabels(const Subvolume& subvolume) = 0;
  virtual void writeLabels(const Subvolume& subvolume, const label_view& labels) = 0;
};


// Input and output are datasets of the same HDF5 file. Access is serialized through io_mutex.
class HDF5BlockStore : public BlockStore {
 public:
  HDF5BlockStore(const std::string& filename,
                 const std::string& inputGroup, const std::string& inputVariable,
                 const std::string& outputGroup, const std::string& outputVariable,
                 int chunk = 0, int compression = 0);

  // shape of the input dataset
  virtual volume_shape shape() const { return shape_; }

  virtual label_volume readLabels(const Subvolume& subvolume);
  virtual void writeLabels(const Subvolume& subvolume, const label_view& labels);

  // (re)creates the output dataset, zero filled, in the shape of the input
  void createOutput();

  const std::string& filename() const { return filename_; }

 private:
  std::string filename_;
  std::string inputGroup_, inputVariable_;
  std::string outputGroup_, outputVariable_;
  int chunk_, compression_;
  volume_shape shape_;
};


/*
 * Whole-dataset helpers
 */

volume_shape hdf5GetDatasetShape(const std::string& filename, const std::string& group, const std::string& variable);

void hdf5ReadLabels(const std::string& filename, const std::string& group, const std::string& variable,
                    label_volume& labels);

void hdf5WriteLabels(const label_view& labels,
                     const std::string& filename, const std::string& group, const std::string& variable,
                     int chunk = 0, int compression = 0);

// Stored as an N x 2 dataset, one (key, value) pair per row.
void hdf5WriteMapping(const LabelMapping& mapping,
                      const std::string& filename, const std::string& group, const std::string& variable);

TotalMapping hdf5ReadMapping(const std::string& filename, const std::string& group, const std::string& variable);

} /* namespace Stitching */

#endif /* STITCHING_HDF5BLOCKSTORE_HXX */
