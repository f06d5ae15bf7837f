#include <algorithm>
#include <sstream>

#include <boost/thread/mutex.hpp>
#include <boost/throw_exception.hpp>

#include "stitching/blockTaskPool.hxx"
#include "stitching/errors.hxx"
#include "stitching/HDF5BlockStore.hxx"

namespace Stitching {

////
//// whole-dataset helpers
////
volume_shape hdf5GetDatasetShape(const std::string& filename, const std::string& group, const std::string& variable)
{
    vigra::HDF5File hdf5file(filename, vigra::HDF5File::OpenReadOnly);
    hdf5file.cd(group);

    if (hdf5file.getDatasetDimensions(variable) != 3) {
        std::ostringstream msg;
        msg << "hdf5GetDatasetShape(): " << group << "/" << variable << " is not a 3D dataset";
        boost::throw_exception(ShapeMismatch(msg.str()));
    }
    vigra::ArrayVector<hsize_t> dim_shape = hdf5file.getDatasetShape(variable);

    volume_shape shape;
    for (int i=0; i<3; i++)
        shape[i] = dim_shape[i];
    return shape;
}

void hdf5ReadLabels(const std::string& filename, const std::string& group, const std::string& variable,
                    label_volume& labels)
{
    vigra::HDF5File hdf5file(filename, vigra::HDF5File::OpenReadOnly);
    hdf5file.cd(group);
    hdf5file.readAndResize(variable, labels);
}

void hdf5WriteLabels(const label_view& labels,
                     const std::string& filename, const std::string& group, const std::string& variable,
                     int chunk, int compression)
{
    vigra::HDF5File hdf5file(filename, vigra::HDF5File::Open);
    hdf5file.cd_mk(group);
    hdf5file.write(variable, labels, chunk, compression);
}

void hdf5WriteMapping(const LabelMapping& mapping,
                      const std::string& filename, const std::string& group, const std::string& variable)
{
    // vigra reverses the axis order on disk: (2, N) here is N x 2 in the file
    mapping_matrix table(matrix_shape(2, mapping.size()));
    int row = 0;
    for (LabelMapping::const_iterator it = mapping.begin(); it != mapping.end(); ++it, ++row) {
        table(0, row) = it->first;
        table(1, row) = it->second;
    }

    vigra::HDF5File hdf5file(filename, vigra::HDF5File::Open);
    hdf5file.cd_mk(group);
    // an empty mapping is a 0 x 2 dataset without data to write
    if (mapping.empty())
        hdf5file.createDataset<2, label_type>(variable, table.shape(), label_type(0));
    else
        hdf5file.write(variable, table);
}

TotalMapping hdf5ReadMapping(const std::string& filename, const std::string& group, const std::string& variable)
{
    mapping_matrix table;
    {
        vigra::HDF5File hdf5file(filename, vigra::HDF5File::OpenReadOnly);
        hdf5file.cd(group);
        vigra::ArrayVector<hsize_t> shape = hdf5file.getDatasetShape(variable);
        if (shape.size() != 2 || (shape[0] != 2 && shape[1] != 2)) {
            std::ostringstream msg;
            msg << "hdf5ReadMapping(): " << group << "/" << variable << " has to be an N x 2 dataset";
            boost::throw_exception(ShapeMismatch(msg.str()));
        }
        if (shape[0] == 0 || shape[1] == 0)
            return TotalMapping();
        hdf5file.readAndResize(variable, table);
    }
    if (table.shape(0) != 2) {
        std::ostringstream msg;
        msg << "hdf5ReadMapping(): " << group << "/" << variable << " has to be an N x 2 dataset";
        boost::throw_exception(ShapeMismatch(msg.str()));
    }

    TotalMapping mapping;
    for (int row = 0; row < table.shape(1); row++)
        mapping.set(table(0, row), table(1, row));
    return mapping;
}



////
//// class HDF5BlockStore
////
HDF5BlockStore::HDF5BlockStore(const std::string& filename,
                               const std::string& inputGroup, const std::string& inputVariable,
                               const std::string& outputGroup, const std::string& outputVariable,
                               int chunk, int compression)
  : filename_(filename),
    inputGroup_(inputGroup), inputVariable_(inputVariable),
    outputGroup_(outputGroup), outputVariable_(outputVariable),
    chunk_(chunk), compression_(compression)
{
    boost::mutex::scoped_lock lock(io_mutex);
    shape_ = hdf5GetDatasetShape(filename_, inputGroup_, inputVariable_);
}

void HDF5BlockStore::createOutput()
{
    boost::mutex::scoped_lock lock(io_mutex);

    volume_shape chunkShape(0, 0, 0);
    if (chunk_ > 0) {
        for (int d=0; d<3; d++)
            chunkShape[d] = std::max<vigra::MultiArrayIndex>(1, std::min<vigra::MultiArrayIndex>(chunk_, shape_[d]));
    }

    vigra::HDF5File hdf5file(filename_, vigra::HDF5File::Open);
    hdf5file.cd_mk(outputGroup_);
    hdf5file.createDataset<3, label_type>(outputVariable_, shape_, 0, chunkShape, compression_);
}

label_volume HDF5BlockStore::readLabels(const Subvolume& subvolume)
{
    Box bordered = subvolume.borderedBox();
    label_volume labels(subvolume.shape(), label_type(0));

    // part of the bordered box inside the dataset
    volume_shape start, stop, offset;
    for (int d=0; d<3; d++) {
        coordinate_type lo = std::max<coordinate_type>(0, bordered.lower(d));
        coordinate_type hi = std::min<coordinate_type>(shape_[d], bordered.upper(d));
        if (hi <= lo)
            return labels;
        start[d] = lo;
        stop[d] = hi;
        offset[d] = lo - bordered.lower(d);
    }

    label_volume block(stop - start);
    {
        boost::mutex::scoped_lock lock(io_mutex);

        vigra::HDF5File hdf5file(filename_, vigra::HDF5File::OpenReadOnly);
        hdf5file.cd(inputGroup_);
        hdf5file.readBlock(inputVariable_, start, block.shape(), block);
    }
    labels.subarray(offset, offset + block.shape()).copy(block);
    return labels;
}

void HDF5BlockStore::writeLabels(const Subvolume& subvolume, const label_view& labels)
{
    if (labels.shape() != subvolume.shape()) {
        std::ostringstream msg;
        msg << "HDF5BlockStore::writeLabels(): labels of subvolume " << subvolume.index()
            << " have shape " << labels.shape() << ", expected " << subvolume.shape();
        boost::throw_exception(ShapeMismatch(msg.str()));
    }

    // strip the border
    int border = subvolume.border();
    volume_shape bottomleftRel(border, border, border);
    volume_shape toprightRel = bottomleftRel + subvolume.interiorShape();
    label_volume interior(labels.subarray(bottomleftRel, toprightRel));

    const Box &box = subvolume.box();
    volume_shape bottomleft(box.x1, box.y1, box.z1);

    boost::mutex::scoped_lock lock(io_mutex);

    vigra::HDF5File hdf5file(filename_, vigra::HDF5File::Open);
    hdf5file.cd(outputGroup_);
    hdf5file.writeBlock(outputVariable_, bottomleft, interior);
}

} /* namespace Stitching */
