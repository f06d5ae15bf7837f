#include <sstream>
#include <vector>

#include <boost/throw_exception.hpp>
#include "vigra/labelvolume.hxx"
#include "vigra/inspectimage.hxx"
#include "vigra/multi_pointoperators.hxx"

#include "stitching/blockLabeling.hxx"
#include "stitching/errors.hxx"

namespace Stitching {

label_type labelConnectedComponents(const label_view &src, label_view dest, int conn)
{
    if (src.shape() != dest.shape()) {
        std::ostringstream msg;
        msg << "labelConnectedComponents(): source shape " << src.shape()
            << " differs from destination shape " << dest.shape();
        boost::throw_exception(ShapeMismatch(msg.str()));
    }

    unsigned int count = 0;
    if (conn == 6)
        count = vigra::labelVolumeWithBackground(
                vigra::srcMultiArrayRange(src),
                vigra::destMultiArray(dest),
                vigra::NeighborCode3DSix(),
                label_type(0));
    else if (conn == 26)
        count = vigra::labelVolumeWithBackground(
                vigra::srcMultiArrayRange(src),
                vigra::destMultiArray(dest),
                vigra::NeighborCode3DTwentySix(),
                label_type(0));
    else {
        std::ostringstream msg;
        msg << "labelConnectedComponents(): connectivity has to be 6 or 26, got " << conn;
        boost::throw_exception(ConfigurationError(msg.str()));
    }
    return count;
}

label_type relabelConsecutive(const label_view &src, label_view dest, TotalMapping &origToConsecutive)
{
    std::vector<label_type > labels = uniqueLabels(src);
    origToConsecutive = TotalMapping();
    label_type next = 1;
    for (size_t i = 0; i < labels.size(); i++) {
        if (labels[i] == 0)
            origToConsecutive.set(0, 0);
        else
            origToConsecutive.set(labels[i], next++);
    }
    applyMapping(src, origToConsecutive, dest);
    return next - 1;
}

label_type maxLabel(const label_view &vol)
{
    if (vol.size() == 0)
        return 0;
    vigra::FindMinMax<label_type > minmax;
    vigra::inspectMultiArray(vigra::srcMultiArrayRange(vol), minmax);
    return minmax.max;
}

} /* namespace Stitching */
