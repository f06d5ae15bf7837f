#ifndef STITCHING_SPLITBODIES_HXX
#define STITCHING_SPLITBODIES_HXX

#include "stitching/ConfigStitching.hxx"
#include "stitching/labelMapping.hxx"

namespace Stitching {

struct SplitResult {
  // the partially relabeled volume
  label_volume labels;
  // every label involved in a split -> the label it was split from,
  // including the identity entry of the piece that kept the original label
  TotalMapping newToOrig;
};

/** Split bodies whose voxels are not connected.
  *
  * Every label whose support falls apart into several connected components
  * (conn = 6 or 26) is split. The largest piece keeps the original label,
  * ties going to the piece found first in scan order. The remaining pieces
  * get labels max_label+1, max_label+2, ... in scan order of their first
  * voxel. Background (0) is never relabeled. Labels that were not split keep
  * their value and do not appear in newToOrig.
  */
SplitResult splitDisconnectedBodies(const label_view& labels, int conn = 6);

} /* namespace Stitching */

#endif /* STITCHING_SPLITBODIES_HXX */
