#ifndef STITCHING_BLOCKLABELING_HXX
#define STITCHING_BLOCKLABELING_HXX

#include "stitching/ConfigStitching.hxx"
#include "stitching/labelMapping.hxx"

namespace Stitching {

// Connected components of equal-valued, nonzero voxels. conn is 6 or 26.
// Writes 1..n into dest (background stays 0) and returns n.
label_type labelConnectedComponents(const label_view& src, label_view dest, int conn = 6);

// 0 stays 0, the remaining labels become 1..N in ascending order.
// Fills origToConsecutive (including 0 -> 0 when background is present) and returns N.
label_type relabelConsecutive(const label_view& src, label_view dest, TotalMapping& origToConsecutive);

// largest label of the volume, 0 for an empty or all-background volume
label_type maxLabel(const label_view& vol);

} /* namespace Stitching */

#endif /* STITCHING_BLOCKLABELING_HXX */
