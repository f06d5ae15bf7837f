#ifndef STITCHING_STITCHER_HXX
#define STITCHING_STITCHER_HXX

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <boost/shared_ptr.hpp>

#include "stitching/ConfigStitching.hxx"
#include "stitching/labelMapping.hxx"
#include "stitching/subvolume.hxx"

namespace Stitching {

// (lower subvolume index, higher subvolume index)
typedef std::pair<int, int> BoundaryKey;

// (offset label of the lower subvolume, offset label of the higher subvolume)
typedef std::pair<label_type, label_type> MergeEdge;


/** Per-subvolume label offsets.
  *
  * Subvolumes are visited by ascending index and every one starts where the
  * previous one ended: offset(i+1) = offset(i) + maxLabel(i). The table is
  * filled once and only read afterwards.
  */
class OffsetTable {
 public:
  OffsetTable() : total_(0) {}
  // maxLabels[k] belongs to subvolumes[k]; the order of the vectors does not matter
  OffsetTable(const std::vector<Subvolume>& subvolumes, const std::vector<label_type>& maxLabels);
  // explicit index -> offset assignment
  explicit OffsetTable(const std::map<int, label_type>& offsets);

  label_type offset(int index) const;
  bool contains(int index) const { return offsets_.find(index) != offsets_.end(); }
  size_t size() const { return offsets_.size(); }
  const std::map<int, label_type>& offsets() const { return offsets_; }

  // computed tables: first offset not used by any subvolume.
  // explicit tables only know the largest offset, not the labels above it.
  label_type total() const { return total_; }

 private:
  std::map<int, label_type> offsets_;
  label_type total_;
};


/** Result of merging all boundary edges.
  *
  * Maps every label that was merged into another one onto the representative
  * of its class. Representatives and unmerged labels map to themselves, so
  * applying the map twice is the same as applying it once.
  */
class EquivalenceMap {
 public:
  EquivalenceMap() {}
  // edges are sorted before merging; the result does not depend on their order
  explicit EquivalenceMap(const std::vector<MergeEdge>& edges);

  label_type representative(label_type label) const { return repOf_(label); }
  bool contains(label_type label) const { return repOf_.contains(label); }
  size_t size() const { return repOf_.size(); }
  const PartialMapping& mapping() const { return repOf_; }

  // representative -> all labels merged into it (without the representative)
  const std::map<label_type, std::set<label_type> >& classes() const { return membersOf_; }

 private:
  PartialMapping repOf_;
  std::map<label_type, std::set<label_type> > membersOf_;
};


// Cropped overlap of a subvolume with one of its neighbors.
struct BoundaryFragment {
  BoundaryKey key;
  Subvolume subvolume;
  label_volume labels;
};
typedef boost::shared_ptr<const BoundaryFragment> FragmentPtr;
typedef std::map<BoundaryKey, std::vector<FragmentPtr> > BoundaryGroups;


/*
 * The stages of stitching. Stitcher::stitch() runs them in order; they are
 * exposed for reuse and testing.
 */

OffsetTable assignOffsets(const std::vector<Subvolume>& subvolumes, const std::vector<label_type>& maxLabels);

// one fragment per neighbor whose bordered box intersects this one
std::vector<FragmentPtr> extractBoundaries(const Subvolume& subvolume, const label_view& labels);

BoundaryGroups groupBoundaries(const std::vector<std::vector<FragmentPtr> >& fragments);

// Raises MalformedBoundaryGroup if the group does not hold exactly two
// fragments of different subvolumes with equal shape.
std::vector<MergeEdge> computeMergeEdges(const BoundaryKey& key,
                                         const std::vector<FragmentPtr>& fragments,
                                         const OffsetTable& offsets);

EquivalenceMap reconcileMerges(const std::vector<MergeEdge>& edges);

label_volume applyEquivalence(const Subvolume& subvolume, const label_view& labels,
                              const OffsetTable& offsets, const EquivalenceMap& equivalence);


class Stitcher
{
public:
    Stitcher(int num_threads = 1, int verbose = 0);

    void print();

    // labels[k] covers subvolumes[k].shape() and uses labels up to maxLabels[k]
    std::vector<label_volume > stitch(
        const std::vector<Subvolume > &subvolumes,
        const std::vector<label_volume > &labels,
        const std::vector<label_type > &maxLabels);

    std::vector<label_volume > stitch(
        const std::vector<Subvolume > &subvolumes,
        const std::vector<label_volume > &labels,
        const OffsetTable &offsets);

    // state of the last stitch() call
    const std::vector<MergeEdge > &mergeEdges() const { return edges; }
    const EquivalenceMap &equivalence() const { return equivalenceMap; }

private:
    int num_threads;
    int verbose;
    std::string prefix;

    std::vector<MergeEdge > edges;
    EquivalenceMap equivalenceMap;
};

} /* namespace Stitching */

#endif /* STITCHING_STITCHER_HXX */
