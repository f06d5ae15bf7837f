#ifndef STITCHING_SUBVOLUME_HXX
#define STITCHING_SUBVOLUME_HXX

#include <ostream>
#include <vector>

#include "stitching/ConfigStitching.hxx"

namespace Stitching {

// Axis aligned box in global coordinates; [x1, x2) x [y1, y2) x [z1, z2)
struct Box {
  Box() : x1(0), x2(0), y1(0), y2(0), z1(0), z2(0) {}
  Box(coordinate_type x1, coordinate_type x2,
      coordinate_type y1, coordinate_type y2,
      coordinate_type z1, coordinate_type z2)
    : x1(x1), x2(x2), y1(y1), y2(y2), z1(z1), z2(z2) {}

  coordinate_type lower(int axis) const;
  coordinate_type upper(int axis) const;
  Box grown(int border) const;
  volume_shape shape() const;

  bool operator==(const Box& other) const;
  bool operator!=(const Box& other) const { return !(*this == other); }

  coordinate_type x1, x2, y1, y2, z1, z2;
};

std::ostream& operator<<(std::ostream& os, const Box& box);


// What a subvolume knows about one of its neighbors.
struct NeighborRecord {
  NeighborRecord() : index(-1), border(0) {}
  NeighborRecord(int index, const Box& box, int border) : index(index), box(box), border(border) {}

  int index;
  Box box;
  int border;
};


/** One partition of the overall volume.
  *
  * The label volume of a subvolume covers box() grown by border() on every
  * side, i.e. its array index (0,0,0) sits at global (x1-border, y1-border, z1-border).
  */
class Subvolume {
 public:
  Subvolume() : index_(-1), border_(0) {}
  Subvolume(int index, const Box& box, int border) : index_(index), box_(box), border_(border) {}

  int index() const { return index_; }
  const Box& box() const { return box_; }
  int border() const { return border_; }
  const std::vector<NeighborRecord>& neighbors() const { return neighbors_; }

  Box borderedBox() const { return box_.grown(border_); }
  volume_shape shape() const { return borderedBox().shape(); }
  volume_shape interiorShape() const { return box_.shape(); }

  // do the ranges [p1, p2) and [q1, q2) share an end point?
  static bool touches(coordinate_type p1, coordinate_type p2, coordinate_type q1, coordinate_type q2);

  // records both subvolumes as neighbors of each other if their boxes touch
  // or overlap and their bordered boxes share at least one voxel. Returns
  // whether they were linked.
  bool recordBorder(Subvolume& other);

  void addNeighbor(const NeighborRecord& neighbor) { neighbors_.push_back(neighbor); }

 private:
  int index_;
  Box box_;
  int border_;
  std::vector<NeighborRecord> neighbors_;
};


// Regular grid of blocks of (at most) blockShape over volumeShape, indexed consecutively.
std::vector<Subvolume> partitionGrid(const volume_shape& volumeShape, const volume_shape& blockShape, int border);

// pairwise recordBorder over all subvolumes
void findNeighbors(std::vector<Subvolume>& subvolumes);

} /* namespace Stitching */

#endif /* STITCHING_SUBVOLUME_HXX */
