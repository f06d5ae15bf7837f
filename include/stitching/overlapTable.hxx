#ifndef STITCHING_OVERLAPTABLE_HXX
#define STITCHING_OVERLAPTABLE_HXX

#include <map>
#include <utility>
#include <vector>

#include <boost/shared_ptr.hpp>
#include "vigra/multi_array.hxx"

#include "stitching/ConfigStitching.hxx"
#include "stitching/labelMapping.hxx"

namespace Stitching {

/** Contingency table of two label volumes of identical shape.
  *
  * count(a, b) is the number of voxels carrying label a in the first and
  * label b in the second volume. Rows belong to the first volume, columns to
  * the second. Background pairs are counted like every other pair.
  */
class OverlapTable {
 public:
  typedef std::pair<label_type, label_type> entry_key;

  virtual ~OverlapTable() {}

  virtual count_type count(label_type row, label_type col) const = 0;

  // (row, col) of all nonzero entries, ordered by row, then column
  virtual std::vector<entry_key> nonzeroEntries() const = 0;

  // row -> column with the largest count; ties go to the lowest column.
  // Rows without any entry are not part of the result.
  virtual TotalMapping argmaxPerRow() const = 0;

  virtual std::map<label_type, count_type> rowSums() const = 0;

  // one more than the largest row / column label
  virtual label_type rows() const = 0;
  virtual label_type cols() const = 0;
};


// Array backed table; only sensible for small label ranges.
class DenseOverlapTable : public OverlapTable {
 public:
  DenseOverlapTable(const label_view& a, const label_view& b);

  virtual count_type count(label_type row, label_type col) const;
  virtual std::vector<entry_key> nonzeroEntries() const;
  virtual TotalMapping argmaxPerRow() const;
  virtual std::map<label_type, count_type> rowSums() const;
  virtual label_type rows() const { return table_.shape(0); }
  virtual label_type cols() const { return table_.shape(1); }

 private:
  vigra::MultiArray<2, count_type> table_;
};


// Deduplicated (row, col) -> count entries.
class SparseOverlapTable : public OverlapTable {
 public:
  SparseOverlapTable(const label_view& a, const label_view& b);

  virtual count_type count(label_type row, label_type col) const;
  virtual std::vector<entry_key> nonzeroEntries() const;
  virtual TotalMapping argmaxPerRow() const;
  virtual std::map<label_type, count_type> rowSums() const;
  virtual label_type rows() const { return rows_; }
  virtual label_type cols() const { return cols_; }

 private:
  std::map<entry_key, count_type> entries_;
  label_type rows_;
  label_type cols_;
};


// Raises ShapeMismatch if a and b differ in shape.
boost::shared_ptr<OverlapTable> buildOverlap(const label_view& a, const label_view& b, bool sparse = true);

} /* namespace Stitching */

#endif /* STITCHING_OVERLAPTABLE_HXX */
