#ifndef STITCHING_LABELMAPPING_HXX
#define STITCHING_LABELMAPPING_HXX

#include <map>
#include <vector>

#include "stitching/ConfigStitching.hxx"

namespace Stitching {

/** Storage shared by the two mapping flavours.
  *
  * Entries are kept ordered by key, so iterating a mapping is deterministic.
  * The lookup contract is defined by the derived classes.
  */
class LabelMapping {
 public:
  typedef std::map<label_type, label_type> map_type;
  typedef map_type::const_iterator const_iterator;

  LabelMapping() {}
  explicit LabelMapping(const map_type& m) : map_(m) {}

  void set(label_type from, label_type to) { map_[from] = to; }
  bool contains(label_type from) const { return map_.find(from) != map_.end(); }
  size_t size() const { return map_.size(); }
  bool empty() const { return map_.empty(); }

  const_iterator begin() const { return map_.begin(); }
  const_iterator end() const { return map_.end(); }
  const map_type& entries() const { return map_; }

  bool operator==(const LabelMapping& other) const { return map_ == other.map_; }
  bool operator!=(const LabelMapping& other) const { return map_ != other.map_; }

 protected:
  map_type map_;
};


// Every label that is looked up has to be a key; a miss raises IncompleteMappingError.
class TotalMapping : public LabelMapping {
 public:
  TotalMapping() {}
  explicit TotalMapping(const map_type& m) : LabelMapping(m) {}

  label_type operator()(label_type from) const;
};


// Labels without an entry map to themselves.
class PartialMapping : public LabelMapping {
 public:
  PartialMapping() {}
  explicit PartialMapping(const map_type& m) : LabelMapping(m) {}
  explicit PartialMapping(const LabelMapping& m) : LabelMapping(m.entries()) {}

  label_type operator()(label_type from) const;
};


// A->B, B->C => A->C. Raises IncompleteMappingError if a value of ab is not a key of bc.
TotalMapping compose(const TotalMapping& ab, const TotalMapping& bc);
TotalMapping compose(const TotalMapping& ab, const TotalMapping& bc, const TotalMapping& cd);
TotalMapping compose(const std::vector<TotalMapping>& chain);

// Raises NonReversibleMappingError if two keys share a value.
TotalMapping invert(const TotalMapping& m);

// dest may be the same array as src; shapes have to agree.
void applyMapping(const label_view& src, const TotalMapping& m, label_view dest);
void applyMapping(const label_view& src, const PartialMapping& m, label_view dest);

// sorted distinct labels of a volume (including 0 if present)
std::vector<label_type> uniqueLabels(const label_view& vol);

} /* namespace Stitching */

#endif /* STITCHING_LABELMAPPING_HXX */
