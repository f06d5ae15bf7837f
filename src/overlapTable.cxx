#include <algorithm>
#include <sstream>

#include <boost/throw_exception.hpp>

#include "stitching/blockLabeling.hxx"
#include "stitching/errors.hxx"
#include "stitching/overlapTable.hxx"

namespace Stitching {

namespace {
    void checkShapes(const label_view &a, const label_view &b)
    {
        if (a.shape() != b.shape()) {
            std::ostringstream msg;
            msg << "buildOverlap(): volume shapes differ: " << a.shape() << " vs. " << b.shape();
            boost::throw_exception(ShapeMismatch(msg.str()));
        }
    }
} /* anonymous namespace */



////
//// class DenseOverlapTable
////
DenseOverlapTable::DenseOverlapTable(const label_view &a, const label_view &b)
{
    checkShapes(a, b);
    label_type nrows = a.size() > 0 ? maxLabel(a) + 1 : 0;
    label_type ncols = b.size() > 0 ? maxLabel(b) + 1 : 0;
    table_.reshape(vigra::MultiArrayShape<2>::type(nrows, ncols), 0);
    for (vigra::MultiArrayIndex i = 0; i < a.size(); i++)
        table_(a[i], b[i]) += 1;
}

count_type DenseOverlapTable::count(label_type row, label_type col) const
{
    if (row >= rows() || col >= cols())
        return 0;
    return table_(row, col);
}

std::vector<OverlapTable::entry_key > DenseOverlapTable::nonzeroEntries() const
{
    std::vector<entry_key > entries;
    for (label_type r = 0; r < rows(); r++)
        for (label_type c = 0; c < cols(); c++)
            if (table_(r, c) > 0)
                entries.push_back(entry_key(r, c));
    return entries;
}

TotalMapping DenseOverlapTable::argmaxPerRow() const
{
    TotalMapping argmax;
    for (label_type r = 0; r < rows(); r++) {
        count_type best = 0;
        for (label_type c = 0; c < cols(); c++) {
            // strict comparison keeps the lowest column on ties
            if (table_(r, c) > best) {
                best = table_(r, c);
                argmax.set(r, c);
            }
        }
    }
    return argmax;
}

std::map<label_type, count_type > DenseOverlapTable::rowSums() const
{
    std::map<label_type, count_type > sums;
    for (label_type r = 0; r < rows(); r++) {
        count_type sum = 0;
        for (label_type c = 0; c < cols(); c++)
            sum += table_(r, c);
        if (sum > 0)
            sums[r] = sum;
    }
    return sums;
}



////
//// class SparseOverlapTable
////
SparseOverlapTable::SparseOverlapTable(const label_view &a, const label_view &b)
: rows_(0), cols_(0)
{
    checkShapes(a, b);
    for (vigra::MultiArrayIndex i = 0; i < a.size(); i++) {
        entries_[entry_key(a[i], b[i])] += 1;
        rows_ = std::max(rows_, a[i] + 1);
        cols_ = std::max(cols_, b[i] + 1);
    }
}

count_type SparseOverlapTable::count(label_type row, label_type col) const
{
    std::map<entry_key, count_type >::const_iterator it = entries_.find(entry_key(row, col));
    if (it == entries_.end())
        return 0;
    return it->second;
}

std::vector<OverlapTable::entry_key > SparseOverlapTable::nonzeroEntries() const
{
    std::vector<entry_key > entries;
    entries.reserve(entries_.size());
    for (std::map<entry_key, count_type >::const_iterator it = entries_.begin(); it != entries_.end(); ++it)
        entries.push_back(it->first);
    return entries;
}

TotalMapping SparseOverlapTable::argmaxPerRow() const
{
    TotalMapping argmax;
    std::map<label_type, count_type > best;
    // entries arrive ordered by (row, col): strict comparison keeps the lowest column on ties
    for (std::map<entry_key, count_type >::const_iterator it = entries_.begin(); it != entries_.end(); ++it) {
        label_type row = it->first.first;
        std::map<label_type, count_type >::iterator b = best.find(row);
        if (b == best.end() || it->second > b->second) {
            best[row] = it->second;
            argmax.set(row, it->first.second);
        }
    }
    return argmax;
}

std::map<label_type, count_type > SparseOverlapTable::rowSums() const
{
    std::map<label_type, count_type > sums;
    for (std::map<entry_key, count_type >::const_iterator it = entries_.begin(); it != entries_.end(); ++it)
        sums[it->first.first] += it->second;
    return sums;
}



boost::shared_ptr<OverlapTable > buildOverlap(const label_view &a, const label_view &b, bool sparse)
{
    if (sparse)
        return boost::shared_ptr<OverlapTable >(new SparseOverlapTable(a, b));
    return boost::shared_ptr<OverlapTable >(new DenseOverlapTable(a, b));
}

} /* namespace Stitching */
