#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

#include <boost/make_shared.hpp>
#include <boost/throw_exception.hpp>
#include <vigra/timing.hxx>

#include "stitching/blockTaskPool.hxx"
#include "stitching/errors.hxx"
#include "stitching/overlapTable.hxx"
#include "stitching/stitcher.hxx"

namespace Stitching {

////
//// class OffsetTable
////
namespace {
    bool indexLess(const std::pair<int, label_type > &a, const std::pair<int, label_type > &b)
    {
        return a.first < b.first;
    }
} /* anonymous namespace */

OffsetTable::OffsetTable(const std::vector<Subvolume > &subvolumes, const std::vector<label_type > &maxLabels)
: total_(0)
{
    if (subvolumes.size() != maxLabels.size())
        boost::throw_exception(ShapeMismatch("OffsetTable: one max label per subvolume required"));

    std::vector<std::pair<int, label_type > > ordered;
    for (size_t k = 0; k < subvolumes.size(); k++)
        ordered.push_back(std::make_pair(subvolumes[k].index(), maxLabels[k]));
    std::sort(ordered.begin(), ordered.end(), indexLess);

    for (size_t k = 0; k < ordered.size(); k++) {
        if (offsets_.find(ordered[k].first) != offsets_.end()) {
            std::ostringstream msg;
            msg << "OffsetTable: duplicate subvolume index " << ordered[k].first;
            boost::throw_exception(std::invalid_argument(msg.str()));
        }
        offsets_[ordered[k].first] = total_;
        total_ += ordered[k].second;
    }
}

OffsetTable::OffsetTable(const std::map<int, label_type > &offsets)
: offsets_(offsets), total_(0)
{
    for (std::map<int, label_type >::const_iterator it = offsets_.begin(); it != offsets_.end(); ++it)
        total_ = std::max(total_, it->second);
}

label_type OffsetTable::offset(int index) const
{
    std::map<int, label_type >::const_iterator it = offsets_.find(index);
    if (it == offsets_.end()) {
        std::ostringstream msg;
        msg << "OffsetTable::offset(): no offset for subvolume " << index;
        boost::throw_exception(std::out_of_range(msg.str()));
    }
    return it->second;
}



////
//// class EquivalenceMap
////
EquivalenceMap::EquivalenceMap(const std::vector<MergeEdge > &edges)
{
    std::vector<MergeEdge > sorted(edges);
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    for (size_t i = 0; i < sorted.size(); i++) {
        label_type a = repOf_(sorted[i].first);
        label_type b = repOf_(sorted[i].second);
        if (a == b)
            continue;

        // the class of a moves to b
        std::set<label_type >& target = membersOf_[b];
        target.insert(a);
        repOf_.set(a, b);
        std::map<label_type, std::set<label_type > >::iterator absorbed = membersOf_.find(a);
        if (absorbed != membersOf_.end()) {
            for (std::set<label_type >::const_iterator m = absorbed->second.begin(); m != absorbed->second.end(); ++m) {
                target.insert(*m);
                repOf_.set(*m, b);
            }
            membersOf_.erase(absorbed);
        }
    }
}



////
//// stages
////
OffsetTable assignOffsets(const std::vector<Subvolume > &subvolumes, const std::vector<label_type > &maxLabels)
{
    return OffsetTable(subvolumes, maxLabels);
}

std::vector<FragmentPtr > extractBoundaries(const Subvolume &subvolume, const label_view &labels)
{
    if (labels.shape() != subvolume.shape()) {
        std::ostringstream msg;
        msg << "extractBoundaries(): labels of subvolume " << subvolume.index() << " have shape "
            << labels.shape() << ", expected " << subvolume.shape();
        boost::throw_exception(ShapeMismatch(msg.str()));
    }

    std::vector<FragmentPtr > fragments;
    Box mine = subvolume.borderedBox();
    const std::vector<NeighborRecord >& neighbors = subvolume.neighbors();
    for (size_t n = 0; n < neighbors.size(); n++) {
        Box theirs = neighbors[n].box.grown(neighbors[n].border);

        volume_shape start, stop;
        bool empty = false;
        for (int axis = 0; axis < 3; axis++) {
            coordinate_type lo = std::max(mine.lower(axis), theirs.lower(axis));
            coordinate_type hi = std::min(mine.upper(axis), theirs.upper(axis));
            if (hi <= lo) {
                empty = true;
                break;
            }
            start[axis] = lo - mine.lower(axis);
            stop[axis] = hi - mine.lower(axis);
        }
        if (empty)
            continue;

        boost::shared_ptr<BoundaryFragment > fragment = boost::make_shared<BoundaryFragment >();
        fragment->key = BoundaryKey(std::min(subvolume.index(), neighbors[n].index),
                                    std::max(subvolume.index(), neighbors[n].index));
        fragment->subvolume = Subvolume(subvolume.index(), subvolume.box(), subvolume.border());
        fragment->labels = label_volume(labels.subarray(start, stop));
        fragments.push_back(fragment);
    }
    return fragments;
}

BoundaryGroups groupBoundaries(const std::vector<std::vector<FragmentPtr > > &fragments)
{
    BoundaryGroups groups;
    for (size_t i = 0; i < fragments.size(); i++)
        for (size_t j = 0; j < fragments[i].size(); j++)
            groups[fragments[i][j]->key].push_back(fragments[i][j]);
    return groups;
}

std::vector<MergeEdge > computeMergeEdges(
    const BoundaryKey &key,
    const std::vector<FragmentPtr > &fragments,
    const OffsetTable &offsets)
{
    if (fragments.size() != 2) {
        std::ostringstream msg;
        msg << "computeMergeEdges(): boundary (" << key.first << ", " << key.second << ") has "
            << fragments.size() << " contributors, expected 2";
        boost::throw_exception(MalformedBoundaryGroup(msg.str()));
    }

    FragmentPtr low = fragments[0];
    FragmentPtr high = fragments[1];
    if (high->subvolume.index() < low->subvolume.index())
        std::swap(low, high);
    if (low->subvolume.index() == high->subvolume.index()) {
        std::ostringstream msg;
        msg << "computeMergeEdges(): boundary (" << key.first << ", " << key.second
            << ") has two contributions of subvolume " << low->subvolume.index();
        boost::throw_exception(MalformedBoundaryGroup(msg.str()));
    }
    if (low->labels.shape() != high->labels.shape()) {
        std::ostringstream msg;
        msg << "computeMergeEdges(): boundary (" << key.first << ", " << key.second << ") shapes differ: "
            << low->labels.shape() << " vs. " << high->labels.shape();
        boost::throw_exception(MalformedBoundaryGroup(msg.str()));
    }

    // only the middle plane counts on faces where the two boxes touch.
    // edge and corner neighbors touch on two or three axes, there the
    // slab shrinks to a line or a single voxel.
    volume_shape shape = low->labels.shape();
    volume_shape slabStart(0, 0, 0), slabStop(shape);
    const Box& box1 = low->subvolume.box();
    const Box& box2 = high->subvolume.box();
    for (int axis = 0; axis < 3; axis++) {
        if (Subvolume::touches(box1.lower(axis), box1.upper(axis), box2.lower(axis), box2.upper(axis))) {
            slabStart[axis] = shape[axis] / 2;
            slabStop[axis] = slabStart[axis] + 1;
        }
    }
    std::vector<label_type > eligibleLabels = uniqueLabels(high->labels.subarray(slabStart, slabStop));
    std::set<label_type > eligible(eligibleLabels.begin(), eligibleLabels.end());

    label_type offset1 = offsets.offset(low->subvolume.index());
    label_type offset2 = offsets.offset(high->subvolume.index());

    // rows: labels of the higher subvolume, columns: labels of the lower one
    boost::shared_ptr<OverlapTable > overlap = buildOverlap(high->labels, low->labels, true);
    std::vector<OverlapTable::entry_key > entries = overlap->nonzeroEntries();

    std::vector<MergeEdge > edges;
    for (size_t i = 0; i < entries.size(); i++) {
        label_type h = entries[i].first;
        label_type l = entries[i].second;
        if (h == 0 || l == 0 || eligible.count(h) == 0)
            continue;
        edges.push_back(MergeEdge(l + offset1, h + offset2));
    }
    std::sort(edges.begin(), edges.end());
    return edges;
}

EquivalenceMap reconcileMerges(const std::vector<MergeEdge > &edges)
{
    return EquivalenceMap(edges);
}

label_volume applyEquivalence(
    const Subvolume &subvolume,
    const label_view &labels,
    const OffsetTable &offsets,
    const EquivalenceMap &equivalence)
{
    if (labels.shape() != subvolume.shape()) {
        std::ostringstream msg;
        msg << "applyEquivalence(): labels of subvolume " << subvolume.index() << " have shape "
            << labels.shape() << ", expected " << subvolume.shape();
        boost::throw_exception(ShapeMismatch(msg.str()));
    }

    label_type offset = offsets.offset(subvolume.index());
    label_volume result(labels);
    for (label_volume::iterator it = result.begin(); it != result.end(); ++it)
        if (*it != 0)
            *it += offset;

    // restrict the global map to the labels of this block
    PartialMapping local;
    std::vector<label_type > present = uniqueLabels(result);
    for (size_t i = 0; i < present.size(); i++)
        if (present[i] != 0 && equivalence.contains(present[i]))
            local.set(present[i], equivalence.representative(present[i]));
    if (!local.empty())
        applyMapping(result, local, result);
    return result;
}



////
//// class Stitcher
////
namespace {
    struct ExtractTask {
        ExtractTask(const std::vector<Subvolume > &subvolumes, const std::vector<label_volume > &labels)
        : subvolumes(subvolumes), labels(labels), fragments(subvolumes.size())
        {}

        void operator()(size_t k)
        {
            fragments[k] = extractBoundaries(subvolumes[k], labels[k]);
        }

        const std::vector<Subvolume >& subvolumes;
        const std::vector<label_volume >& labels;
        std::vector<std::vector<FragmentPtr > > fragments;
    };

    struct MergeTask {
        MergeTask(const BoundaryGroups &groups, const OffsetTable &offsets)
        : offsets(offsets), edges(groups.size())
        {
            for (BoundaryGroups::const_iterator it = groups.begin(); it != groups.end(); ++it)
                entries.push_back(&(*it));
        }

        void operator()(size_t k)
        {
            edges[k] = computeMergeEdges(entries[k]->first, entries[k]->second, offsets);
        }

        const OffsetTable& offsets;
        std::vector<const BoundaryGroups::value_type* > entries;
        std::vector<std::vector<MergeEdge > > edges;
    };

    struct RelabelTask {
        RelabelTask(const std::vector<Subvolume > &subvolumes, const std::vector<label_volume > &labels,
                    const OffsetTable &offsets, const EquivalenceMap &equivalence)
        : subvolumes(subvolumes), labels(labels), offsets(offsets), equivalence(equivalence),
          results(subvolumes.size())
        {}

        void operator()(size_t k)
        {
            results[k] = applyEquivalence(subvolumes[k], labels[k], offsets, equivalence);
        }

        const std::vector<Subvolume >& subvolumes;
        const std::vector<label_volume >& labels;
        const OffsetTable& offsets;
        const EquivalenceMap& equivalence;
        std::vector<label_volume > results;
    };
} /* anonymous namespace */

Stitcher::Stitcher(int num_threads, int verbose)
: num_threads(num_threads), verbose(verbose)
{
    prefix = "Stitcher: ";
}

void Stitcher::print()
{
    std::cerr << prefix << "parameters ->" << std::endl;
    std::cerr << "\t\t\t\t num_threads = " << num_threads << std::endl;
    std::cerr << "\t\t\t\t verbose = " << verbose << std::endl;
}

std::vector<label_volume > Stitcher::stitch(
    const std::vector<Subvolume > &subvolumes,
    const std::vector<label_volume > &labels,
    const std::vector<label_type > &maxLabels)
{
    return stitch(subvolumes, labels, assignOffsets(subvolumes, maxLabels));
}

std::vector<label_volume > Stitcher::stitch(
    const std::vector<Subvolume > &subvolumes,
    const std::vector<label_volume > &labels,
    const OffsetTable &offsets)
{
    USETICTOC;

    if (subvolumes.size() != labels.size())
        boost::throw_exception(ShapeMismatch("Stitcher::stitch(): one label volume per subvolume required"));

    edges.clear();
    equivalenceMap = EquivalenceMap();

    if (verbose) {
        boost::mutex::scoped_lock lock(io_mutex);
        std::cerr << prefix << "stitching " << subvolumes.size() << " subvolumes with "
                  << offsets.size() << " label offsets" << std::endl;
    }

    // boundary extraction
    TIC;
    ExtractTask extract(subvolumes, labels);
    BlockTaskPool<ExtractTask > extractPool(num_threads, verbose, prefix);
    extractPool.run(subvolumes.size(), extract);
    BoundaryGroups groups = groupBoundaries(extract.fragments);
    if (verbose)
        std::cerr << prefix << groups.size() << " boundaries extracted in " << TOCS << std::endl;

    // pairwise merges
    TIC;
    MergeTask merge(groups, offsets);
    BlockTaskPool<MergeTask > mergePool(num_threads, verbose, prefix);
    mergePool.run(merge.entries.size(), merge);
    for (size_t k = 0; k < merge.edges.size(); k++)
        edges.insert(edges.end(), merge.edges[k].begin(), merge.edges[k].end());
    std::sort(edges.begin(), edges.end());
    if (verbose)
        std::cerr << prefix << edges.size() << " merge edges computed in " << TOCS << std::endl;

    // reconciliation
    TIC;
    equivalenceMap = reconcileMerges(edges);
    if (verbose)
        std::cerr << prefix << equivalenceMap.size() << " labels merged in " << TOCS << std::endl;

    // relabeling
    TIC;
    RelabelTask relabel(subvolumes, labels, offsets, equivalenceMap);
    BlockTaskPool<RelabelTask > relabelPool(num_threads, verbose, prefix);
    relabelPool.run(subvolumes.size(), relabel);
    if (verbose)
        std::cerr << prefix << "relabeled in " << TOCS << std::endl;

    return relabel.results;
}

} /* namespace Stitching */
