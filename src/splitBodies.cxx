#include <set>
#include <vector>

#include <boost/shared_ptr.hpp>

#include "stitching/blockLabeling.hxx"
#include "stitching/overlapTable.hxx"
#include "stitching/splitBodies.hxx"

namespace Stitching {

namespace {
    /*
     * Given a volume with consecutive labels 1..N and its connected components
     * labeling 1..(N+M), build
     *
     *  - splitToNonconflicting: components -> 1..(N+M) where the main piece of
     *    consecutive label c is mapped to c and the other pieces to N+1..N+M
     *  - nonconflictingToConsecutive: 1..(N+M) -> the consecutive label it came from
     */
    void splitBodyMappings(
        const label_view &consecutive,
        const label_view &split,
        label_type numConsecutive,
        TotalMapping &splitToNonconflicting,
        TotalMapping &nonconflictingToConsecutive)
    {
        boost::shared_ptr<OverlapTable > overlap = buildOverlap(consecutive, split, true);

        // for each consecutive label: in which component did it mainly end up?
        TotalMapping mainPieces = overlap->argmaxPerRow();

        // every component lies inside exactly one consecutive label
        TotalMapping splitToConsecutive;
        std::vector<OverlapTable::entry_key > entries = overlap->nonzeroEntries();
        for (size_t i = 0; i < entries.size(); i++)
            splitToConsecutive.set(entries[i].second, entries[i].first);

        splitToNonconflicting = TotalMapping();
        nonconflictingToConsecutive = TotalMapping();
        for (TotalMapping::const_iterator it = mainPieces.begin(); it != mainPieces.end(); ++it) {
            splitToNonconflicting.set(it->second, it->first);
            nonconflictingToConsecutive.set(it->first, it->first);
        }

        // non-main pieces in ascending component order
        label_type next = numConsecutive + 1;
        for (TotalMapping::const_iterator it = splitToConsecutive.begin(); it != splitToConsecutive.end(); ++it) {
            if (splitToNonconflicting.contains(it->first))
                continue;
            splitToNonconflicting.set(it->first, next);
            nonconflictingToConsecutive.set(next, it->second);
            ++next;
        }
    }
} /* anonymous namespace */



SplitResult splitDisconnectedBodies(const label_view &labels, int conn)
{
    SplitResult result;
    result.labels.reshape(labels.shape());

    // 1. orig -> consecutive
    TotalMapping origToConsecutive;
    label_volume consecutive(labels.shape());
    label_type numConsecutive = relabelConsecutive(labels, consecutive, origToConsecutive);
    if (numConsecutive == 0) {
        result.labels.copy(labels);
        return result;
    }
    label_type maxOrig = origToConsecutive.entries().rbegin()->first;
    TotalMapping consecutiveToOrig = invert(origToConsecutive);

    // 2. connected components of the consecutive volume
    label_volume split(labels.shape());
    label_type numSplit = labelConnectedComponents(consecutive, split, conn);
    if (numSplit == numConsecutive) {
        result.labels.copy(labels);
        return result;
    }

    // 3. main pieces keep their label, the others go above N
    TotalMapping splitToConsWithSplits, consWithSplitsToCons;
    splitBodyMappings(consecutive, split, numConsecutive, splitToConsWithSplits, consWithSplitsToCons);

    // consWithSplits -> origWithSplits: 1..N as before, N+k -> maxOrig+k
    TotalMapping consWithSplitsToOrigWithSplits = consecutiveToOrig;
    for (label_type k = 1; numConsecutive + k <= numSplit; k++)
        consWithSplitsToOrigWithSplits.set(numConsecutive + k, maxOrig + k);

    // 4. split -> consWithSplits -> origWithSplits
    TotalMapping splitToOrigWithSplits = compose(splitToConsWithSplits, consWithSplitsToOrigWithSplits);
    if (!splitToOrigWithSplits.contains(0))
        splitToOrigWithSplits.set(0, 0);
    applyMapping(split, splitToOrigWithSplits, result.labels);

    // origWithSplits -> consWithSplits -> cons -> orig
    TotalMapping origWithSplitsToOrig = compose(invert(consWithSplitsToOrigWithSplits),
                                                consWithSplitsToCons,
                                                consecutiveToOrig);

    // 5. keep the new labels and every label they were split from
    std::set<label_type > splitLabels;
    for (TotalMapping::const_iterator it = origWithSplitsToOrig.begin(); it != origWithSplitsToOrig.end(); ++it)
        if (it->first > maxOrig)
            splitLabels.insert(it->second);
    for (TotalMapping::const_iterator it = origWithSplitsToOrig.begin(); it != origWithSplitsToOrig.end(); ++it) {
        if (it->first == 0)
            continue;
        if (it->first > maxOrig || splitLabels.count(it->second) > 0)
            result.newToOrig.set(it->first, it->second);
    }
    return result;
}

} /* namespace Stitching */
