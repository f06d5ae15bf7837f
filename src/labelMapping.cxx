#include <algorithm>
#include <sstream>

#include <boost/throw_exception.hpp>

#include "stitching/errors.hxx"
#include "stitching/labelMapping.hxx"

namespace Stitching {

label_type TotalMapping::operator()(label_type from) const
{
    const_iterator it = map_.find(from);
    if (it == map_.end()) {
        std::ostringstream msg;
        msg << "TotalMapping: no entry for label " << from;
        boost::throw_exception(IncompleteMappingError(msg.str()));
    }
    return it->second;
}

label_type PartialMapping::operator()(label_type from) const
{
    const_iterator it = map_.find(from);
    if (it == map_.end())
        return from;
    return it->second;
}



TotalMapping compose(const TotalMapping &ab, const TotalMapping &bc)
{
    TotalMapping ac;
    for (TotalMapping::const_iterator it = ab.begin(); it != ab.end(); ++it) {
        if (!bc.contains(it->second)) {
            std::ostringstream msg;
            msg << "compose(): value " << it->second << " of key " << it->first
                << " is missing in the next mapping of the chain";
            boost::throw_exception(IncompleteMappingError(msg.str()));
        }
        ac.set(it->first, bc(it->second));
    }
    return ac;
}

TotalMapping compose(const TotalMapping &ab, const TotalMapping &bc, const TotalMapping &cd)
{
    return compose(compose(ab, bc), cd);
}

TotalMapping compose(const std::vector<TotalMapping > &chain)
{
    if (chain.empty())
        return TotalMapping();
    TotalMapping result = chain[0];
    for (size_t i = 1; i < chain.size(); i++)
        result = compose(result, chain[i]);
    return result;
}

TotalMapping invert(const TotalMapping &m)
{
    TotalMapping rev;
    for (TotalMapping::const_iterator it = m.begin(); it != m.end(); ++it) {
        if (rev.contains(it->second)) {
            std::ostringstream msg;
            msg << "invert(): keys " << rev(it->second) << " and " << it->first
                << " share the value " << it->second;
            boost::throw_exception(NonReversibleMappingError(msg.str()));
        }
        rev.set(it->second, it->first);
    }
    return rev;
}



namespace {
    template<class MAPPING>
    void applyMappingImpl(const label_view &src, const MAPPING &m, label_view dest)
    {
        if (src.shape() != dest.shape()) {
            std::ostringstream msg;
            msg << "applyMapping(): source shape " << src.shape()
                << " differs from destination shape " << dest.shape();
            boost::throw_exception(ShapeMismatch(msg.str()));
        }
        // neighbouring voxels mostly carry the same label
        bool cached = false;
        label_type last_from = 0, last_to = 0;
        for (vigra::MultiArrayIndex i = 0; i < src.size(); i++) {
            label_type from = src[i];
            if (!cached || from != last_from) {
                last_from = from;
                last_to = m(from);
                cached = true;
            }
            dest[i] = last_to;
        }
    }
} /* anonymous namespace */

void applyMapping(const label_view &src, const TotalMapping &m, label_view dest)
{
    applyMappingImpl(src, m, dest);
}

void applyMapping(const label_view &src, const PartialMapping &m, label_view dest)
{
    applyMappingImpl(src, m, dest);
}

std::vector<label_type > uniqueLabels(const label_view &vol)
{
    std::vector<label_type > labels(vol.begin(), vol.end());
    std::sort(labels.begin(), labels.end());
    labels.erase(std::unique(labels.begin(), labels.end()), labels.end());
    return labels;
}

} /* namespace Stitching */
