#include <algorithm>
#include <sstream>

#include <boost/throw_exception.hpp>

#include "stitching/errors.hxx"
#include "stitching/subvolume.hxx"

namespace Stitching {

////
//// struct Box
////
coordinate_type Box::lower(int axis) const
{
    switch (axis) {
        case 0: return x1;
        case 1: return y1;
        default: return z1;
    }
}

coordinate_type Box::upper(int axis) const
{
    switch (axis) {
        case 0: return x2;
        case 1: return y2;
        default: return z2;
    }
}

Box Box::grown(int border) const
{
    return Box(x1 - border, x2 + border, y1 - border, y2 + border, z1 - border, z2 + border);
}

volume_shape Box::shape() const
{
    return volume_shape(x2 - x1, y2 - y1, z2 - z1);
}

bool Box::operator==(const Box &other) const
{
    return x1 == other.x1 && x2 == other.x2 &&
           y1 == other.y1 && y2 == other.y2 &&
           z1 == other.z1 && z2 == other.z2;
}

std::ostream& operator<<(std::ostream &os, const Box &box)
{
    os << "[" << box.x1 << ":" << box.x2 << ", "
       << box.y1 << ":" << box.y2 << ", "
       << box.z1 << ":" << box.z2 << "]";
    return os;
}



////
//// class Subvolume
////
bool Subvolume::touches(coordinate_type p1, coordinate_type p2, coordinate_type q1, coordinate_type q2)
{
    return p1 == q2 || q1 == p2;
}

bool Subvolume::recordBorder(Subvolume &other)
{
    if (other.index_ == index_)
        return false;
    Box mine = borderedBox();
    Box theirs = other.borderedBox();
    for (int axis = 0; axis < 3; axis++) {
        // interiors have to touch or overlap
        if (box_.upper(axis) < other.box_.lower(axis) || other.box_.upper(axis) < box_.lower(axis))
            return false;
        // and the bordered boxes have to share voxels
        if (std::min(mine.upper(axis), theirs.upper(axis)) <= std::max(mine.lower(axis), theirs.lower(axis)))
            return false;
    }
    neighbors_.push_back(NeighborRecord(other.index_, other.box_, other.border_));
    other.neighbors_.push_back(NeighborRecord(index_, box_, border_));
    return true;
}



std::vector<Subvolume > partitionGrid(const volume_shape &volumeShape, const volume_shape &blockShape, int border)
{
    for (int d = 0; d < 3; d++) {
        if (blockShape[d] <= 0) {
            std::ostringstream msg;
            msg << "partitionGrid(): block shape has to be positive, got " << blockShape;
            boost::throw_exception(ConfigurationError(msg.str()));
        }
    }
    if (border < 0)
        boost::throw_exception(ConfigurationError("partitionGrid(): border must not be negative"));

    volume_shape blocks(
            (volumeShape[0] + blockShape[0] - 1) / blockShape[0],
            (volumeShape[1] + blockShape[1] - 1) / blockShape[1],
            (volumeShape[2] + blockShape[2] - 1) / blockShape[2]);

    std::vector<Subvolume > subvolumes;
    int index = 0;
    for (int i=0; i<blocks[0]; i++) {
        for (int j=0; j<blocks[1]; j++) {
            for (int k=0; k<blocks[2]; k++) {
                coordinate_type x = i*blockShape[0];
                coordinate_type y = j*blockShape[1];
                coordinate_type z = k*blockShape[2];

                Box box(x, std::min<coordinate_type>(x+blockShape[0], volumeShape[0]),
                        y, std::min<coordinate_type>(y+blockShape[1], volumeShape[1]),
                        z, std::min<coordinate_type>(z+blockShape[2], volumeShape[2]));
                subvolumes.push_back(Subvolume(index++, box, border));
            }
        }
    }
    return subvolumes;
}

void findNeighbors(std::vector<Subvolume > &subvolumes)
{
    for (size_t i = 0; i + 1 < subvolumes.size(); i++)
        for (size_t j = i + 1; j < subvolumes.size(); j++)
            subvolumes[i].recordBorder(subvolumes[j]);
}

} /* namespace Stitching */
