#include "stitching/blockTaskPool.hxx"

namespace Stitching {

boost::mutex io_mutex;

} /* namespace Stitching */
