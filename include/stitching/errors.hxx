#ifndef STITCHING_ERRORS_HXX
#define STITCHING_ERRORS_HXX

#include <stdexcept>
#include <string>

namespace Stitching {

// A composition chain or a total mapping was asked for a label it does not know.
class IncompleteMappingError : public std::logic_error {
 public:
  explicit IncompleteMappingError(const std::string& what) : std::logic_error(what) {}
};

// Inversion of a many-to-one mapping.
class NonReversibleMappingError : public std::logic_error {
 public:
  explicit NonReversibleMappingError(const std::string& what) : std::logic_error(what) {}
};

// A boundary key without exactly two contributors, or contributors of different shape.
class MalformedBoundaryGroup : public std::runtime_error {
 public:
  explicit MalformedBoundaryGroup(const std::string& what) : std::runtime_error(what) {}
};

class ShapeMismatch : public std::logic_error {
 public:
  explicit ShapeMismatch(const std::string& what) : std::logic_error(what) {}
};

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

} /* namespace Stitching */

#endif /* STITCHING_ERRORS_HXX */
