#include "redline/errors.hpp"

namespace redline {

std::string_view to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::Persistence:
    return "persistence";
  case ErrorKind::ResourceLimit:
    return "resource-limit";
  }
  return "unknown";
}

ResourceLimitExceeded::ResourceLimitExceeded(std::size_t limit, std::size_t actual)
    : Error(ErrorKind::ResourceLimit, "input of " + std::to_string(actual) +
                                          " characters exceeds the limit of " +
                                          std::to_string(limit)),
      limit_(limit), actual_(actual) {}

} // namespace redline
