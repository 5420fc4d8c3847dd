#include "routemap/route-map-config.hpp"

#include <initializer_list>
#include <string_view>

#include "invalid_argument_exception.hpp"
#include "log.hpp"
#include "routemap/path-normalize.hpp"
#include "routemap/string-trim.hpp"

namespace routemap {

void RouteMapConfig::validate() const {
  if (paramOpen == paramClose) {
    log::critical("Parameter delimiters must differ, got '{}' twice", paramOpen);
    throw invalid_argument("Parameter open and close delimiters must differ");
  }
  for (const char delimiter : {paramOpen, paramClose}) {
    if (delimiter == kPathSeparator || IsAsciiSpace(delimiter)) {
      log::critical("Invalid parameter delimiter '{}'", delimiter);
      throw invalid_argument("Parameter delimiters cannot be the path separator or whitespace");
    }
  }
  if (initialNodeCapacity == 0) {
    throw invalid_argument("initialNodeCapacity must be greater than 0");
  }
  for (std::string_view staticPath : staticPaths) {
    if (TrimSpaces(staticPath).empty()) {
      throw invalid_argument("Static paths cannot be empty");
    }
  }
}

}  // namespace routemap
