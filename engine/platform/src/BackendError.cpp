#include "menukit/platform/BackendError.hpp"

namespace menukit::platform {

BackendError::BackendError(const std::string& what) : std::runtime_error(what) {}

}  // namespace menukit::platform
