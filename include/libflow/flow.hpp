#ifndef LIBFLOW_FLOW_H
#define LIBFLOW_FLOW_H

#include "libflow/access.hpp"
#include "libflow/config.hpp"
#include "libflow/document.hpp"
#include "libflow/exceptions.hpp"
#include "libflow/expand.hpp"
#include "libflow/formats/registry.hpp"
#include "libflow/operations.hpp"
#include "libflow/path.hpp"
#include "libflow/pipeline.hpp"
#include <string_view>

namespace libflow {

// libflow version number.
inline constexpr std::string_view VERSION{LIBFLOW_VERSION};

} // namespace libflow

#endif // LIBFLOW_FLOW_H
