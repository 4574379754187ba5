#pragma once

#include "config/config.pb.h"
#include "internal/core/operation.hpp"

namespace runtrack::factory {

/*
  BuildContext

  Constructs the collaborators every operation of this process shares.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete provider types.
*/
core::OperationContext BuildContext(const runtrack::runtime::config::RuntimeConfig& config);

} // namespace runtrack::factory
