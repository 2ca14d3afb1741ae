#pragma once

#include "proposal/orchestrator/v1/routing.pb.h"
#include "proposal/orchestrator/v1/state.pb.h"

namespace proposal::orchestrator::v1 {
}
