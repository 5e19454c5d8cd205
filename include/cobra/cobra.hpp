#pragma once

#include "cobra/common/naming.hpp" // IWYU pragma: export
#include "cobra/common/types.hpp"  // IWYU pragma: export

#include "cobra/branch/branch_data.hpp"          // IWYU pragma: export
#include "cobra/branch/continuation_object.hpp"  // IWYU pragma: export
#include "cobra/branch/metrics.hpp"              // IWYU pragma: export
#include "cobra/branch/summary.hpp"              // IWYU pragma: export
#include "cobra/config/settings.hpp"             // IWYU pragma: export
#include "cobra/config/system.hpp"               // IWYU pragma: export
#include "cobra/engine/engine.hpp"               // IWYU pragma: export
#include "cobra/jobs/client.hpp"                 // IWYU pragma: export
#include "cobra/jobs/protocol.hpp"               // IWYU pragma: export
#include "cobra/orchestration/service.hpp"       // IWYU pragma: export
#include "cobra/params/resolution.hpp"           // IWYU pragma: export
#include "cobra/params/subsystem.hpp"            // IWYU pragma: export
#include "cobra/seeds/resume.hpp"                // IWYU pragma: export
#include "cobra/seeds/trimming.hpp"              // IWYU pragma: export
#include "cobra/storage/object_store.hpp"        // IWYU pragma: export
#include "cobra/wire/codec.hpp"                  // IWYU pragma: export
