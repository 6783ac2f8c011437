#pragma once

/// @file edext.hpp
/// @brief Convenience header pulling in the public edext API.

#include "edext/version.hpp"

#include "edext/foundation/config_manager.hpp"
#include "edext/foundation/engine_config.hpp"
#include "edext/foundation/engine_logger.hpp"
#include "edext/foundation/engine_result.hpp"

#include "edext/bridge/capability_bridge.hpp"
#include "edext/bridge/execution_context.hpp"
#include "edext/bridge/language_map.hpp"
#include "edext/bridge/memory_bridge.hpp"

#include "edext/plugin/plugin_loader.hpp"
#include "edext/plugin/plugin_registry.hpp"
#include "edext/plugin/plugin_types.hpp"
#include "edext/plugin/registry_watcher.hpp"

#include "edext/trigger/trigger_matcher.hpp"

#include "edext/action/action_executor.hpp"

#include "edext/script/script_engine_registry.hpp"

#include "edext/host/plugin_host.hpp"
