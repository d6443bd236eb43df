/**
 * @file intentmesh.hpp
 * @brief Umbrella header for the IntentMesh library.
 */
#pragma once
#include "intentmesh/core/util/logger.hpp"
#include "intentmesh/core/util/error_types.hpp"
#include "intentmesh/core/util/result.hpp"
#include "intentmesh/core/capability/capability.hpp"
#include "intentmesh/core/capability/capability_records.hpp"
#include "intentmesh/core/intent/intent.hpp"
#include "intentmesh/core/types.hpp"
#include "intentmesh/core/interfaces/icomponent.hpp"
#include "intentmesh/core/interfaces/iplugin.hpp"
#include "intentmesh/core/interfaces/icapability_unit.hpp"
#include "intentmesh/core/strategies/exponential_backoff.hpp"
#include "intentmesh/core/strategies/linear_backoff.hpp"
#include "intentmesh/core/strategies/fixed_backoff.hpp"
#include "intentmesh/core/pipeline/plugin_pipeline.hpp"
#include "intentmesh/core/discovery/component_discovery.hpp"
#include "intentmesh/core/router/intent_router.hpp"
#include "intentmesh/core/router/intent_composer.hpp"
#include "intentmesh/core/catalog/capability_catalog.hpp"
#include "intentmesh/core/options.hpp"
#include "intentmesh/core/fabric.hpp"
#include "intentmesh/plugins/file_validation_plugin.hpp"
#include "intentmesh/plugins/user_validation_plugin.hpp"
