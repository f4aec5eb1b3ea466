#pragma once

// Anvil - Main header
// Include this to embed the engine: build a graph in a Session and evaluate it

#include <anvil/config.h>
#include <anvil/errors.h>
#include <anvil/evaluator.h>
#include <anvil/graph.h>
#include <anvil/graph_io.h>
#include <anvil/mesh.h>
#include <anvil/mesh_builder.h>
#include <anvil/operator.h>
#include <anvil/operator_registry.h>
#include <anvil/script_bridge.h>
#include <anvil/script_library.h>
#include <anvil/selection.h>
#include <anvil/session.h>
#include <anvil/types.h>
#include <anvil/value_json.h>
