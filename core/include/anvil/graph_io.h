#pragma once

/**
 * @file graph_io.h
 * @brief JSON persistence of node graphs
 *
 * @par Format (version 1)
 * @code
 * {
 *   "version": 1,
 *   "nodes": [
 *     { "id": { "index": 0, "generation": 1 }, "label": "Box",
 *       "operator": { "kind": "native", "name": "Box" },
 *       "inputs": [ { "name": "size", "type": "vec3", "default": [1,1,1],
 *                     "min": 0, "max": 1, "value": [2,1,1] } ],
 *       "outputs": [ { "name": "out_mesh", "type": "mesh" } ] }
 *   ],
 *   "edges": [ { "from": { "index": 0, "generation": 1 }, "from_slot": "out_mesh",
 *                "to": { "index": 1, "generation": 1 }, "to_slot": "mesh" } ],
 *   "output": { "index": 1, "generation": 1 }
 * }
 * @endcode
 *
 * Node ids and literals round-trip exactly, so a reloaded graph produces the
 * same fingerprints as the one that was saved.
 */

#include <anvil/graph.h>
#include <nlohmann/json.hpp>
#include <string>

namespace anvil {

/// Current persisted format version
constexpr int kGraphFormatVersion = 1;

nlohmann::json graphToJson(const Graph& graph);

/**
 * @brief Rebuild a graph from its JSON form
 * @throw GraphFormatError on malformed documents, including edges the graph
 *        would reject
 */
Graph graphFromJson(const nlohmann::json& data);

/// @throw GraphFormatError if the file cannot be written
void saveGraph(const Graph& graph, const std::string& path);

/// @throw GraphFormatError if the file cannot be read or parsed
Graph loadGraph(const std::string& path);

} // namespace anvil
