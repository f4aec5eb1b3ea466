#pragma once

/**
 * @file script_bridge.h
 * @brief Execution boundary for JavaScript-defined operators
 *
 * A script assigns a global `node` object declaring its label, typed input
 * and output slots and an `op(inputs)` function:
 *
 * @code
 * node = {
 *   label: "Lift",
 *   inputs:  [ { name: "mesh", type: "mesh" },
 *              { name: "height", type: "float", default: 1, min: 0, max: 10 } ],
 *   outputs: [ { name: "out_mesh", type: "mesh" } ],
 *   op: function (inputs) {
 *     return { out_mesh: Ops.translate(inputs.mesh, [0, inputs.height, 0]) };
 *   }
 * };
 * @endcode
 *
 * Every describe() and invoke() runs in a fresh QuickJS runtime with its own
 * memory limit, stack limit and wall-clock budget, so invocations never share
 * interpreter state and may run on different threads. `Date` is removed and
 * `Math.random` throws; the only host API is the frozen `Ops` object of pure
 * mesh functions. Script values never leave the bridge: inputs and outputs
 * cross it as anvil Values.
 */

#include <anvil/config.h>
#include <anvil/fingerprint.h>
#include <anvil/operator.h>
#include <anvil/types.h>
#include <string>
#include <vector>

namespace anvil {

/**
 * @brief Slot schema declared by a script's `node` object
 */
struct ScriptSchema {
    std::string label;
    std::vector<SlotDecl> inputs;
    std::vector<SlotDecl> outputs;
};

/**
 * @brief One registered script and what the engine learned from it
 *
 * Held as shared_ptr<const ScriptedOperator> so an evaluation in flight keeps
 * the version it started with while the library swaps in a new one.
 */
struct ScriptedOperator {
    std::string id;
    std::string source;
    Fingerprint sourceHash = 0;  ///< Content hash; part of node fingerprints
    ScriptSchema schema;         ///< Empty when broken
    bool broken = false;         ///< Source failed to describe
    std::string error;           ///< Describe failure message when broken
};

class ScriptBridge {
public:
    explicit ScriptBridge(ScriptLimits limits = {});

    /**
     * @brief Run a script's top level and read its `node` declaration
     * @param id Script id, used as the file name in stacks and the default label
     * @throw ScriptError (Compile, Runtime, Timeout or OutOfMemory) on failure
     */
    ScriptSchema describe(const std::string& id, const std::string& source) const;

    /**
     * @brief Call `node.op` with marshalled inputs
     *
     * Every declared output must be present with a convertible value;
     * otherwise nothing is returned.
     *
     * @throw ScriptError with kind Broken if the script failed to describe,
     *        or the kind of the failure raised inside the sandbox
     */
    SlotValues invoke(const ScriptedOperator& op, const SlotValues& inputs) const;

    const ScriptLimits& limits() const { return m_limits; }
    void setLimits(const ScriptLimits& limits) { m_limits = limits; }

private:
    ScriptLimits m_limits;
};

} // namespace anvil
