#pragma once

/**
 * @file script_library.h
 * @brief Registered scripts by id, with their described schemas
 *
 * Entries are immutable and shared: replacing a script's source swaps in a
 * new entry, so copies of the library (evaluation snapshots) keep seeing the
 * version they were taken with.
 */

#include <anvil/script_bridge.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace anvil {

using ScriptedOperatorPtr = std::shared_ptr<const ScriptedOperator>;

class ScriptLibrary {
public:
    /**
     * @brief Store a script's source and describe it
     *
     * A source that fails to describe is kept as broken, with the error
     * message; nodes using it fail until the source is fixed.
     */
    ScriptedOperatorPtr update(const std::string& id, const std::string& source,
                               const ScriptBridge& bridge);

    /// Forget a script; nodes using it fail until it is registered again
    void remove(const std::string& id);

    /// The current entry, or null if the id is unknown
    ScriptedOperatorPtr find(const std::string& id) const;

    /// Registered ids, sorted
    std::vector<std::string> ids() const;

    size_t size() const { return m_scripts.size(); }

    /**
     * @brief Register every *.js file in a directory (id = file stem)
     * @return Number of scripts loaded, broken ones included
     * @throw Error if the directory does not exist
     */
    size_t loadDirectory(const std::string& dir, const ScriptBridge& bridge);

private:
    std::map<std::string, ScriptedOperatorPtr> m_scripts;
};

/// Read a script file into a string
/// @throw Error if the file cannot be read
std::string readScriptFile(const std::string& path);

} // namespace anvil
