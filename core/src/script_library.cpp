// Anvil - Script library

#include <anvil/script_library.h>
#include <anvil/errors.h>
#include <anvil/fingerprint.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace anvil {

ScriptedOperatorPtr ScriptLibrary::update(const std::string& id, const std::string& source,
                                          const ScriptBridge& bridge) {
    auto entry = std::make_shared<ScriptedOperator>();
    entry->id = id;
    entry->source = source;
    entry->sourceHash = hashSource(source);

    try {
        entry->schema = bridge.describe(id, source);
    } catch (const ScriptError& e) {
        entry->broken = true;
        entry->error = e.what();
        std::cerr << "[Anvil Script] '" << id << "' is broken (" << scriptErrorKindName(e.kind())
                  << "): " << e.what() << std::endl;
    }

    ScriptedOperatorPtr result = entry;
    m_scripts[id] = result;
    return result;
}

void ScriptLibrary::remove(const std::string& id) {
    m_scripts.erase(id);
}

ScriptedOperatorPtr ScriptLibrary::find(const std::string& id) const {
    auto it = m_scripts.find(id);
    return it != m_scripts.end() ? it->second : nullptr;
}

std::vector<std::string> ScriptLibrary::ids() const {
    std::vector<std::string> out;
    out.reserve(m_scripts.size());
    for (const auto& [id, entry] : m_scripts) {
        out.push_back(id);
    }
    return out;
}

size_t ScriptLibrary::loadDirectory(const std::string& dir, const ScriptBridge& bridge) {
    if (!fs::is_directory(dir)) {
        throw Error("script directory not found: " + dir);
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".js") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    for (const auto& path : files) {
        update(path.stem().string(), readScriptFile(path.string()), bridge);
    }
    std::cout << "[Anvil Script] Loaded " << files.size() << " script(s) from " << dir << std::endl;
    return files.size();
}

std::string readScriptFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw Error("cannot read script file: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // namespace anvil
