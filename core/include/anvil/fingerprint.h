#pragma once

/**
 * @file fingerprint.h
 * @brief Content hashing for cache keys
 *
 * A node's fingerprint covers its identity, its operator identity (native
 * name and version, or script id and source hash) and, per input slot,
 * either the literal value or the upstream fingerprint and output slot. A
 * change anywhere upstream therefore changes every downstream fingerprint.
 */

#include <anvil/graph.h>
#include <anvil/types.h>
#include <cstdint>
#include <string>

namespace anvil {

using Fingerprint = uint64_t;

/**
 * @brief Incremental 64-bit FNV-1a hasher
 */
class Hasher {
public:
    Hasher& bytes(const void* data, size_t size);
    Hasher& u64(uint64_t v);
    Hasher& u32(uint32_t v);
    Hasher& str(const std::string& s);

    /// -0 hashes as 0 and every NaN hashes alike
    Hasher& f32(float v);

    Hasher& value(const Value& v);
    Hasher& nodeId(NodeId id);

    Fingerprint digest() const { return m_state; }

private:
    uint64_t m_state = 0xcbf29ce484222325ull;
};

/// Hash of a script source text
Fingerprint hashSource(const std::string& source);

} // namespace anvil
