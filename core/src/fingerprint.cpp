// Anvil - Fingerprint hashing

#include <anvil/fingerprint.h>
#include <anvil/mesh.h>
#include <cmath>
#include <cstring>

namespace anvil {

Hasher& Hasher::bytes(const void* data, size_t size) {
    const auto* p = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < size; ++i) {
        m_state ^= p[i];
        m_state *= 0x100000001b3ull;
    }
    return *this;
}

Hasher& Hasher::u64(uint64_t v) {
    unsigned char buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<unsigned char>(v >> (8 * i));
    }
    return bytes(buf, sizeof(buf));
}

Hasher& Hasher::u32(uint32_t v) {
    return u64(v);
}

Hasher& Hasher::str(const std::string& s) {
    u64(s.size());
    return bytes(s.data(), s.size());
}

Hasher& Hasher::f32(float v) {
    if (v == 0.0f) {
        v = 0.0f;
    } else if (std::isnan(v)) {
        return u32(0x7fc00000u);
    }
    uint32_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    return u32(bits);
}

Hasher& Hasher::nodeId(NodeId id) {
    u32(id.index);
    return u32(id.generation);
}

Hasher& Hasher::value(const Value& v) {
    u32(static_cast<uint32_t>(v.index()));
    switch (v.index()) {
        case 0: return f32(std::get<float>(v));
        case 1: return u64(static_cast<uint64_t>(static_cast<int64_t>(std::get<int>(v))));
        case 2: return u32(std::get<bool>(v) ? 1u : 0u);
        case 3: {
            const auto& x = std::get<glm::vec2>(v);
            return f32(x.x).f32(x.y);
        }
        case 4: {
            const auto& x = std::get<glm::vec3>(v);
            return f32(x.x).f32(x.y).f32(x.z);
        }
        case 5: {
            const auto& x = std::get<glm::vec4>(v);
            return f32(x.x).f32(x.y).f32(x.z).f32(x.w);
        }
        case 6: return str(std::get<std::string>(v));
        default: {
            const MeshHandle& mesh = std::get<MeshHandle>(v);
            if (!mesh) {
                return u32(0);
            }
            u64(mesh->vertexCount());
            for (const auto& p : mesh->positions()) {
                f32(p.x).f32(p.y).f32(p.z);
            }
            u64(mesh->faceCount());
            for (uint32_t idx : mesh->faceOffsets()) u32(idx);
            for (uint32_t idx : mesh->faceIndices()) u32(idx);
            for (ChannelKind kind : {ChannelKind::Vertex, ChannelKind::Face}) {
                for (const auto& ch : mesh->channels(kind)) {
                    str(ch.name).u32(static_cast<uint32_t>(ch.type));
                    for (float f : ch.data) f32(f);
                }
            }
            return *this;
        }
    }
}

Fingerprint hashSource(const std::string& source) {
    return Hasher().str(source).digest();
}

} // namespace anvil
