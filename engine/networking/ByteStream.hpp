#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace Lattice {

/**
 * @brief Little-endian byte writer used by the wire codec and UDP framing
 */
class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(size_t reserve) { m_data.reserve(reserve); }

    void WriteU8(uint8_t v) { m_data.push_back(v); }

    void WriteU16(uint16_t v) {
        for (int i = 0; i < 2; i++) {
            m_data.push_back(static_cast<uint8_t>(v >> (i * 8)));
        }
    }

    void WriteU32(uint32_t v) {
        for (int i = 0; i < 4; i++) {
            m_data.push_back(static_cast<uint8_t>(v >> (i * 8)));
        }
    }

    void WriteU64(uint64_t v) {
        for (int i = 0; i < 8; i++) {
            m_data.push_back(static_cast<uint8_t>(v >> (i * 8)));
        }
    }

    void WriteFloat(float v) {
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        WriteU32(bits);
    }

    void WriteVec3(const glm::vec3& v) {
        WriteFloat(v.x);
        WriteFloat(v.y);
        WriteFloat(v.z);
    }

    void WriteQuat(const glm::quat& q) {
        WriteFloat(q.x);
        WriteFloat(q.y);
        WriteFloat(q.z);
        WriteFloat(q.w);
    }

    void WriteString(const std::string& s) {
        WriteU32(static_cast<uint32_t>(s.size()));
        m_data.insert(m_data.end(), s.begin(), s.end());
    }

    void WriteBytes(std::span<const uint8_t> bytes) {
        m_data.insert(m_data.end(), bytes.begin(), bytes.end());
    }

    [[nodiscard]] const std::vector<uint8_t>& Data() const { return m_data; }
    std::vector<uint8_t> Release() { return std::move(m_data); }

private:
    std::vector<uint8_t> m_data;
};

/**
 * @brief Bounds-checked little-endian reader
 *
 * Every Read returns false (leaving the output untouched) when fewer bytes
 * remain than requested.
 */
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : m_data(data) {}

    bool ReadU8(uint8_t& out) {
        if (Remaining() < 1) return false;
        out = m_data[m_offset++];
        return true;
    }

    bool ReadU16(uint16_t& out) {
        if (Remaining() < 2) return false;
        uint16_t v = 0;
        for (int i = 0; i < 2; i++) {
            v |= static_cast<uint16_t>(m_data[m_offset++]) << (i * 8);
        }
        out = v;
        return true;
    }

    bool ReadU32(uint32_t& out) {
        if (Remaining() < 4) return false;
        uint32_t v = 0;
        for (int i = 0; i < 4; i++) {
            v |= static_cast<uint32_t>(m_data[m_offset++]) << (i * 8);
        }
        out = v;
        return true;
    }

    bool ReadU64(uint64_t& out) {
        if (Remaining() < 8) return false;
        uint64_t v = 0;
        for (int i = 0; i < 8; i++) {
            v |= static_cast<uint64_t>(m_data[m_offset++]) << (i * 8);
        }
        out = v;
        return true;
    }

    bool ReadFloat(float& out) {
        uint32_t bits;
        if (!ReadU32(bits)) return false;
        std::memcpy(&out, &bits, sizeof(out));
        return true;
    }

    bool ReadVec3(glm::vec3& out) {
        if (Remaining() < 12) return false;
        ReadFloat(out.x);
        ReadFloat(out.y);
        ReadFloat(out.z);
        return true;
    }

    bool ReadQuat(glm::quat& out) {
        if (Remaining() < 16) return false;
        ReadFloat(out.x);
        ReadFloat(out.y);
        ReadFloat(out.z);
        ReadFloat(out.w);
        return true;
    }

    /** @brief Read a payload of exactly len bytes into out */
    bool ReadString(std::string& out, uint32_t len) {
        if (Remaining() < len) return false;
        out.assign(reinterpret_cast<const char*>(m_data.data() + m_offset), len);
        m_offset += len;
        return true;
    }

    /** @brief View of everything not yet consumed; consumes it */
    std::span<const uint8_t> ReadRest() {
        auto rest = m_data.subspan(m_offset);
        m_offset = m_data.size();
        return rest;
    }

    [[nodiscard]] size_t Remaining() const { return m_data.size() - m_offset; }
    [[nodiscard]] bool AtEnd() const { return m_offset == m_data.size(); }

private:
    std::span<const uint8_t> m_data;
    size_t m_offset = 0;
};

} // namespace Lattice
