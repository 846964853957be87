#ifndef SERIALIZATION_HPP
#define SERIALIZATION_HPP

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

// Little-endian helpers shared by the command codec, the KV snapshot format
// and the on-disk Raft state. Readers advance `offset` and throw
// std::runtime_error on a short buffer.
namespace codec {

inline void write_u8(std::vector<uint8_t>& out, uint8_t val) {
    out.push_back(val);
}

inline void write_u32_le(std::vector<uint8_t>& out, uint32_t val) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

inline void write_u64_le(std::vector<uint8_t>& out, uint64_t val) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

inline void write_string(std::vector<uint8_t>& out, const std::string& str) {
    if (str.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error("String too large to serialize");
    }
    write_u32_le(out, static_cast<uint32_t>(str.size()));
    out.insert(out.end(), str.begin(), str.end());
}

// Byte blobs use a 64-bit length prefix (snapshots can be large)
inline void write_bytes(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    write_u64_le(out, bytes.size());
    out.insert(out.end(), bytes.begin(), bytes.end());
}

inline uint8_t read_u8(const std::vector<uint8_t>& in, size_t& offset) {
    if (offset >= in.size()) {
        throw std::runtime_error("Buffer underrun reading u8");
    }
    return in[offset++];
}

inline uint32_t read_u32_le(const std::vector<uint8_t>& in, size_t& offset) {
    if (in.size() < 4 || offset > in.size() - 4) {
        throw std::runtime_error("Buffer underrun reading u32");
    }
    uint32_t val = 0;
    for (int i = 0; i < 4; ++i) {
        val |= (static_cast<uint32_t>(in[offset++]) << (i * 8));
    }
    return val;
}

inline uint64_t read_u64_le(const std::vector<uint8_t>& in, size_t& offset) {
    if (in.size() < 8 || offset > in.size() - 8) {
        throw std::runtime_error("Buffer underrun reading u64");
    }
    uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val |= (static_cast<uint64_t>(in[offset++]) << (i * 8));
    }
    return val;
}

inline std::string read_string(const std::vector<uint8_t>& in, size_t& offset) {
    uint32_t len = read_u32_le(in, offset);
    if (len > in.size() - offset) {
        throw std::runtime_error("Buffer underrun reading string");
    }
    std::string result(reinterpret_cast<const char*>(in.data() + offset), len);
    offset += len;
    return result;
}

inline std::vector<uint8_t> read_bytes(const std::vector<uint8_t>& in, size_t& offset) {
    uint64_t len = read_u64_le(in, offset);
    if (len > in.size() - offset) {
        throw std::runtime_error("Buffer underrun reading bytes");
    }
    std::vector<uint8_t> result(in.begin() + offset, in.begin() + offset + len);
    offset += static_cast<size_t>(len);
    return result;
}

} // namespace codec

#endif // SERIALIZATION_HPP
