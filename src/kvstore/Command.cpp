#include "kvstore/Command.hpp"
#include "raft/Serialization.hpp"
#include <stdexcept>
#include <type_traits>

namespace {

void write_meta(std::vector<uint8_t>& out, const ClientRequestMeta& meta) {
    codec::write_u64_le(out, meta.clientId);
    codec::write_u64_le(out, meta.sequenceNum);
}

ClientRequestMeta read_meta(const std::vector<uint8_t>& in, size_t& offset) {
    ClientRequestMeta meta;
    meta.clientId = codec::read_u64_le(in, offset);
    meta.sequenceNum = codec::read_u64_le(in, offset);
    return meta;
}

}

// Serialization Logic

std::vector<uint8_t> serialize(const CommandData& command) {
    std::vector<uint8_t> buffer;
    buffer.reserve(64);

    std::visit([&buffer](const auto& cmd) {
        using CmdType = std::decay_t<decltype(cmd)>;

        if constexpr (std::is_same_v<CmdType, PutCommand>) {
            codec::write_u8(buffer, static_cast<uint8_t>(CommandType::PUT));
            write_meta(buffer, cmd.meta);
            codec::write_string(buffer, cmd.key);
            codec::write_string(buffer, cmd.value);
        }
        else if constexpr (std::is_same_v<CmdType, AppendCommand>) {
            codec::write_u8(buffer, static_cast<uint8_t>(CommandType::APPEND));
            write_meta(buffer, cmd.meta);
            codec::write_string(buffer, cmd.key);
            codec::write_string(buffer, cmd.value);
        }
        else if constexpr (std::is_same_v<CmdType, GetCommand>) {
            codec::write_u8(buffer, static_cast<uint8_t>(CommandType::GET));
            write_meta(buffer, cmd.meta);
            codec::write_string(buffer, cmd.key);
        }
        else {
            static_assert(sizeof(CmdType) == 0, "Unhandled command type in serialize");
        }
    }, command);

    return buffer;
}

// Deserialization Logic

CommandData deserialize(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw std::runtime_error("Cannot deserialize empty buffer");
    }

    size_t offset = 0;
    uint8_t type_byte = codec::read_u8(bytes, offset);
    CommandType type = static_cast<CommandType>(type_byte);

    CommandData result;
    switch (type) {
        case CommandType::PUT: {
            PutCommand cmd;
            cmd.meta = read_meta(bytes, offset);
            cmd.key = codec::read_string(bytes, offset);
            cmd.value = codec::read_string(bytes, offset);
            result = std::move(cmd);
            break;
        }

        case CommandType::APPEND: {
            AppendCommand cmd;
            cmd.meta = read_meta(bytes, offset);
            cmd.key = codec::read_string(bytes, offset);
            cmd.value = codec::read_string(bytes, offset);
            result = std::move(cmd);
            break;
        }

        case CommandType::GET: {
            GetCommand cmd;
            cmd.meta = read_meta(bytes, offset);
            cmd.key = codec::read_string(bytes, offset);
            result = std::move(cmd);
            break;
        }

        default:
            throw std::runtime_error("Unknown command type: " +
                                   std::to_string(static_cast<int>(type_byte)));
    }

    if (offset != bytes.size()) {
        throw std::runtime_error("Trailing bytes after command");
    }
    return result;
}

const ClientRequestMeta& commandMeta(const CommandData& command) {
    return std::visit([](const auto& cmd) -> const ClientRequestMeta& { return cmd.meta; }, command);
}
