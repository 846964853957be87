#include "raft/gRPCRaftClient.hpp"
#include "raft/RaftNode.hpp"
#include "kvstore/Command.hpp"
#include <chrono>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int MAX_ATTEMPTS = 10;

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " <command> <key> [value] <node_id>=<address> [<node_id>=<address> ...]"
              << std::endl;
    std::cerr << "Commands: put, get, append" << std::endl;
    std::cerr << "Example: " << program
              << " put mykey myvalue 1=localhost:5001 2=localhost:5002 3=localhost:5003"
              << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 4) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string key = argv[2];
    std::string value;

    int addressStart = 3;
    if (command == "put" || command == "append") {
        if (argc < 5) {
            std::cerr << "Error: " << command << " requires a value" << std::endl;
            return 1;
        }
        value = argv[3];
        addressStart = 4;
    } else if (command != "get") {
        std::cerr << "Unknown command: " << command << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    auto rpcClient = std::make_shared<GrpcRaftClient>();
    std::vector<uint64_t> nodeIds;
    for (int i = addressStart; i < argc; i++) {
        std::string arg = argv[i];
        auto eq = arg.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "Error: node must be <id>=<address>, got '" << arg << "'" << std::endl;
            return 1;
        }
        uint64_t id = 0;
        try {
            id = std::stoull(arg.substr(0, eq));
        } catch (const std::exception&) {
            std::cerr << "Error: invalid node id in '" << arg << "'" << std::endl;
            return 1;
        }
        rpcClient->addPeer(id, arg.substr(eq + 1));
        nodeIds.push_back(id);
    }

    // Random client id; a single request uses sequence number 1
    std::random_device rd;
    ClientRequestMeta meta{(static_cast<uint64_t>(rd()) << 32) | rd(), 1};

    CommandData cmdData;
    if (command == "put") {
        cmdData = PutCommand{meta, key, value};
    } else if (command == "append") {
        cmdData = AppendCommand{meta, key, value};
    } else {
        cmdData = GetCommand{meta, key};
    }

    ClientRequest request;
    request.command = serialize(cmdData);

    // Try nodes in turn, following leader hints; retries reuse the same
    // sequence number so the command is applied at most once
    size_t next = 0;
    uint64_t target = nodeIds[0];
    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
        std::cout << "Trying node " << target << "..." << std::endl;
        try {
            ClientReply reply = rpcClient->sendClientRequest(target, request);
            if (reply.success) {
                if (command == "get") {
                    std::cout << key << " = " << reply.value << std::endl;
                } else {
                    std::cout << "OK (index " << reply.index << ")" << std::endl;
                }
                return 0;
            }
            std::cout << "Node " << target << ": " << reply.error << std::endl;
            if (!reply.isLeader && reply.leaderId != 0 && rpcClient->hasPeer(reply.leaderId)) {
                target = reply.leaderId;
                continue;
            }
        } catch (const RpcError& e) {
            std::cout << e.what() << std::endl;
        }

        next = (next + 1) % nodeIds.size();
        target = nodeIds[next];
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cerr << "Error: no leader accepted the command after " << MAX_ATTEMPTS
              << " attempts" << std::endl;
    return 1;
}
