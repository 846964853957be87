#include "raft/RaftNode.hpp"
#include "raft/gRPCRaftClient.hpp"
#include "raft/gRPCRaftService.hpp"
#include "kvstore/KVStore.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> shutdownRequested{false};

void signalHandler(int) {
    shutdownRequested = true;
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " <node_id> <listen_address> [<peer_id>=<peer_address> ...] [options]\n"
              << "Options:\n"
              << "  --state-dir <dir>              persistence directory (default raft_data_node_<id>)\n"
              << "  --election-timeout-min <ms>    default 150\n"
              << "  --election-timeout-max <ms>    default 300\n"
              << "  --heartbeat <ms>               default 50\n"
              << "  --snapshot-threshold <n>       default 10000\n"
              << "  --verbose\n"
              << "Example: " << program
              << " 1 localhost:5001 2=localhost:5002 3=localhost:5003" << std::endl;
}

struct PeerAddress {
    uint64_t id;
    std::string address;
};

PeerAddress parsePeer(const std::string& text) {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == text.size()) {
        throw std::invalid_argument("Peer must be <id>=<address>, got '" + text + "'");
    }
    return PeerAddress{std::stoull(text.substr(0, eq)), text.substr(eq + 1)};
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    uint64_t nodeId = 0;
    std::string listenAddress;
    std::vector<PeerAddress> peers;
    RaftConfig config;

    try {
        nodeId = std::stoull(argv[1]);
        listenAddress = argv[2];
        config.stateDir = "raft_data_node_" + std::to_string(nodeId);

        for (int i = 3; i < argc; i++) {
            std::string arg = argv[i];
            auto nextValue = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument(arg + " requires a value");
                }
                return argv[++i];
            };

            if (arg == "--state-dir") {
                config.stateDir = nextValue();
            } else if (arg == "--election-timeout-min") {
                config.electionTimeoutMin = std::chrono::milliseconds(std::stoll(nextValue()));
            } else if (arg == "--election-timeout-max") {
                config.electionTimeoutMax = std::chrono::milliseconds(std::stoll(nextValue()));
            } else if (arg == "--heartbeat") {
                config.heartbeatInterval = std::chrono::milliseconds(std::stoll(nextValue()));
            } else if (arg == "--snapshot-threshold") {
                config.snapshotThreshold = std::stoull(nextValue());
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg.rfind("--", 0) == 0) {
                throw std::invalid_argument("Unknown option " + arg);
            } else {
                peers.push_back(parsePeer(arg));
            }
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    std::cout << "=== Starting Raft Node ===" << std::endl;
    std::cout << "Node ID: " << nodeId << std::endl;
    std::cout << "Listen Address: " << listenAddress << std::endl;
    std::cout << "State Dir: " << config.stateDir << std::endl;
    std::cout << "Peers: " << std::endl;
    for (const auto& peer : peers) {
        std::cout << "  - Node " << peer.id << " at " << peer.address << std::endl;
    }

    auto kvStore = std::make_shared<KVStore>();
    auto rpcClient = std::make_shared<GrpcRaftClient>();

    std::vector<uint64_t> peerIds;
    for (const auto& peer : peers) {
        rpcClient->addPeer(peer.id, peer.address);
        peerIds.push_back(peer.id);
    }

    std::unique_ptr<RaftNode> node;
    std::unique_ptr<GrpcRaftServer> server;
    try {
        node = std::make_unique<RaftNode>(nodeId, peerIds, kvStore, rpcClient, config);
        server = std::make_unique<GrpcRaftServer>(node.get(), listenAddress);
        server->start();
        node->start();
    } catch (const std::exception& e) {
        std::cerr << "Failed to start node " << nodeId << ": " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Node " << nodeId << " is running on " << listenAddress << std::endl;
    std::cout << "Press Ctrl+C to stop" << std::endl;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    int counter = 0;
    while (!shutdownRequested) {
        std::this_thread::sleep_for(std::chrono::seconds(1));

        if (node->isHalted()) {
            std::cerr << "Node " << nodeId << " halted, exiting" << std::endl;
            server->stop();
            node->stop();
            return 2;
        }

        // Print status every 5 seconds
        if (++counter % 5 == 0) {
            std::cout << "Node " << nodeId
                      << " | Role: " << roleToString(node->getCurrentRole())
                      << " | Term: " << node->getCurrentTerm()
                      << " | Leader: " << node->getLeaderId()
                      << " | Commit: " << node->getCommitIndex()
                      << " | Applied: " << node->getLastApplied()
                      << " | Log Size: " << node->getLogSize()
                      << " | Keys: " << kvStore->Size()
                      << std::endl;
        }
    }

    std::cout << "\nShutting down..." << std::endl;
    server->stop();
    node->stop();
    return 0;
}
