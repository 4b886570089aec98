/// identity - command line front end over a FileDIDStore
///
///   identity list   [--json] [--store DIR]
///   identity create LABEL [--store DIR]
///   identity link   DID_A DID_B [--store DIR]
///   identity revoke DID [--reason TEXT] [--store DIR]
///
/// Linking needs both private keys, so `link` only reports whether two DIDs
/// already share a cluster; use DIDManager::linkDIDs to link.

#include <cstdlib>
#include <didlink/didlink.hpp>
#include <iomanip>
#include <iostream>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

using namespace didlink;

namespace {

    struct Args {
        std::string command;
        std::vector<std::string> positional;
        std::string store_path;
        std::string reason;
        bool json = false;
    };

    std::string defaultStorePath() {
        const char *home = std::getenv("HOME");
        return std::string(home ? home : ".") + "/.didlink/identity_store";
    }

    int usage() {
        std::cerr << "Usage: identity {list,create,link,revoke} [args] [--store DIR]" << std::endl;
        return 1;
    }

    bool parseArgs(int argc, char **argv, Args &args) {
        if (argc < 2) {
            return false;
        }
        args.command = argv[1];
        args.store_path = defaultStorePath();

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--json" || arg == "-j") {
                args.json = true;
            } else if (arg == "--store" || arg == "--reason" || arg == "-r") {
                if (i + 1 >= argc) {
                    std::cerr << "Missing value for " << arg << std::endl;
                    return false;
                }
                (arg == "--store" ? args.store_path : args.reason) = argv[++i];
            } else {
                args.positional.push_back(arg);
            }
        }
        return true;
    }

    std::string shortId(const std::string &id) { return id.substr(0, 8); }

    int cmdList(DIDManager &manager, const Args &args) {
        auto nodes = manager.listNodes();
        auto clusters = manager.listClusters();

        if (args.json) {
            std::cout << "{\"nodes\":[";
            for (size_t i = 0; i < nodes.size(); ++i) {
                std::cout << (i > 0 ? "," : "") << nodes[i].toJson();
            }
            std::cout << "],\"clusters\":[";
            for (size_t i = 0; i < clusters.size(); ++i) {
                std::cout << (i > 0 ? "," : "") << clusters[i].toJson();
            }
            std::cout << "]}" << std::endl;
            return 0;
        }

        if (nodes.empty()) {
            std::cout << "No DIDs registered." << std::endl;
            return 0;
        }

        std::cout << std::left << std::setw(80) << "DID" << std::setw(15) << "Label" << std::setw(10) << "Status"
                  << "Cluster" << std::endl;
        std::cout << std::string(115, '-') << std::endl;
        for (const auto &node : nodes) {
            std::string cluster_label;
            auto cluster = manager.resolveIdentity(node.getDID());
            if (cluster.is_ok() && cluster.value()) {
                cluster_label = cluster.value()->getLabel().empty() ? shortId(cluster.value()->getClusterId())
                                                                    : cluster.value()->getLabel();
            }
            std::cout << std::left << std::setw(80) << node.getDID() << std::setw(15) << node.getLabel()
                      << std::setw(10) << didStatusToString(node.getStatus()) << cluster_label << std::endl;
        }

        if (!clusters.empty()) {
            std::cout << std::endl
                      << clusters.size() << " cluster(s), " << nodes.size() << " DID(s) total" << std::endl;
        }
        return 0;
    }

    int cmdCreate(DIDManager &manager, const Args &args) {
        if (args.positional.size() != 1) {
            std::cerr << "Usage: identity create LABEL" << std::endl;
            return 1;
        }

        auto created = manager.createDID(args.positional[0]);
        if (created.is_err()) {
            std::cerr << "Error: " << created.error().message.c_str() << std::endl;
            return 1;
        }

        const auto &result = created.value();
        std::cout << "Created: " << result.node.getDID() << " (" << result.node.getLabel() << ")" << std::endl;
        std::cout << "Private key (shown once, store it safely):" << std::endl;
        std::cout << "  " << keylock::keylock::to_hex(result.private_key) << std::endl;
        return 0;
    }

    int cmdLink(DIDManager &manager, const Args &args) {
        if (args.positional.size() != 2) {
            std::cerr << "Usage: identity link DID_A DID_B" << std::endl;
            return 1;
        }
        const auto &did_a = args.positional[0];
        const auto &did_b = args.positional[1];

        std::cerr << "Linking requires both private keys; this command only reports link status." << std::endl;

        auto cluster_a = manager.resolveIdentity(did_a);
        if (cluster_a.is_err()) {
            std::cerr << "Error: " << cluster_a.error().message.c_str() << std::endl;
            return 1;
        }
        auto cluster_b = manager.resolveIdentity(did_b);
        if (cluster_b.is_err()) {
            std::cerr << "Error: " << cluster_b.error().message.c_str() << std::endl;
            return 1;
        }

        auto linked = manager.linkStatus(did_a, did_b);
        if (linked.is_ok() && linked.value()) {
            const auto &cluster = *cluster_a.value();
            std::cout << "Both DIDs already in cluster: "
                      << (cluster.getLabel().empty() ? cluster.getClusterId() : cluster.getLabel()) << std::endl;
            return 0;
        }

        std::cout << "DID A: " << did_a << " (cluster: "
                  << (cluster_a.value() ? shortId(cluster_a.value()->getClusterId()) : "none") << ")" << std::endl;
        std::cout << "DID B: " << did_b << " (cluster: "
                  << (cluster_b.value() ? shortId(cluster_b.value()->getClusterId()) : "none") << ")" << std::endl;
        return 0;
    }

    int cmdRevoke(DIDManager &manager, const Args &args) {
        if (args.positional.size() != 1) {
            std::cerr << "Usage: identity revoke DID [--reason TEXT]" << std::endl;
            return 1;
        }

        auto revoked = manager.revokeDID(args.positional[0], args.reason);
        if (revoked.is_err()) {
            std::cerr << "Error: " << revoked.error().message.c_str() << std::endl;
            return 1;
        }

        std::cout << "Revoked: " << revoked.value().getDID() << " (" << revoked.value().getLabel() << ")"
                  << std::endl;
        if (!args.reason.empty()) {
            std::cout << "  Reason: " << args.reason << std::endl;
        }
        return 0;
    }

} // namespace

int main(int argc, char **argv) {
    Args args;
    if (!parseArgs(argc, argv, args)) {
        return usage();
    }

    // Only problems reach stderr; command results own stdout
    log::setLevel(spdlog::level::warn);

    storage::FileDIDStore store;
    auto opened = store.open(args.store_path);
    if (opened.is_err()) {
        std::cerr << "Cannot open store " << args.store_path << ": " << opened.error().message.c_str() << std::endl;
        return 1;
    }

    DIDManager manager(store);

    int rc = 0;
    if (args.command == "list") {
        rc = cmdList(manager, args);
    } else if (args.command == "create") {
        rc = cmdCreate(manager, args);
    } else if (args.command == "link") {
        rc = cmdLink(manager, args);
    } else if (args.command == "revoke") {
        rc = cmdRevoke(manager, args);
    } else {
        return usage();
    }

    auto closed = store.close();
    if (closed.is_err()) {
        std::cerr << "Cannot save store: " << closed.error().message.c_str() << std::endl;
        return 1;
    }
    return rc;
}
