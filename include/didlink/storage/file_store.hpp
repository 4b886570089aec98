#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <didlink/common/error.hpp>
#include <didlink/common/logger.hpp>
#include <didlink/storage/memory_store.hpp>
#include <exception>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <vector>

namespace didlink::storage {

    /// Storage options for FileDIDStore
    struct StoreOptions {
        bool sync_on_flush = true; // flush the OS stream after every file write

        auto members() { return std::tie(sync_on_flush); }
        auto members() const { return std::tie(sync_on_flush); }
    };

    // ===========================================
    // FileDIDStore - snapshot files on disk
    // ===========================================
    //
    // Layout under the store directory:
    //   nodes.dat     every node, rewritten on flush
    //   clusters.dat  every cluster, rewritten on flush
    //   proofs.dat    append-only, new proofs appended on flush
    // Each file is a sequence of [u32 length][versioned datapod record].
    //
    // All reads and writes between open() and flush() happen in memory with the
    // InMemoryDIDStore contract. Private keys are never part of any record.
    // open(), flush() and close() hold the store's exclusive lock, so they
    // never interleave with a DIDManager operation on the same store.

    class FileDIDStore : public InMemoryDIDStore {
      public:
        inline FileDIDStore() : is_open_(false), flushed_proofs_(0), log_(log::createLogger("FileDIDStore")) {}

        inline ~FileDIDStore() override {
            auto res = close();
            if (res.is_err()) {
                log_->error("failed to flush store at {}: {}", base_path_.string(), res.error().message.c_str());
            }
        }

        /// Open or create a store directory and load its snapshot
        inline dp::Result<void, dp::Error> open(const std::string &path, const StoreOptions &opts = StoreOptions{}) {
            std::unique_lock lock(mutex());
            try {
                base_path_ = path;
                options_ = opts;
                std::filesystem::create_directories(base_path_);
            } catch (const std::exception &e) {
                is_open_ = false;
                return dp::Result<void, dp::Error>::err(store_io(dp::String(e.what())));
            }

            clear();
            auto loaded = loadSnapshot();
            if (loaded.is_err()) {
                clear();
                is_open_ = false;
                return loaded;
            }

            flushed_proofs_ = proofCount();
            is_open_ = true;
            log_->debug("opened {} ({} nodes, {} clusters, {} proofs)", base_path_.string(), nodeCount(),
                        clusterCount(), proofCount());
            return dp::Result<void, dp::Error>::ok();
        }

        /// Write the current state to disk
        inline dp::Result<void, dp::Error> flush() {
            std::unique_lock lock(mutex());
            return flushLocked();
        }

        /// Flush and close
        inline dp::Result<void, dp::Error> close() {
            std::unique_lock lock(mutex());
            if (!is_open_) {
                return dp::Result<void, dp::Error>::ok();
            }
            auto res = flushLocked();
            is_open_ = false;
            return res;
        }

        inline bool isOpen() const {
            std::shared_lock lock(mutex());
            return is_open_;
        }

        inline std::string path() const { return base_path_.string(); }

      private:
        // Caller holds the exclusive lock
        inline dp::Result<void, dp::Error> flushLocked() {
            if (!is_open_) {
                return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Store not open"));
            }

            try {
                auto nodes = listNodes();
                auto nodes_res = rewriteRecords(base_path_ / "nodes.dat", nodes);
                if (nodes_res.is_err()) {
                    return nodes_res;
                }

                auto clusters = listClusters();
                auto clusters_res = rewriteRecords(base_path_ / "clusters.dat", clusters);
                if (clusters_res.is_err()) {
                    return clusters_res;
                }

                auto proofs = listProofs();
                if (proofs.size() > flushed_proofs_) {
                    std::vector<LinkProof> pending(proofs.begin() + static_cast<std::ptrdiff_t>(flushed_proofs_),
                                                   proofs.end());
                    auto proofs_res = appendRecords(base_path_ / "proofs.dat", pending);
                    if (proofs_res.is_err()) {
                        return proofs_res;
                    }
                    flushed_proofs_ = proofs.size();
                }
            } catch (const std::exception &e) {
                return dp::Result<void, dp::Error>::err(store_io(dp::String(e.what())));
            }

            return dp::Result<void, dp::Error>::ok();
        }

        // ===========================================
        // Record I/O
        // ===========================================

        template <typename T> inline void writeRecord(std::ofstream &out, const T &record) {
            auto bytes = record.toBytes();
            dp::u32 len = static_cast<dp::u32>(bytes.size());
            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        }

        /// Replace file contents atomically via a temporary file and rename
        template <typename T>
        inline dp::Result<void, dp::Error> rewriteRecords(const std::filesystem::path &file,
                                                          const std::vector<T> &records) {
            auto tmp = file;
            tmp += ".tmp";
            {
                std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
                if (!out) {
                    return dp::Result<void, dp::Error>::err(store_io(describe("Cannot write", tmp.string())));
                }
                for (const auto &record : records) {
                    writeRecord(out, record);
                }
                if (options_.sync_on_flush) {
                    out.flush();
                }
                if (!out) {
                    return dp::Result<void, dp::Error>::err(store_io(describe("Write failed", tmp.string())));
                }
            }
            std::filesystem::rename(tmp, file);
            return dp::Result<void, dp::Error>::ok();
        }

        template <typename T>
        inline dp::Result<void, dp::Error> appendRecords(const std::filesystem::path &file,
                                                         const std::vector<T> &records) {
            std::ofstream out(file, std::ios::binary | std::ios::app);
            if (!out) {
                return dp::Result<void, dp::Error>::err(store_io(describe("Cannot append to", file.string())));
            }
            for (const auto &record : records) {
                writeRecord(out, record);
            }
            if (options_.sync_on_flush) {
                out.flush();
            }
            if (!out) {
                return dp::Result<void, dp::Error>::err(store_io(describe("Append failed", file.string())));
            }
            return dp::Result<void, dp::Error>::ok();
        }

        /// Read every record of a file; a missing file is an empty list
        template <typename T>
        inline dp::Result<std::vector<T>, dp::Error> readAllRecords(const std::filesystem::path &file) {
            std::vector<T> records;
            if (!std::filesystem::exists(file)) {
                return dp::Result<std::vector<T>, dp::Error>::ok(records);
            }

            std::ifstream in(file, std::ios::binary);
            if (!in) {
                return dp::Result<std::vector<T>, dp::Error>::err(store_io(describe("Cannot read", file.string())));
            }

            while (true) {
                dp::u32 len = 0;
                in.read(reinterpret_cast<char *>(&len), sizeof(len));
                if (in.gcount() == 0) {
                    break;
                }
                if (in.gcount() != static_cast<std::streamsize>(sizeof(len))) {
                    return dp::Result<std::vector<T>, dp::Error>::err(
                        store_io(describe("Truncated record header in", file.string())));
                }

                std::vector<uint8_t> data(len);
                in.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(len));
                if (in.gcount() != static_cast<std::streamsize>(len)) {
                    return dp::Result<std::vector<T>, dp::Error>::err(
                        store_io(describe("Truncated record in", file.string())));
                }

                auto record = T::fromBytes(data);
                if (record.is_err()) {
                    return dp::Result<std::vector<T>, dp::Error>::err(record.error());
                }
                records.push_back(record.value());
            }

            return dp::Result<std::vector<T>, dp::Error>::ok(records);
        }

        inline dp::Result<void, dp::Error> loadSnapshot() {
            try {
                return loadRecords();
            } catch (const std::exception &e) {
                return dp::Result<void, dp::Error>::err(store_io(dp::String(e.what())));
            }
        }

        inline dp::Result<void, dp::Error> loadRecords() {
            auto nodes = readAllRecords<DIDNode>(base_path_ / "nodes.dat");
            if (nodes.is_err()) {
                return dp::Result<void, dp::Error>::err(nodes.error());
            }
            for (const auto &node : nodes.value()) {
                auto res = saveNode(node);
                if (res.is_err()) {
                    return res;
                }
            }

            auto clusters = readAllRecords<IdentityCluster>(base_path_ / "clusters.dat");
            if (clusters.is_err()) {
                return dp::Result<void, dp::Error>::err(clusters.error());
            }
            for (const auto &cluster : clusters.value()) {
                auto res = saveCluster(cluster);
                if (res.is_err()) {
                    return res;
                }
            }

            auto proofs = readAllRecords<LinkProof>(base_path_ / "proofs.dat");
            if (proofs.is_err()) {
                return dp::Result<void, dp::Error>::err(proofs.error());
            }
            for (const auto &proof : proofs.value()) {
                auto res = saveProof(proof);
                if (res.is_err()) {
                    return res;
                }
            }

            return dp::Result<void, dp::Error>::ok();
        }

        std::filesystem::path base_path_;
        StoreOptions options_;
        bool is_open_;
        size_t flushed_proofs_;
        log::Logger log_;
    };

} // namespace didlink::storage
