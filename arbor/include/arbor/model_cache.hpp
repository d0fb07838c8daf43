#pragma once
// ModelCache: the set of resident graphs, keyed by model id
//
// Lifecycle: load -> (get)* -> evict. Graphs are handed out as
// shared_ptr<const Graph>, so a query that already holds one finishes
// against it even if the entry is evicted meanwhile.
//
// Locking: the id table is the only shared mutable state. get/info/list
// take it shared; the insert at the end of load, evict and clear take it
// exclusive. Parsing runs outside the lock on a worker thread bounded by
// the load timeout.

#include "graph.hpp"
#include "loader.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbor {

struct CacheConfig {
    // Zero or negative waits indefinitely
    std::chrono::milliseconds load_timeout{60000};
};

struct ModelInfo {
    std::string id;
    std::string source;
    Timestamp loaded_at = 0;
    double load_seconds = 0.0;
    size_t element_count = 0;
    size_t association_count = 0;
    std::string root_name;
    size_t root_children = 0;
};

class ModelCache {
public:
    explicit ModelCache(GraphLoader loader = load_graph_file, CacheConfig config = {});
    ~ModelCache();

    // Non-copyable (owns the table and its lock)
    ModelCache(const ModelCache&) = delete;
    ModelCache& operator=(const ModelCache&) = delete;

    // Throws Error(LoadError); the table is untouched on failure
    std::string load(const std::string& source);

    // Throws Error(NotLoaded)
    GraphPtr get(const std::string& id) const;
    ModelInfo info(const std::string& id) const;

    // Idempotent. Returns whether an entry was removed.
    bool evict(const std::string& id);

    // Ordered by load time
    std::vector<ModelInfo> list() const;

    // Evicts everything, returns how many entries were removed
    size_t clear();

    size_t size() const;
    bool contains(const std::string& id) const;

    // Loader threads still running, including ones abandoned by a timeout.
    // Abandoned workers are detached and never joined; they touch only
    // their own copies of the loader and source.
    size_t running_loads() const { return running_loads_->load(); }

private:
    struct Entry {
        ModelInfo info;
        GraphPtr graph;
        uint64_t sequence = 0;
    };

    GraphPtr run_loader(const std::string& source) const;
    const Entry& entry_or_throw(const std::string& id) const;

    GraphLoader loader_;
    CacheConfig config_;
    std::shared_ptr<std::atomic<size_t>> running_loads_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    uint64_t next_sequence_ = 0;
};

} // namespace arbor
