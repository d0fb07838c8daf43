#include <arbor/model_cache.hpp>
#include <arbor/log.hpp>
#include <algorithm>
#include <future>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

namespace arbor {

ModelCache::ModelCache(GraphLoader loader, CacheConfig config)
    : loader_(std::move(loader))
    , config_(config)
    , running_loads_(std::make_shared<std::atomic<size_t>>(0))
{
    if (!loader_) {
        loader_ = load_graph_file;
    }
    logging::debug("model_cache", "Initialized (load timeout " +
                   std::to_string(config_.load_timeout.count()) + " ms)");
}

ModelCache::~ModelCache() {
    size_t running = running_loads_->load();
    if (running > 0) {
        logging::warn("model_cache", std::to_string(running) +
                      " timed-out load(s) still running at shutdown");
    }
}

GraphPtr ModelCache::run_loader(const std::string& source) const {
    if (config_.load_timeout.count() <= 0) {
        return loader_(source);
    }

    // The worker owns its own copies, so a timed-out load can finish (or
    // hang) on its own without touching the cache
    auto promise = std::make_shared<std::promise<GraphPtr>>();
    std::future<GraphPtr> result = promise->get_future();

    running_loads_->fetch_add(1);
    std::thread worker([loader = loader_, source, promise, running = running_loads_]() {
        try {
            promise->set_value(loader(source));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        running->fetch_sub(1);
    });

    if (result.wait_for(config_.load_timeout) == std::future_status::timeout) {
        worker.detach();
        std::ostringstream ss;
        ss << "Model loading timed out after "
           << std::fixed << std::setprecision(1)
           << (config_.load_timeout.count() / 1000.0) << " seconds: " << source;
        throw Error(ErrorKind::LoadError, ss.str());
    }

    worker.join();
    return result.get();
}

std::string ModelCache::load(const std::string& source) {
    logging::info("model_cache", "Loading model from " + source);
    auto start = std::chrono::steady_clock::now();

    auto elapsed = [&start]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    GraphPtr graph;
    try {
        graph = run_loader(source);
    } catch (const Error& e) {
        logging::error("model_cache", e.what());
        if (e.kind() == ErrorKind::LoadError) throw;
        throw Error(ErrorKind::LoadError, e.what());
    } catch (const std::exception& e) {
        std::ostringstream ss;
        ss << "Failed to load model after " << std::fixed << std::setprecision(2)
           << elapsed() << " seconds: " << e.what();
        logging::error("model_cache", ss.str());
        throw Error(ErrorKind::LoadError, ss.str());
    }

    if (!graph || graph->size() == 0) {
        logging::error("model_cache", "Loader returned no graph for " + source);
        throw Error(ErrorKind::LoadError, "Loader returned no graph for " + source);
    }

    Entry entry;
    entry.graph = graph;
    entry.info.source = source;
    entry.info.loaded_at = now();
    entry.info.load_seconds = elapsed();
    entry.info.element_count = graph->size();
    entry.info.association_count = graph->association_count();
    entry.info.root_name = graph->root().name.empty() ? "unnamed" : graph->root().name;
    entry.info.root_children = graph->root().children.size();

    std::string id;
    size_t total = 0;
    {
        std::unique_lock lock(mutex_);
        entry.sequence = next_sequence_++;
        id = generate_model_id(entry.sequence);
        entry.info.id = id;
        entries_.emplace(id, std::move(entry));
        total = entries_.size();
    }

    std::ostringstream ss;
    ss << "Loaded model " << id << " in " << std::fixed << std::setprecision(2)
       << elapsed() << "s: " << graph->size() << " elements, "
       << graph->association_count() << " associations (total models: " << total << ")";
    logging::info("model_cache", ss.str());

    return id;
}

const ModelCache::Entry& ModelCache::entry_or_throw(const std::string& id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        throw Error(ErrorKind::NotLoaded, "Model not loaded: " + id);
    }
    return it->second;
}

GraphPtr ModelCache::get(const std::string& id) const {
    std::shared_lock lock(mutex_);
    return entry_or_throw(id).graph;
}

ModelInfo ModelCache::info(const std::string& id) const {
    std::shared_lock lock(mutex_);
    return entry_or_throw(id).info;
}

bool ModelCache::evict(const std::string& id) {
    size_t removed = 0;
    {
        std::unique_lock lock(mutex_);
        removed = entries_.erase(id);
    }
    if (removed > 0) {
        logging::info("model_cache", "Removed model " + id + " from cache");
    } else {
        logging::debug("model_cache", "Evict of unknown model " + id + " ignored");
    }
    return removed > 0;
}

std::vector<ModelInfo> ModelCache::list() const {
    std::vector<std::pair<uint64_t, ModelInfo>> ordered;
    {
        std::shared_lock lock(mutex_);
        ordered.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            ordered.emplace_back(entry.sequence, entry.info);
        }
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<ModelInfo> result;
    result.reserve(ordered.size());
    for (auto& [_, info] : ordered) {
        result.push_back(std::move(info));
    }
    return result;
}

size_t ModelCache::clear() {
    size_t count = 0;
    {
        std::unique_lock lock(mutex_);
        count = entries_.size();
        entries_.clear();
    }
    logging::info("model_cache", "Cleared " + std::to_string(count) + " models from cache");
    return count;
}

size_t ModelCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

bool ModelCache::contains(const std::string& id) const {
    std::shared_lock lock(mutex_);
    return entries_.count(id) > 0;
}

} // namespace arbor
