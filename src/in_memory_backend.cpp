#include "engram/in_memory_backend.hpp"
#include "engram/error.hpp"
#include "engram/similarity.hpp"
#include <algorithm>
#include <cmath>

namespace engram {

namespace {

double score(Distance distance, const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        return 0.0;
    }
    switch (distance) {
        case Distance::COSINE:
            return cosine_similarity(a, b);
        case Distance::DOT: {
            double dot = 0.0;
            for (size_t i = 0; i < a.size(); ++i) dot += static_cast<double>(a[i]) * b[i];
            return dot;
        }
        case Distance::EUCLID: {
            double sum = 0.0;
            for (size_t i = 0; i < a.size(); ++i) sum += std::pow(static_cast<double>(a[i]) - b[i], 2);
            return -std::sqrt(sum);
        }
        case Distance::MANHATTAN: {
            double sum = 0.0;
            for (size_t i = 0; i < a.size(); ++i) sum += std::fabs(static_cast<double>(a[i]) - b[i]);
            return -sum;
        }
    }
    return 0.0;
}

} // namespace

void InMemoryVectorBackend::begin_call(const char* context) {
    ++calls_;
    if (unavailable_) {
        throw BackendUnavailableError("In-memory backend marked unavailable", context);
    }
}

InMemoryVectorBackend::Collection& InMemoryVectorBackend::require(const std::string& collection,
                                                                  const char* context) {
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        throw CollectionNotFoundError(collection, context);
    }
    return it->second;
}

bool InMemoryVectorBackend::collection_exists(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call(__func__);
    return collections_.count(collection) > 0;
}

void InMemoryVectorBackend::create_collection(const std::string& collection, uint64_t vector_size,
                                              Distance distance) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call(__func__);
    if (collections_.count(collection) > 0) {
        throw BackendUnavailableError("Collection `" + collection + "` already exists", __func__);
    }
    Collection created;
    created.vector_size = vector_size;
    created.distance = distance;
    collections_.emplace(collection, std::move(created));
}

bool InMemoryVectorBackend::delete_collection(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call(__func__);
    return collections_.erase(collection) > 0;
}

std::optional<CollectionInfo> InMemoryVectorBackend::get_collection_info(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call(__func__);
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        return std::nullopt;
    }
    CollectionInfo info;
    info.name = collection;
    info.vector_size = it->second.vector_size;
    info.points_count = it->second.points.size();
    info.distance = it->second.distance;
    info.status = it->second.status;
    return info;
}

std::vector<std::string> InMemoryVectorBackend::list_collections() {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call(__func__);
    std::vector<std::string> names;
    for (const auto& entry : collections_) {
        names.push_back(entry.first);
    }
    return names;
}

void InMemoryVectorBackend::upsert(const std::string& collection, const std::vector<Point>& points) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call(__func__);
    auto& target = require(collection, __func__);
    for (const auto& point : points) {
        if (target.vector_size > 0 && point.vector.size() != target.vector_size) {
            throw BackendUnavailableError(
                "Wrong input: Vector dimension error: expected dim: " + std::to_string(target.vector_size) +
                ", got " + std::to_string(point.vector.size()), __func__);
        }
    }
    for (const auto& point : points) {
        target.points[point.id] = point;
    }
}

std::vector<ScoredPoint> InMemoryVectorBackend::search(const std::string& collection,
                                                       const std::vector<float>& vector,
                                                       const PointFilter& filter,
                                                       size_t limit,
                                                       std::optional<double> score_threshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call(__func__);
    const auto& source = require(collection, __func__);

    std::vector<ScoredPoint> hits;
    for (const auto& entry : source.points) {
        if (!filter.matches(entry.second.payload)) continue;
        double s = score(source.distance, vector, entry.second.vector);
        if (score_threshold && s < *score_threshold) continue;
        hits.push_back({entry.first, s, entry.second.payload});
    }
    std::stable_sort(hits.begin(), hits.end(),
                     [](const ScoredPoint& a, const ScoredPoint& b) { return a.score > b.score; });
    if (hits.size() > limit) {
        hits.resize(limit);
    }
    return hits;
}

ScrollPage InMemoryVectorBackend::scroll(const std::string& collection,
                                         const PointFilter& filter,
                                         size_t limit,
                                         const std::optional<std::string>& offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call(__func__);
    const auto& source = require(collection, __func__);

    ScrollPage page;
    auto it = offset ? source.points.lower_bound(*offset) : source.points.begin();
    for (; it != source.points.end(); ++it) {
        if (!filter.matches(it->second.payload)) continue;
        if (page.points.size() == limit) {
            page.next_offset = it->first;
            break;
        }
        page.points.push_back(it->second);
    }
    return page;
}

void InMemoryVectorBackend::delete_points(const std::string& collection,
                                          const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call(__func__);
    auto& target = require(collection, __func__);
    for (const auto& id : ids) {
        target.points.erase(id);
    }
}

void InMemoryVectorBackend::delete_points(const std::string& collection, const PointFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call(__func__);
    ENGRAM_CHECK_ARGUMENT(!filter.empty(), "Refusing to delete points with an empty filter");
    auto& target = require(collection, __func__);
    for (auto it = target.points.begin(); it != target.points.end();) {
        if (filter.matches(it->second.payload)) {
            it = target.points.erase(it);
        } else {
            ++it;
        }
    }
}

uint64_t InMemoryVectorBackend::count(const std::string& collection, const PointFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_call(__func__);
    const auto& source = require(collection, __func__);
    return static_cast<uint64_t>(std::count_if(
        source.points.begin(), source.points.end(),
        [&filter](const auto& entry) { return filter.matches(entry.second.payload); }));
}

void InMemoryVectorBackend::set_status(const std::string& collection, CollectionStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    require(collection, __func__).status = status;
}

void InMemoryVectorBackend::set_unavailable(bool unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_ = unavailable;
}

size_t InMemoryVectorBackend::call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

} // namespace engram
