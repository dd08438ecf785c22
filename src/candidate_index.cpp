#include <verity/candidate_index.hpp>

#ifdef VERITY_ENABLE_SEMANTIC

#include <hnswlib/hnswlib.h>

#include <algorithm>
#include <mutex>
#include <unordered_map>

#include <verity/internal.hpp>

namespace verity {

namespace {

// A replaced or removed vector is marked deleted in the graph and its label
// forgotten. The next insert takes over a deleted slot before the graph grows.
class HnswCandidateIndex : public CandidateIndex {
 public:
  HnswCandidateIndex(size_t dimension, size_t capacity, int m, int ef_construction,
                     int ef_search)
      : dimension_(dimension), capacity_(std::max<size_t>(capacity, 16)) {
    space_ = std::make_unique<hnswlib::L2Space>(dimension);
    graph_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        space_.get(), capacity_, static_cast<size_t>(m), static_cast<size_t>(ef_construction),
        /*random_seed=*/100, /*allow_replace_deleted=*/true);
    graph_->setEf(static_cast<size_t>(ef_search));
  }

  bool Upsert(const std::string& document_id, const std::vector<float>& vector) override {
    if (vector.size() != dimension_) return false;
    std::lock_guard<std::mutex> lock(mu_);

    RemoveLocked(document_id);
    const hnswlib::labeltype label = next_label_++;
    try {
      if (graph_->getDeletedCount() == 0 && graph_->getCurrentElementCount() >= capacity_) {
        capacity_ *= 2;
        graph_->resizeIndex(capacity_);
      }
      graph_->addPoint(vector.data(), label, /*replace_deleted=*/true);
    } catch (const std::exception&) {
      return false;
    }
    label_of_[document_id] = label;
    id_of_[label] = document_id;
    return true;
  }

  bool Remove(const std::string& document_id) override {
    std::lock_guard<std::mutex> lock(mu_);
    return RemoveLocked(document_id);
  }

  std::vector<Neighbor> Search(const std::vector<float>& query, int k) const override {
    std::vector<Neighbor> out;
    if (query.size() != dimension_ || k <= 0) return out;
    std::lock_guard<std::mutex> lock(mu_);
    if (label_of_.empty()) return out;

    const size_t want = std::min(static_cast<size_t>(k), label_of_.size());
    std::priority_queue<std::pair<float, hnswlib::labeltype>> heap;
    try {
      heap = graph_->searchKnn(query.data(), want);
    } catch (const std::exception&) {
      return out;
    }

    // Max-heap: farthest first.
    while (!heap.empty()) {
      auto [distance, label] = heap.top();
      heap.pop();
      auto it = id_of_.find(label);
      if (it != id_of_.end()) out.push_back({it->second, internal::SquaredL2ToCosine(distance)});
    }
    std::reverse(out.begin(), out.end());
    return out;
  }

  size_t Size() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return label_of_.size();
  }

  size_t Dimension() const override { return dimension_; }

  size_t Capacity() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return capacity_;
  }

 private:
  bool RemoveLocked(const std::string& document_id) {
    auto it = label_of_.find(document_id);
    if (it == label_of_.end()) return false;
    try {
      graph_->markDelete(it->second);
    } catch (const std::exception&) {
      // already marked
    }
    id_of_.erase(it->second);
    label_of_.erase(it);
    return true;
  }

  const size_t dimension_;
  size_t capacity_;
  hnswlib::labeltype next_label_ = 0;

  mutable std::mutex mu_;
  std::unique_ptr<hnswlib::L2Space> space_;
  std::unique_ptr<hnswlib::HierarchicalNSW<float>> graph_;
  std::unordered_map<std::string, hnswlib::labeltype> label_of_;
  std::unordered_map<hnswlib::labeltype, std::string> id_of_;
};

}  // namespace

std::unique_ptr<CandidateIndex> CreateHnswCandidateIndex(size_t dimension,
                                                         size_t initial_capacity,
                                                         int m,
                                                         int ef_construction,
                                                         int ef_search) {
  if (dimension == 0) return nullptr;
  return std::make_unique<HnswCandidateIndex>(dimension, initial_capacity, m,
                                              ef_construction, ef_search);
}

}  // namespace verity

#else  // !VERITY_ENABLE_SEMANTIC

namespace verity {

std::unique_ptr<CandidateIndex> CreateHnswCandidateIndex(size_t /*dimension*/,
                                                         size_t /*initial_capacity*/,
                                                         int /*m*/,
                                                         int /*ef_construction*/,
                                                         int /*ef_search*/) {
  return nullptr;
}

}  // namespace verity

#endif  // VERITY_ENABLE_SEMANTIC
