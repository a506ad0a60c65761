#include "subalign/embedding.hpp"

#include <algorithm>
#include <unordered_set>

#include "subalign/errors.hpp"

namespace subalign {

EmbeddingCache::EmbeddingCache(EmbeddingProvider &provider, int batch_size,
                               const CancellationToken *cancel)
    : provider_(provider), batch_size_(std::max(1, batch_size)),
      cancel_(cancel) {}

void EmbeddingCache::prefetch(const std::vector<std::string> &texts,
                              const std::function<void(float)> &on_progress) {
    std::vector<std::string> missing;
    std::unordered_set<std::string> queued;
    for (const auto &t : texts) {
        if (index_.count(t) == 0 && queued.insert(t).second) {
            missing.push_back(t);
        }
    }

    size_t done = 0;
    for (size_t pos = 0; pos < missing.size();
         pos += static_cast<size_t>(batch_size_)) {
        check_cancelled(cancel_);
        size_t end =
            std::min(missing.size(), pos + static_cast<size_t>(batch_size_));
        std::vector<std::string> batch(missing.begin() + pos,
                                       missing.begin() + end);
        embed_batch_(batch);
        done = end;
        if (on_progress) {
            on_progress(static_cast<float>(done) /
                        static_cast<float>(missing.size()));
        }
    }
    if (on_progress && missing.empty()) {
        on_progress(1.0f);
    }
}

void EmbeddingCache::embed_batch_(const std::vector<std::string> &batch) {
    std::vector<std::vector<float>> vectors;
    try {
        vectors = provider_.embed(batch);
    } catch (const MergeCancelled &) {
        throw;
    } catch (const std::exception &e) {
        throw ProviderError(std::string("embedding provider failed: ") +
                            e.what());
    }
    ++calls_;

    if (vectors.size() != batch.size()) {
        throw ProviderError("embedding provider returned " +
                            std::to_string(vectors.size()) +
                            " vectors for a batch of " +
                            std::to_string(batch.size()));
    }

    // All vectors share one dimension, fixed by the first batch
    if (dim_ == 0) {
        if (vectors.empty() || vectors[0].empty()) {
            throw ProviderError("embedding provider returned empty vectors");
        }
        dim_ = static_cast<int>(vectors[0].size());
    }
    const auto d = static_cast<size_t>(dim_);
    const size_t k = vectors.size();

    std::vector<float> flat;
    flat.reserve(k * d);
    for (const auto &v : vectors) {
        if (v.size() != d) {
            throw ProviderError("embedding dimension changed from " +
                                std::to_string(d) + " to " +
                                std::to_string(v.size()));
        }
        flat.insert(flat.end(), v.begin(), v.end());
    }

    // L2-normalize rows so cosine similarity becomes a dot product
    auto x = Tensor::from_data(flat.data(), Shape{k, d}, true);
    auto norms = ops::sqrt(ops::sum(x * x, {1})).unsqueeze(1); // (k, 1)
    auto unit = (x / (norms + 1e-8f)).ascontiguousarray();
    const float *p = unit.typed_data<float>();

    size_t base = index_.size();
    data_.insert(data_.end(), p, p + k * d);
    for (size_t i = 0; i < k; ++i) {
        index_.emplace(batch[i], base + i);
    }
}

const float *EmbeddingCache::row_(const std::string &text) const {
    auto it = index_.find(text);
    if (it == index_.end())
        return nullptr;
    return data_.data() + it->second * static_cast<size_t>(dim_);
}

Tensor EmbeddingCache::matrix(const std::vector<std::string> &texts,
                              size_t first, size_t last) {
    last = std::min(last, texts.size());
    first = std::min(first, last);
    std::vector<std::string> slice(texts.begin() + first, texts.begin() + last);
    prefetch(slice);

    const auto d = static_cast<size_t>(dim_);
    std::vector<float> rows;
    rows.reserve(slice.size() * d);
    for (const auto &t : slice) {
        const float *r = row_(t);
        rows.insert(rows.end(), r, r + d);
    }
    return Tensor::from_data(rows.data(), Shape{slice.size(), d}, true);
}

std::vector<float>
EmbeddingCache::similarity_matrix(const std::vector<std::string> &rows,
                                  size_t row_begin, size_t row_end,
                                  const std::vector<std::string> &cols,
                                  size_t col_begin, size_t col_end) {
    row_end = std::min(row_end, rows.size());
    col_end = std::min(col_end, cols.size());
    if (row_begin >= row_end || col_begin >= col_end)
        return {};

    auto a = matrix(rows, row_begin, row_end); // (r, d)
    auto b = matrix(cols, col_begin, col_end); // (c, d)
    auto sim = ops::matmul(a, b, false, true).ascontiguousarray(); // (r, c)

    size_t n = (row_end - row_begin) * (col_end - col_begin);
    const float *p = sim.typed_data<float>();
    return std::vector<float>(p, p + n);
}

std::vector<float>
EmbeddingCache::similarity_matrix(const std::vector<std::string> &rows,
                                  const std::vector<std::string> &cols) {
    return similarity_matrix(rows, 0, rows.size(), cols, 0, cols.size());
}

float EmbeddingCache::similarity(const std::string &a, const std::string &b) {
    prefetch({a, b});
    const float *ra = row_(a);
    const float *rb = row_(b);
    float dot = 0.0f;
    for (int k = 0; k < dim_; ++k)
        dot += ra[k] * rb[k];
    return dot;
}

} // namespace subalign
