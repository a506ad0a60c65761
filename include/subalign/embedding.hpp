#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <axiom/axiom.hpp>

#include "subalign/progress.hpp"

namespace subalign {

using namespace axiom;

// ─── Embedding Provider ──────────────────────────────────────────────────────

// Sentence embedding model, implemented outside the engine. embed() must
// return one fixed-length vector per input string and be deterministic.
class EmbeddingProvider {
  public:
    virtual ~EmbeddingProvider() = default;

    virtual std::vector<std::vector<float>>
    embed(const std::vector<std::string> &batch) = 0;
};

// ─── Embedding Cache ─────────────────────────────────────────────────────────

// Embeds each distinct string once, in batches of batch_size, and keeps the
// unit-normalized vectors for cosine similarity. One cache per merge run.
class EmbeddingCache {
  public:
    EmbeddingCache(EmbeddingProvider &provider, int batch_size,
                   const CancellationToken *cancel = nullptr);

    // Embed every string not seen yet. Cancellation is polled before each
    // provider call; on_progress receives the fraction of new strings done.
    void prefetch(const std::vector<std::string> &texts,
                  const std::function<void(float)> &on_progress = {});

    // Row-major (rows.size(), cols.size()) cosine similarities. Missing
    // strings are embedded first.
    std::vector<float> similarity_matrix(const std::vector<std::string> &rows,
                                         const std::vector<std::string> &cols);

    // Same for rows[row_begin, row_end) x cols[col_begin, col_end).
    std::vector<float> similarity_matrix(const std::vector<std::string> &rows,
                                         size_t row_begin, size_t row_end,
                                         const std::vector<std::string> &cols,
                                         size_t col_begin, size_t col_end);

    float similarity(const std::string &a, const std::string &b);

    // Unit-normalized embeddings, shape (last - first, dim).
    Tensor matrix(const std::vector<std::string> &texts, size_t first,
                  size_t last);

    int dim() const { return dim_; }
    size_t size() const { return index_.size(); }
    size_t provider_calls() const { return calls_; }

  private:
    EmbeddingProvider &provider_;
    int batch_size_;
    const CancellationToken *cancel_;

    int dim_ = 0;
    std::unordered_map<std::string, size_t> index_; // text → row
    std::vector<float> data_;                       // normalized rows
    size_t calls_ = 0;

    void embed_batch_(const std::vector<std::string> &batch);
    const float *row_(const std::string &text) const;
};

} // namespace subalign
