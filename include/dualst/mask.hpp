#pragma once

#include <cstdint>
#include <vector>

#include <axiom/axiom.hpp>

namespace dualst {

// ─── Attention Mask ─────────────────────────────────────────────────────────

// Boolean (rows x cols) visibility matrix: visible(p, q) means query position
// p may attend to key position q.
struct AttentionMask {
    int rows = 0;
    int cols = 0;
    std::vector<uint8_t> visible; // row-major, 1 = visible

    bool empty() const { return rows == 0 || cols == 0; }
    bool operator()(int p, int q) const { return visible[p * cols + q] != 0; }
    bool operator==(const AttentionMask &other) const = default;

    // (1, 1, rows, cols) float tensor with 1.0 where attention is blocked,
    // the convention expected by ops::masked_fill.
    axiom::Tensor to_fill_tensor() const;
};

// Lower-triangular (n x n) mask: position p sees positions 0..p.
AttentionMask subsequent_mask(int n);

// Causal mask that also hides positions holding the ignore token.
AttentionMask target_mask(const std::vector<int> &tokens, int ignore_id);

// Cross mask between two token streams. (p, q) is visible iff
// q <= p - lag and neither query[p] nor key[q] is the ignore token.
// A negative lag lets the query stream see -lag key tokens ahead; lag 0 is
// the causal case.
AttentionMask build_cross_mask(const std::vector<int> &query,
                               const std::vector<int> &key, int ignore_id,
                               int lag);

} // namespace dualst
