#include "dualst/mask.hpp"

#include <stdexcept>
#include <string>

namespace dualst {

using namespace axiom;

axiom::Tensor AttentionMask::to_fill_tensor() const {
    if (empty()) {
        return Tensor();
    }
    std::vector<float> fill(static_cast<size_t>(rows) * cols, 0.0f);
    for (size_t i = 0; i < fill.size(); ++i) {
        if (!visible[i])
            fill[i] = 1.0f;
    }
    return Tensor::from_data(
        fill.data(),
        Shape{1, 1, static_cast<size_t>(rows), static_cast<size_t>(cols)},
        true);
}

AttentionMask subsequent_mask(int n) {
    if (n < 0) {
        throw std::invalid_argument("subsequent_mask: negative size " +
                                    std::to_string(n));
    }
    AttentionMask m;
    m.rows = n;
    m.cols = n;
    m.visible.assign(static_cast<size_t>(n) * n, 0);
    for (int p = 0; p < n; ++p) {
        for (int q = 0; q <= p; ++q) {
            m.visible[p * n + q] = 1;
        }
    }
    return m;
}

AttentionMask target_mask(const std::vector<int> &tokens, int ignore_id) {
    auto m = subsequent_mask(static_cast<int>(tokens.size()));
    for (int p = 0; p < m.rows; ++p) {
        for (int q = 0; q < m.cols; ++q) {
            if (tokens[q] == ignore_id)
                m.visible[p * m.cols + q] = 0;
        }
    }
    return m;
}

AttentionMask build_cross_mask(const std::vector<int> &query,
                               const std::vector<int> &key, int ignore_id,
                               int lag) {
    AttentionMask m;
    m.rows = static_cast<int>(query.size());
    m.cols = static_cast<int>(key.size());
    m.visible.assign(static_cast<size_t>(m.rows) * m.cols, 0);
    for (int p = 0; p < m.rows; ++p) {
        if (query[p] == ignore_id)
            continue;
        for (int q = 0; q < m.cols && q <= p - lag; ++q) {
            if (key[q] != ignore_id)
                m.visible[p * m.cols + q] = 1;
        }
    }
    return m;
}

} // namespace dualst
