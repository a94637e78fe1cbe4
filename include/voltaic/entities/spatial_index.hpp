#pragma once

#include <algorithm>
#include <vector>
#include "entt/entt.hpp"

namespace voltaic {
namespace entities {

/**
 * @brief Uniform grid bucketing placed entities by their (x, y) cell.
 *
 * Rebuilt once per World::update. Entities held in a slot or a hand have no
 * cell of their own and are never inserted.
 */
class SpatialIndex {
public:
    void init(int width, int height) {
        width_ = std::max(width, 0);
        height_ = std::max(height, 0);
        grid_.assign(static_cast<size_t>(width_) * height_, {});
    }

    void clear() {
        for (auto& cell : grid_) {
            cell.clear();
        }
    }

    void insert(entt::entity entity, int x, int y) {
        if (!in_bounds(x, y)) return;
        grid_[index_of(x, y)].push_back(entity);
    }

    const std::vector<entt::entity>& get_entities_at(int x, int y) const {
        static const std::vector<entt::entity> empty;
        return in_bounds(x, y) ? grid_[index_of(x, y)] : empty;
    }

    // Appends every entity in the inclusive cell rectangle
    void query_range(int min_x, int min_y, int max_x, int max_y,
                     std::vector<entt::entity>& out_result) const {
        min_x = std::max(min_x, 0);
        min_y = std::max(min_y, 0);
        max_x = std::min(max_x, width_ - 1);
        max_y = std::min(max_y, height_ - 1);

        for (int y = min_y; y <= max_y; ++y) {
            for (int x = min_x; x <= max_x; ++x) {
                const auto& cell = grid_[index_of(x, y)];
                out_result.insert(out_result.end(), cell.begin(), cell.end());
            }
        }
    }

    int width() const { return width_; }
    int height() const { return height_; }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<std::vector<entt::entity>> grid_;

    bool in_bounds(int x, int y) const {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

    size_t index_of(int x, int y) const {
        return static_cast<size_t>(y) * width_ + x;
    }
};

} // namespace entities
} // namespace voltaic
