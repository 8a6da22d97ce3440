#include "block_factor.h"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>

#include "worker_pool.h"

namespace pixunscale::core {

namespace {

void validate_frames(const std::vector<Frame>& frames) {
    if (frames.empty()) {
        throw std::invalid_argument("block factor detection needs at least one frame");
    }
    const int width = frames.front().width;
    const int height = frames.front().height;
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("frame dimensions must be positive");
    }
    for (size_t i = 0; i < frames.size(); ++i) {
        const Frame& frame = frames[i];
        if (frame.width != width || frame.height != height) {
            throw std::invalid_argument(
                "frame " + std::to_string(i) + " is " + std::to_string(frame.width) + "x"
                + std::to_string(frame.height) + ", expected " + std::to_string(width) + "x"
                + std::to_string(height));
        }
        if (frame.pixels.size() != frame.byte_count()) {
            throw std::invalid_argument("frame " + std::to_string(i) + " pixel buffer has the wrong size");
        }
    }
}

bool all_uniform_at(const std::vector<Frame>& frames, int k) {
    return std::ranges::all_of(frames, [k](const Frame& frame) { return is_uniform_at(frame, k); });
}

int first_uniform_factor(const std::vector<Frame>& frames, const std::vector<int>& candidates) {
    for (int k : candidates) {
        if (k == 1 || all_uniform_at(frames, k)) {
            return k;
        }
    }
    return 1;
}

} // namespace

std::vector<int> candidate_factors(int width, int height) {
    std::vector<int> candidates;
    for (int k = std::min(width, height); k >= 1; --k) {
        if (width % k == 0 && height % k == 0) {
            candidates.push_back(k);
        }
    }
    if (candidates.empty()) {
        candidates.push_back(1);
    }
    return candidates;
}

bool is_uniform_at(const Frame& frame, int k) {
    if (k <= 1) {
        return true;
    }
    const size_t row_bytes = static_cast<size_t>(frame.width) * NUM_CHANNELS;
    for (int y = 0; y < frame.height; ++y) {
        const int origin_y = y - (y % k);
        if (origin_y != y) {
            // Rows inside a block band must repeat the band's first row.
            if (std::memcmp(frame.row(y), frame.row(origin_y), row_bytes) != 0) {
                return false;
            }
            continue;
        }
        for (int x = 0; x < frame.width; ++x) {
            const int origin_x = x - (x % k);
            if (origin_x != x && !frame.same_pixel(x, y, origin_x, y)) {
                return false;
            }
        }
    }
    return true;
}

int detect_block_factor(const std::vector<Frame>& frames, unsigned int threads) {
    validate_frames(frames);

    const std::vector<int> candidates = candidate_factors(frames.front().width, frames.front().height);

    unsigned int worker_count = std::max(1U, threads);
    worker_count = std::min<unsigned int>(worker_count, static_cast<unsigned int>(candidates.size()));

    if (worker_count <= 1) {
        return first_uniform_factor(frames, candidates);
    }

    // Candidates are claimed in descending order. Slots are written by one
    // worker each; best_index only ever decreases.
    const size_t count = candidates.size();
    std::vector<unsigned char> accepted(count, 0);
    std::atomic<size_t> next_index{0};
    std::atomic<size_t> best_index{count - 1};

    const auto scan = [&]() {
        while (true) {
            const size_t idx = next_index.fetch_add(1, std::memory_order_relaxed);
            if (idx >= count || idx >= best_index.load(std::memory_order_acquire)) {
                break;
            }
            if (!all_uniform_at(frames, candidates[idx])) {
                continue;
            }
            accepted[idx] = 1;
            size_t current = best_index.load(std::memory_order_acquire);
            while (idx < current
                   && !best_index.compare_exchange_weak(current, idx, std::memory_order_acq_rel)) {
            }
        }
    };

    // Fewer threads than asked for still drain the whole candidate list.
    std::vector<std::thread> workers;
    if (start_workers(workers, worker_count, scan) == 0) {
        return first_uniform_factor(frames, candidates);
    }
    join_workers(workers);

    for (size_t i = 0; i < count; ++i) {
        if (accepted[i] != 0) {
            return candidates[i];
        }
    }
    return 1;
}

DetectionResult detect(const std::vector<Frame>& frames, unsigned int threads) {
    DetectionResult result;
    result.factor = detect_block_factor(frames, threads);
    result.width = frames.front().width / result.factor;
    result.height = frames.front().height / result.factor;
    return result;
}

} // namespace pixunscale::core
