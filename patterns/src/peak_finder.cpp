#include "peak_finder.hpp"
#include <algorithm>
#include <numeric>

namespace patterns {

    namespace {

        std::vector<size_t> localMaxima(const std::vector<double>& x) {
            std::vector<size_t> peaks;
            if (x.size() < 3) {
                return peaks;
            }
            const size_t i_max = x.size() - 1;
            size_t i = 1;
            while (i < i_max) {
                if (x[i - 1] < x[i]) {
                    size_t i_ahead = i + 1;
                    // Walk across a plateau
                    while (i_ahead < i_max && x[i_ahead] == x[i]) {
                        ++i_ahead;
                    }
                    if (x[i_ahead] < x[i]) {
                        size_t left_edge = i;
                        size_t right_edge = i_ahead - 1;
                        peaks.push_back((left_edge + right_edge) / 2);
                        i = i_ahead; // Skip samples that can't be maxima
                    }
                }
                ++i;
            }
            return peaks;
        }

        // Higher peaks win; lower neighbours within the distance are dropped
        std::vector<size_t> selectByDistance(const std::vector<double>& x, const std::vector<size_t>& peaks, int min_distance) {
            if (peaks.size() < 2 || min_distance <= 1) {
                return peaks;
            }
            const size_t distance = static_cast<size_t>(min_distance);
            std::vector<size_t> order(peaks.size());
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(),
                [&](size_t a, size_t b) { return x[peaks[a]] < x[peaks[b]]; });

            std::vector<bool> keep(peaks.size(), true);
            for (auto it = order.rbegin(); it != order.rend(); ++it) {
                const size_t j = *it;
                if (!keep[j]) {
                    continue;
                }
                // Flag earlier peaks inside the distance
                for (size_t k = j; k-- > 0 && peaks[j] - peaks[k] < distance;) {
                    keep[k] = false;
                }
                // Flag later peaks inside the distance
                for (size_t k = j + 1; k < peaks.size() && peaks[k] - peaks[j] < distance; ++k) {
                    keep[k] = false;
                }
            }

            std::vector<size_t> selected;
            for (size_t j = 0; j < peaks.size(); ++j) {
                if (keep[j]) {
                    selected.push_back(peaks[j]);
                }
            }
            return selected;
        }

    } // end anonymous namespace

    std::vector<double> peakProminences(const std::vector<double>& x, const std::vector<size_t>& peaks) {
        std::vector<double> prominences;
        prominences.reserve(peaks.size());

        for (size_t peak : peaks) {
            const double height = x[peak];

            // Lowest point to the left before a higher sample is met
            double left_min = height;
            for (size_t i = peak + 1; i-- > 0;) {
                if (x[i] > height) {
                    break;
                }
                left_min = std::min(left_min, x[i]);
            }

            double right_min = height;
            for (size_t i = peak; i < x.size(); ++i) {
                if (x[i] > height) {
                    break;
                }
                right_min = std::min(right_min, x[i]);
            }

            prominences.push_back(height - std::max(left_min, right_min));
        }
        return prominences;
    }

    std::vector<size_t> findPeaks(const std::vector<double>& values, int min_distance, double min_prominence) {
        std::vector<size_t> peaks = selectByDistance(values, localMaxima(values), min_distance);
        if (peaks.empty()) {
            return peaks;
        }

        const auto prominences = peakProminences(values, peaks);
        std::vector<size_t> selected;
        selected.reserve(peaks.size());
        for (size_t j = 0; j < peaks.size(); ++j) {
            if (prominences[j] >= min_prominence) {
                selected.push_back(peaks[j]);
            }
        }
        return selected;
    }

} // namespace patterns
