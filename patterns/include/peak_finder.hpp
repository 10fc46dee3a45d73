#pragma once

#include <vector>
#include <cstddef>

namespace patterns {

    // Local maxima of `values`, filtered the same way scipy.signal.find_peaks does when
    // given `distance` and `prominence`:
    //   1. strict local maxima, flat tops reported at their (left-biased) midpoint
    //   2. peaks closer than `min_distance` samples to a higher peak are removed
    //   3. peaks whose topographic prominence is below `min_prominence` are removed
    // Returned indices are sorted ascending. To find troughs, pass the negated series.
    std::vector<size_t> findPeaks(const std::vector<double>& values, int min_distance, double min_prominence);

    // Topographic prominence of each peak (no window limit)
    std::vector<double> peakProminences(const std::vector<double>& values, const std::vector<size_t>& peaks);

} // namespace patterns
