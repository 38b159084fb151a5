/// @file src/signal/series_converter.cpp
/// @brief Finance and strain conversion through min-max normalization.

#include "dwalk/signal.hpp"
#include "dwalk/digit_codec.hpp"

namespace dwalk::signal {

std::vector<double> SeriesConverter::relative_deltas(std::span<const double> prices) {
    std::vector<double> deltas;
    if (prices.size() < 2) {
        return deltas;
    }
    deltas.reserve(prices.size() - 1);
    for (std::size_t i = 0; i + 1 < prices.size(); ++i) {
        deltas.push_back((prices[i + 1] - prices[i]) / prices[i]);
    }
    return deltas;
}

DigitSequence SeriesConverter::finance(std::span<const double> prices, Radix radix) {
    if (prices.size() < 2) {
        return DigitSequence{0};
    }
    return codec::DigitCodec::normalize(relative_deltas(prices), radix);
}

DigitSequence SeriesConverter::cosmos(std::span<const double> strain, Radix radix) {
    return codec::DigitCodec::normalize(strain, radix);
}

} // namespace dwalk::signal
