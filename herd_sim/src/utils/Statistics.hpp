#pragma once

#include <vector>
#include <cmath>
#include <numeric>
#include <algorithm>
#include <map>
#include <variant>

namespace herd {

// Several values share the highest frequency
struct NoUniqueMode {
    bool operator==(const NoUniqueMode&) const { return true; }
};

using ModeResult = std::variant<double, NoUniqueMode>;

class Statistics {
public:
    static double mean(const std::vector<double>& data) {
        if (data.empty()) return 0.0;
        return std::accumulate(data.begin(), data.end(), 0.0) / data.size();
    }

    // Average of the two middle values for even sizes
    static double median(std::vector<double> data) {
        if (data.empty()) return 0.0;
        std::sort(data.begin(), data.end());
        size_t mid = data.size() / 2;
        if (data.size() % 2 == 1) return data[mid];
        return (data[mid - 1] + data[mid]) / 2.0;
    }

    // Exact-value mode; a tie for the top frequency is NoUniqueMode
    static ModeResult mode(const std::vector<double>& data) {
        if (data.empty()) return NoUniqueMode{};

        std::map<double, int> counts;
        for (double x : data) {
            counts[x]++;
        }

        int best = 0;
        int holders = 0;
        double bestValue = 0.0;
        for (const auto& [value, n] : counts) {
            if (n > best) {
                best = n;
                holders = 1;
                bestValue = value;
            }
            else if (n == best) {
                holders++;
            }
        }

        if (holders > 1) return NoUniqueMode{};
        return bestValue;
    }

    static double roundTo(double value, int decimals) {
        double scale = std::pow(10.0, decimals);
        return std::round(value * scale) / scale;
    }

    static std::vector<double> roundAll(const std::vector<double>& data, int decimals) {
        std::vector<double> out;
        out.reserve(data.size());
        for (double x : data) {
            out.push_back(roundTo(x, decimals));
        }
        return out;
    }
};

} // namespace herd
