// include/trend_lab/momentum/momentum_ranker.hpp

#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "trend_lab/core/config_base.hpp"
#include "trend_lab/core/error.hpp"
#include "trend_lab/core/types.hpp"

namespace trend_lab {
namespace momentum {

/**
 * @brief Parameters of the trailing-return ranking
 */
struct MomentumConfig : public ConfigBase {
    int staleness_tolerance_days{15};  // Max calendar days between end_ref and the end price
    int lookback_months{12};
    int moving_average_window{200};  // Points in the SMA reported next to the end price

    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief One ranked instrument
 */
struct MomentumEntry {
    int rank{0};  // 1 = strongest trailing return
    std::string symbol;
    double trailing_return{0.0};
    Price end_price{0.0};
    Timestamp end_date;
    Price start_price{0.0};
    Timestamp start_date;
    double end_moving_average{0.0};  // NaN when fewer than moving_average_window points exist

    nlohmann::json to_json() const;
};

/**
 * @brief Ranks a universe by return over the last `lookback_months` complete months
 *
 * The reference window ends on the last day of the month before the as-of
 * date. Instruments without a recent enough end price, or without any price
 * at the start of the window, are left out of the ranking.
 */
class MomentumRanker {
public:
    explicit MomentumRanker(MomentumConfig config = MomentumConfig{});

    /**
     * @brief Rank every instrument of the universe
     * @return Entries sorted by trailing return descending, ties by symbol.
     *         INVALID_ARGUMENT if the configuration is invalid
     */
    Result<std::vector<MomentumEntry>> rank(const std::map<std::string, PriceSeries>& universe,
                                            const Timestamp& as_of) const;

    /**
     * @brief Measure one instrument between two reference dates
     * @return Unranked entry, or nullopt if the instrument is excluded (including
     * unordered dates or non-positive prices)
     */
    std::optional<MomentumEntry> evaluate(const PriceSeries& series, const Timestamp& end_ref,
                                          const Timestamp& start_ref) const;

    Timestamp end_reference(const Timestamp& as_of) const;
    Timestamp start_reference(const Timestamp& end_ref) const;

    const MomentumConfig& config() const {
        return config_;
    }

private:
    MomentumConfig config_;

    // Index of the latest point at or before `date`, nullopt if none
    static std::optional<size_t> latest_at_or_before(const PriceSeries& series,
                                                     const Timestamp& date);
    double trailing_average(const PriceSeries& series, size_t end_index) const;
};

}  // namespace momentum
}  // namespace trend_lab
