#include "views.hpp"
#include "util.hpp"

namespace {

nlohmann::json optional_fix(const std::optional<Fix>& value) {
    return value ? nlohmann::json(fixmath::to_string(*value)) : nlohmann::json(nullptr);
}

nlohmann::json optional_ts(const std::optional<int64_t>& ts) {
    return ts ? nlohmann::json(util::to_iso8601(*ts)) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json price_result_json(const PriceResult& result) {
    return std::visit(overloaded{
        [](const PriceEstimate& est) {
            return nlohmann::json{
                {"ok", true},
                {"low", fixmath::to_string(est.low)},
                {"mid", fixmath::to_string(est.mid)},
                {"high", fixmath::to_string(est.high)},
                {"peg_price", fixmath::to_string(est.peg_price)}
            };
        },
        [](const Unpriceable& u) {
            return nlohmann::json{
                {"ok", false},
                {"reason", reason_name(u.reason)},
                {"staleness_s", u.staleness_s},
                {"detail", u.detail}
            };
        }
    }, result);
}

nlohmann::json asset_json(const Collateral& collateral) {
    nlohmann::json j = {
        {"erc20", collateral.erc20()},
        {"target", collateral.target_name()},
        {"mode", collateral.pricing_mode()},
        {"status", status_name(collateral.status())},
        {"iffy_since", optional_ts(collateral.iffy_since())},
        {"default_deadline", optional_ts(collateral.default_deadline())},
        {"ref_per_tok", fixmath::to_string(collateral.ref_per_tok())},
        {"peak_rate", fixmath::to_string(collateral.peak_rate())},
        {"target_per_ref", fixmath::to_string(collateral.target_per_ref())},
        {"revenue_hiding", fixmath::to_string(collateral.revenue_hiding())},
        {"max_trade_volume", fixmath::to_string(collateral.max_trade_volume())},
        {"price", price_result_json(collateral.try_price())}
    };

    auto lot = collateral.lot_price();
    j["lot_price"] = lot
        ? nlohmann::json{{"low", fixmath::to_string(lot->low)}, {"high", fixmath::to_string(lot->high)}}
        : nlohmann::json(nullptr);
    return j;
}

nlohmann::json backing_json(const BackingSummary& summary) {
    nlohmann::json lines = nlohmann::json::array();
    for (const auto& line : summary.lines) {
        lines.push_back({
            {"erc20", line.erc20},
            {"balance", fixmath::to_string(line.balance)},
            {"low_value", optional_fix(line.low_value)},
            {"high_value", optional_fix(line.high_value)},
            {"share", fixmath::to_string(line.share)},
            {"tag", line.tag_string()}
        });
    }

    return {
        {"total_low", fixmath::to_string(summary.total_low)},
        {"total_high", fixmath::to_string(summary.total_high)},
        {"included_count", summary.included_count},
        {"iffy_count", summary.iffy_count},
        {"excluded_count", summary.excluded_count},
        {"collateralization", optional_fix(summary.collateralization)},
        {"lines", lines},
        {"notes", summary.notes},
        {"ts", util::current_iso8601()}
    };
}
