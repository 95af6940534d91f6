#include "backing.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

std::string BackingLine::tag_string() const {
    switch (tag) {
        case BackingTag::SOUND: return "SOUND";
        case BackingTag::IFFY: return "IFFY";
        case BackingTag::UNPRICED: return "UNPRICED";
        case BackingTag::DEFAULTED: return "DEFAULTED";
        case BackingTag::UNKNOWN_ASSET: return "UNKNOWN_ASSET";
        default: return "UNKNOWN";
    }
}

BackingLine BackingAggregator::value_position(const AssetRegistry& registry,
                                              const Position& position) const {
    BackingLine line;
    line.erc20 = position.erc20;
    line.balance = position.balance;

    if (position.balance < 0) {
        spdlog::warn("Ignoring negative balance for {}", position.erc20);
        line.tag = BackingTag::UNPRICED;
        return line;
    }

    auto collateral = registry.get(position.erc20);
    if (!collateral) {
        line.tag = BackingTag::UNKNOWN_ASSET;
        return line;
    }

    try {
        CollateralStatus status = collateral->status();
        if (status == CollateralStatus::DEFAULT) {
            line.tag = BackingTag::DEFAULTED;
            return line;
        }

        auto price = collateral->price();
        if (!price || price->low == 0) {
            line.tag = BackingTag::UNPRICED;
            return line;
        }

        line.low_value = fixmath::mul(position.balance, price->low, fixmath::Rounding::Floor);
        line.high_value = fixmath::mul(position.balance, price->high, fixmath::Rounding::Ceil);
        line.tag = status == CollateralStatus::IFFY ? BackingTag::IFFY : BackingTag::SOUND;

    } catch (const std::exception& e) {
        spdlog::warn("Could not value {}: {}", position.erc20, e.what());
        line.low_value.reset();
        line.high_value.reset();
        line.tag = BackingTag::UNPRICED;
    }
    return line;
}

BackingSummary BackingAggregator::value_backing(const AssetRegistry& registry,
                                                const std::vector<Position>& positions,
                                                Fix liabilities) const {
    BackingSummary summary;

    for (const auto& position : positions) {
        BackingLine line = value_position(registry, position);

        if (line.counted()) {
            if (*line.low_value > fixmath::FIX_MAX - summary.total_low ||
                *line.high_value > fixmath::FIX_MAX - summary.total_high) {
                spdlog::warn("Dropping {} from backing: total overflow", line.erc20);
                line.tag = BackingTag::UNPRICED;
            } else {
                summary.total_low += *line.low_value;
                summary.total_high += *line.high_value;
            }
        }

        if (line.counted()) {
            summary.included_count++;
            if (line.tag == BackingTag::IFFY) summary.iffy_count++;
        } else {
            summary.excluded_count++;
        }
        summary.lines.push_back(line);
    }

    if (summary.total_low > 0) {
        for (auto& line : summary.lines) {
            if (line.counted()) {
                line.share = fixmath::div(*line.low_value, summary.total_low);
            }
        }
    }

    if (liabilities > 0) {
        summary.collateralization = fixmath::div(summary.total_low, liabilities);
    }

    // Largest backing first, zero-weighted lines last
    std::stable_sort(summary.lines.begin(), summary.lines.end(),
              [](const BackingLine& a, const BackingLine& b) {
                  if (!a.low_value.has_value()) return false;
                  if (!b.low_value.has_value()) return true;
                  return *a.low_value > *b.low_value;
              });

    if (summary.excluded_count > 0) {
        summary.notes = "Excludes " + std::to_string(summary.excluded_count) + " unpriced or defaulted assets.";
    }
    if (summary.iffy_count > 0) {
        if (!summary.notes.empty()) summary.notes += " ";
        summary.notes += std::to_string(summary.iffy_count) + " IFFY assets included.";
    }

    return summary;
}
