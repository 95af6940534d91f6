#pragma once

#include "asset_registry.hpp"
#include "fixmath.hpp"
#include <optional>
#include <string>
#include <vector>

enum class BackingTag {
    SOUND,          // Priced, counted in full
    IFFY,           // Priced, counted, but flagged
    UNPRICED,       // No usable price, zero-weighted
    DEFAULTED,      // Defaulted, zero-weighted
    UNKNOWN_ASSET   // Not registered
};

struct Position {
    std::string erc20;
    Fix balance;  // tokens held
};

struct BackingLine {
    std::string erc20;
    Fix balance = 0;
    std::optional<Fix> low_value;
    std::optional<Fix> high_value;
    Fix share = 0;  // fraction of total low value
    BackingTag tag = BackingTag::UNPRICED;

    std::string tag_string() const;
    bool counted() const { return tag == BackingTag::SOUND || tag == BackingTag::IFFY; }
};

struct BackingSummary {
    Fix total_low = 0;
    Fix total_high = 0;
    int included_count = 0;
    int iffy_count = 0;
    int excluded_count = 0;
    std::optional<Fix> collateralization;
    std::vector<BackingLine> lines;
    std::string notes;
};

class BackingAggregator {
public:
    // liabilities in UoA; collateralization is left empty when it is zero
    BackingSummary value_backing(const AssetRegistry& registry,
                                 const std::vector<Position>& positions,
                                 Fix liabilities) const;

private:
    BackingLine value_position(const AssetRegistry& registry, const Position& position) const;
};
