#pragma once

#include "backing.hpp"
#include "collateral.hpp"
#include <nlohmann/json.hpp>

// JSON bodies served by the HTTP read endpoints. Fix values are rendered as
// decimal strings.
nlohmann::json price_result_json(const PriceResult& result);
nlohmann::json asset_json(const Collateral& collateral);
nlohmann::json backing_json(const BackingSummary& summary);
