#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"

namespace data {

    // Source of historical bars. Implementations are injected into whatever
    // assembles a backtest; nothing in the engine reaches for a global source.
    class IBarDataProvider {
    public:
        virtual ~IBarDataProvider() = default;

        // Bars for `code` within [from, to] (either bound optional), ascending.
        // Empty code or from > to throws core::DataLoadException.
        virtual core::BarSeries loadBars(const std::string& code,
                                         std::optional<core::Timestamp> from,
                                         std::optional<core::Timestamp> to) = 0;
    };

    // Loads every code through `provider`. Codes without bars are skipped with
    // a warning; an entirely empty universe throws core::DataLoadException.
    std::map<std::string, core::BarSeries> loadUniverse(IBarDataProvider& provider,
                                                        const std::vector<std::string>& codes,
                                                        std::optional<core::Timestamp> from,
                                                        std::optional<core::Timestamp> to);

} // namespace data
