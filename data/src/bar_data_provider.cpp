#include "bar_data_provider.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

namespace data {

    std::map<std::string, core::BarSeries> loadUniverse(IBarDataProvider& provider,
                                                        const std::vector<std::string>& codes,
                                                        std::optional<core::Timestamp> from,
                                                        std::optional<core::Timestamp> to)
    {
        auto logger = core::logging::getLogger();
        std::map<std::string, core::BarSeries> universe;

        for (const auto& code : codes) {
            core::BarSeries bars = provider.loadBars(code, from, to);
            if (bars.empty()) {
                logger->warn("No bars found for {}, skipping.", code);
                continue;
            }
            logger->info("Loaded {} bars for {}.", bars.size(), code);
            universe.emplace(code, std::move(bars));
        }

        if (universe.empty()) {
            throw core::DataLoadException("No bar data found for any requested code.");
        }
        return universe;
    }

} // namespace data
