#pragma once

namespace herd {

    // Chance that an inactive agent buys back in, keyed on the market index.
    // A depressed index reads as a discount and makes re-entry more likely.
    struct ReentryPolicy {
        double baseChance = 0.25;
        double deepDiscountIndex = 0.8;
        double deepDiscountChance = 0.5;
        double discountIndex = 1.0;
        double discountChance = 0.35;

        double chance(double marketIndex) const {
            if (marketIndex < deepDiscountIndex) return deepDiscountChance;
            if (marketIndex < discountIndex) return discountChance;
            return baseChance;
        }
    };

} // namespace herd
