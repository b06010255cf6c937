#pragma once

// ============================================================================
// Catalog — static domain tables
// ============================================================================
// Segment behaviour, category price ranges, the brand registry and the
// cross-sell map. Everything here is constexpr; the tunable parts of a run
// (weights, counts, seeds) live in GeneratorConfig instead.
// ============================================================================

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include "Entities.hpp"

namespace RetailForge
{

    using BrandId = uint8_t;
    inline constexpr BrandId kNoBrand = 0xFF;

    // Category exclusion sets are bit masks over Category values.
    using CategoryMask = uint8_t;

    constexpr CategoryMask category_bit(Category c)
    {
        return static_cast<CategoryMask>(1u << static_cast<unsigned>(c));
    }

    constexpr bool is_excluded(CategoryMask mask, Category c)
    {
        return (mask & category_bit(c)) != 0;
    }

    // ----------------------------------------------------------------------------
    // Brand registry. A brand may appear in more than one category (Nike,
    // Adidas), so affinity is tracked by brand, not by (category, brand).
    // ----------------------------------------------------------------------------
    inline constexpr std::array<std::string_view, 24> kBrandNames = {
        "Apple", "Samsung", "Sony", "Dell", "HP",
        "Nike", "Adidas", "Zara", "Gap", "Levi",
        "IKEA", "Wayfair", "Target", "HomeDepot",
        "Penguin", "Harper", "Simon", "Random",
        "Wilson", "Spalding",
        "Loreal", "Maybelline", "MAC", "Sephora"};

    constexpr std::optional<BrandId> find_brand(std::string_view name)
    {
        for (size_t i = 0; i < kBrandNames.size(); ++i)
        {
            if (kBrandNames[i] == name)
                return static_cast<BrandId>(i);
        }
        return std::nullopt;
    }

    inline std::string_view brand_name(BrandId id)
    {
        return kBrandNames[id];
    }

    // ============================================================================
    // SegmentProfile
    // ============================================================================
    //   ltv range         : uniform sampling range for lifetime value
    //   frequency         : Poisson mean of bulk transactions per customer
    //   amount_multiplier : applied on top of the product price
    //   high_value        : eligible for churn-risk and exclusion treatment
    // ============================================================================
    struct SegmentProfile
    {
        double min_ltv;
        double max_ltv;
        double frequency;
        double amount_multiplier;
        bool high_value;
    };

    inline constexpr std::array<SegmentProfile, kSegmentCount> kSegmentProfiles = {{
        {8000.0, 30000.0, 25.0, 3.0, true}, // VIP
        {5000.0, 12000.0, 15.0, 2.2, true}, // Premium
        {800.0, 3000.0, 8.0, 1.2, false},   // Regular
        {200.0, 1000.0, 4.0, 0.8, false},   // Basic
        {50.0, 400.0, 2.0, 0.6, false},     // New
    }};

    inline const SegmentProfile &profile_of(Segment s)
    {
        return kSegmentProfiles[static_cast<size_t>(s)];
    }

    // ============================================================================
    // CategoryProfile
    // ============================================================================
    struct CategoryProfile
    {
        double min_price;
        double max_price;
        std::array<BrandId, 5> brands;
        uint8_t brand_count;
        std::array<Category, 2> cross_sell; // affinity-linked categories
        uint8_t cross_sell_count;
    };

    inline constexpr std::array<CategoryProfile, kCategoryCount> kCategoryProfiles = {{
        // Electronics: Apple Samsung Sony Dell HP -> Home, Clothing
        {50.0, 2000.0, {0, 1, 2, 3, 4}, 5, {Category::Home, Category::Clothing}, 2},
        // Clothing: Nike Adidas Zara Gap Levi -> Beauty
        {20.0, 500.0, {5, 6, 7, 8, 9}, 5, {Category::Beauty, Category::Beauty}, 1},
        // Home: IKEA Wayfair Target HomeDepot -> Electronics
        {25.0, 800.0, {10, 11, 12, 13, 0}, 4, {Category::Electronics, Category::Electronics}, 1},
        // Books: Penguin Harper Simon Random -> (none)
        {10.0, 100.0, {14, 15, 16, 17, 0}, 4, {Category::Books, Category::Books}, 0},
        // Sports: Nike Adidas Wilson Spalding -> Clothing
        {30.0, 600.0, {5, 6, 18, 19, 0}, 4, {Category::Clothing, Category::Clothing}, 1},
        // Beauty: Loreal Maybelline MAC Sephora -> Clothing
        {15.0, 200.0, {20, 21, 22, 23, 0}, 4, {Category::Clothing, Category::Clothing}, 1},
    }};

    inline const CategoryProfile &profile_of(Category c)
    {
        return kCategoryProfiles[static_cast<size_t>(c)];
    }

    // Brand pools for bulk affinity assignment.
    inline constexpr std::array<BrandId, 4> kHighValueAffinityBrands = {0, 2, 5, 1}; // Apple Sony Nike Samsung
    inline constexpr std::array<BrandId, 4> kStandardAffinityBrands = {4, 3, 8, 6};  // HP Dell Gap Adidas

    // ============================================================================
    // SeedProductSpec — one (category, brand, count, price range) tuple
    // ============================================================================
    struct SeedProductSpec
    {
        Category category;
        std::string_view brand;
        uint32_t count;
        double min_price;
        double max_price;
    };

    inline constexpr std::array<SeedProductSpec, 10> kDefaultSeedProducts = {{
        {Category::Electronics, "Apple", 5, 500.0, 2000.0},
        {Category::Electronics, "Samsung", 5, 400.0, 1500.0},
        {Category::Electronics, "Sony", 5, 300.0, 1200.0},
        {Category::Clothing, "Nike", 5, 50.0, 300.0},
        {Category::Clothing, "Adidas", 5, 40.0, 250.0},
        {Category::Home, "IKEA", 5, 50.0, 500.0},
        {Category::Home, "Wayfair", 5, 60.0, 600.0},
        {Category::Books, "Penguin", 3, 15.0, 50.0},
        {Category::Sports, "Nike", 4, 30.0, 200.0},
        {Category::Beauty, "Loreal", 3, 20.0, 100.0},
    }};

    // Two-decimal rounding used for every monetary value.
    inline double round_cents(double value)
    {
        return static_cast<double>(static_cast<int64_t>(value * 100.0 + (value >= 0 ? 0.5 : -0.5))) / 100.0;
    }

} // namespace RetailForge
