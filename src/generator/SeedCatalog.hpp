#pragma once

// ============================================================================
// SeedCatalog — hand-placed anchor entities for pattern injection
// ============================================================================
// Seed customers are laid out segment-major, N per segment:
//
//   id 1..N      VIP      seed_vip_0 .. seed_vip_{N-1}
//   id N+1..2N   Premium
//   ...
//
// Seed products follow the (category, brand, count, price range) tuples in
// order, ids counting from 1. Nothing here is random: attribute values are
// evenly spaced across their ranges, and brand affinity / exclusions follow
// fixed slot rules, so every pattern anchor is known before a run starts.
// ============================================================================

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
#include "../context/GenerationContext.hpp"
#include "../model/Catalog.hpp"
#include "../model/Entities.hpp"

namespace RetailForge
{

    class SeedCatalog
    {
    public:
        // Slots inside the VIP segment whose history is limited to the
        // churn-risk pattern.
        static constexpr uint32_t kChurnRiskFirstSlot = 5;
        static constexpr uint32_t kChurnRiskLastSlot = 7;

        static constexpr size_t kMinChurnProducts = 2;

        // Slots inside VIP/Premium that exclude Electronics.
        static constexpr uint32_t kExclusionFirstSlot = 8;

        // Slots inside VIP/Premium with Apple affinity; higher slots get Samsung.
        static constexpr uint32_t kAppleAffinitySlots = 5;

        [[nodiscard]]
        static SeedCatalog build(uint32_t customers_per_segment,
                                 int64_t reference_time,
                                 std::span<const SeedProductSpec> product_specs = kDefaultSeedProducts);

        const std::vector<Customer> &customers() const { return customers_; }
        const std::vector<CustomerProfile> &profiles() const { return profiles_; }
        const std::vector<Product> &products() const { return products_; }

        uint32_t customers_per_segment() const { return per_segment_; }

        // Seed customers of one segment, in slot order.
        std::span<const Customer> segment(Segment s) const;

        // Seed products built from the (category, brand) tuple; empty when the
        // catalog has no such tuple.
        std::span<const Product> products_of(Category category, std::string_view brand) const;

        // Apple then Samsung Electronics seed products.
        std::vector<const Product *> churn_products() const;

        // True when the churn-risk slots exist and churn_products() has at
        // least kMinChurnProducts entries. Only then are those slots
        // pattern-managed.
        bool has_churn_anchors() const;

        // All seed products of one category regardless of brand.
        std::vector<const Product *> products_in(Category category) const;

    private:
        struct ProductGroup
        {
            Category category;
            std::string_view brand;
            size_t begin;
            size_t count;
        };

        std::vector<Customer> customers_;
        std::vector<CustomerProfile> profiles_;
        std::vector<Product> products_;
        std::vector<ProductGroup> groups_;
        uint32_t per_segment_ = 0;
    };

} // namespace RetailForge
