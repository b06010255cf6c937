#pragma once

// ============================================================================
// GenerationContext — read-only state shared by the later stages
// ============================================================================
// Built once after SeedCatalog and EntityGenerator have run, then passed by
// const reference to PatternInjector and TransactionSynthesizer. Nothing
// mutates it afterwards, so tables may be synthesized concurrently.
//
// Customer positions: [0, seed_count) are seed customers in catalog order,
// [seed_count, seed_count + bulk_count) are bulk customers in stream order.
// ============================================================================

#include <array>
#include <cstdint>
#include <span>
#include <vector>
#include "../model/Catalog.hpp"
#include "../model/Entities.hpp"

namespace RetailForge
{

    // Compact per-customer state. Four bytes per customer keeps the 10^8 tier
    // within a few hundred megabytes.
    struct CustomerProfile
    {
        Segment segment = Segment::New;
        BrandId brand_affinity = kNoBrand;
        CategoryMask exclusions = 0;
        // Seed customers whose whole transaction history is fixed by a pattern
        // (churn risk). Bulk synthesis leaves them alone.
        bool pattern_managed = false;
    };

    // ============================================================================
    // ProductIndex — two-level lookup category -> brand -> product positions
    // ============================================================================
    class ProductIndex
    {
    public:
        // Positions must arrive in ascending order; every bucket stays sorted.
        void add(uint32_t position, Category category, BrandId brand);

        const std::vector<uint32_t> &in_category(Category category) const
        {
            return by_category_[static_cast<size_t>(category)];
        }

        const std::vector<uint32_t> &in(Category category, BrandId brand) const
        {
            return by_brand_[static_cast<size_t>(category)][brand];
        }

        // Number of products in categories not covered by 'excluded'.
        size_t eligible_count(CategoryMask excluded) const;

        // Number of products of 'brand' in categories not covered by 'excluded'.
        size_t eligible_brand_count(BrandId brand, CategoryMask excluded) const;

        // The k-th eligible product in category order; k < eligible_count().
        uint32_t eligible_at(CategoryMask excluded, size_t k) const;

        // The k-th eligible product of 'brand'; k < eligible_brand_count().
        uint32_t eligible_brand_at(BrandId brand, CategoryMask excluded, size_t k) const;

        size_t size() const { return total_; }

    private:
        std::array<std::vector<uint32_t>, kCategoryCount> by_category_;
        std::array<std::array<std::vector<uint32_t>, kBrandNames.size()>, kCategoryCount> by_brand_;
        size_t total_ = 0;
        uint32_t last_position_ = 0;
    };

    class GenerationContext
    {
    public:
        GenerationContext(std::vector<Customer> seed_customers,
                          std::vector<CustomerProfile> profiles,
                          std::vector<Product> products,
                          ProductIndex index);

        size_t customer_count() const { return profiles_.size(); }
        size_t seed_customer_count() const { return seed_customers_.size(); }
        size_t bulk_customer_count() const { return profiles_.size() - seed_customers_.size(); }

        uint64_t customer_id_at(size_t position) const
        {
            if (position < seed_customers_.size())
                return seed_customers_[position].customer_id;
            return kBulkEntityIdBase + (position - seed_customers_.size());
        }

        const CustomerProfile &profile_at(size_t position) const { return profiles_[position]; }

        std::span<const Customer> seed_customers() const { return seed_customers_; }
        std::span<const CustomerProfile> profiles() const { return profiles_; }
        std::span<const Product> products() const { return products_; }
        const Product &product_at(uint32_t position) const { return products_[position]; }
        const ProductIndex &index() const { return index_; }

    private:
        std::vector<Customer> seed_customers_;
        std::vector<CustomerProfile> profiles_;
        std::vector<Product> products_;
        ProductIndex index_;
    };

} // namespace RetailForge
