#pragma once

// ============================================================================
// EntityGenerator — bulk customers and products
// ============================================================================
// Two independent streams:
//
//   customers : RandomStream(master + offsets.customers)
//   products  : RandomStream(master + offsets.products)
//
// Customers are never held in memory as rows. The same per-customer routine
// drives both the profile pass (segment / affinity / exclusions only, four
// bytes per customer) and the row stream written to Parquet, so the two can
// never disagree.
// ============================================================================

#include <cstdint>
#include <memory>
#include <vector>
#include "../config/GeneratorConfig.hpp"
#include "../context/GenerationContext.hpp"
#include "../model/Entities.hpp"
#include "../random/RandomStream.hpp"
#include "../stream/ChunkSequence.hpp"

namespace RetailForge
{

    class EntityGenerator
    {
    public:
        // Throws ConfigError when the weight vectors are invalid.
        explicit EntityGenerator(const GeneratorConfig &config);

        // Bulk product catalog, ids from kBulkEntityIdBase.
        [[nodiscard]]
        std::vector<Product> generate_products() const;

        // Profile pass over all bulk customers.
        [[nodiscard]]
        std::vector<CustomerProfile> generate_customer_profiles() const;

        // Restartable stream of bulk customer rows.
        [[nodiscard]]
        std::unique_ptr<RowSource<Customer>> customer_source() const;

        // Builds the category -> brand -> product index over a product list.
        // Throws std::invalid_argument for a brand missing from the registry.
        [[nodiscard]]
        static ProductIndex build_product_index(const std::vector<Product> &products);

        // Draws one bulk customer. Consumes the same random values whether or
        // not 'row' is requested. Public so the row source and tests share it.
        void draw_customer(uint64_t ordinal, RandomStream &rng,
                           CustomerProfile &profile, Customer *row) const;

        uint64_t bulk_customer_count() const { return bulk_customers_; }

    private:
        const GeneratorConfig &config_;
        WeightedChoice<kSegmentCount> segment_choice_;
        WeightedChoice<kCategoryCount> category_choice_;
        uint64_t bulk_customers_;
    };

} // namespace RetailForge
