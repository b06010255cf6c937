#pragma once

// ============================================================================
// PatternInjector — guaranteed relationship structures
// ============================================================================
// Each pattern is a fixed set of purchase edges between seed customers and
// seed products. Whether a pattern exists is never random; the patterns
// stream only supplies amount jitter, quantity, channel and the offset inside
// a fixed time window.
//
//   pattern               customers            products            support
//   ───────────────────   ──────────────────   ─────────────────   ──────────────
//   brand_loyalty         VIP 0-4              Apple 0-2           3 per customer
//   collaborative_chain   VIP 0-3              Samsung 0-2         6 edges
//   category_gap          excluded VIP/Prem.   1 per open category 5 categories
//   basket_window         Regular 0-4          Adidas 0-2          span <= 7 days
//   churn_risk            VIP 5-7              Apple/Samsung       1-2 total
//   diversity             Premium 5-7          5 categories        >= 4 categories
//   product_affinity      Premium 0-4          Sony 0-2            2-3 each
//   category_expansion    VIP 0-2              Nike, IKEA          2 each
//   cross_segment_chains  VIP/Prem./Regular    seed products       6 edges each
//   segment_coverage      Basic/New 0-4        Wayfair, Adidas     2 each
//   bulk_chains           bulk, same segment   Electronics         6 edges each
//
// A pattern whose anchors are missing is skipped and reported, never fatal.
// ============================================================================

#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "../config/GeneratorConfig.hpp"
#include "../context/GenerationContext.hpp"
#include "../model/Entities.hpp"
#include "../random/RandomStream.hpp"
#include "SeedCatalog.hpp"

namespace RetailForge
{

    struct PatternOutcome
    {
        std::string name;
        size_t transactions = 0;
        bool skipped = false;
        std::string reason;
    };

    struct PatternResult
    {
        std::vector<Transaction> transactions;
        std::vector<Interaction> interactions;
        std::vector<PatternOutcome> outcomes;

        const PatternOutcome *outcome(const std::string &name) const;
    };

    class PatternInjector
    {
    public:
        static constexpr uint32_t kLoyaltyCustomers = 5;
        static constexpr uint32_t kLoyaltyProducts = 3;
        static constexpr uint32_t kChainCustomers = 4;
        static constexpr uint32_t kChainProducts = 3;
        static constexpr int32_t kBasketWindowDays = 7;
        static constexpr uint32_t kBasketSpacingDays = 2;
        static constexpr uint32_t kMinDiversityCategories = 4;
        static constexpr uint32_t kCrossSegmentChains = 5;

        PatternInjector(const GeneratorConfig &config, const SeedCatalog &seeds);

        // Runs every seed pattern, the seed interactions and the bulk chains.
        [[nodiscard]]
        PatternResult inject(const GenerationContext &context);

        // Individual patterns. Each appends to 'out' and returns its outcome.
        PatternOutcome brand_loyalty(PatternResult &out);
        PatternOutcome collaborative_chain(PatternResult &out);
        PatternOutcome category_gap(PatternResult &out);
        PatternOutcome basket_window(PatternResult &out);
        PatternOutcome churn_risk(PatternResult &out);
        PatternOutcome diversity(PatternResult &out);
        PatternOutcome product_affinity(PatternResult &out);
        PatternOutcome category_expansion(PatternResult &out);
        PatternOutcome cross_segment_chains(PatternResult &out);
        PatternOutcome segment_coverage(PatternResult &out);
        PatternOutcome bulk_chains(const GenerationContext &context, PatternResult &out);
        void seed_interactions(PatternResult &out);

        // Emits the overlapping chain C0-P0-C1-P1-C2-...: customer i buys
        // products i-1 and i. Requires customers.size() == products.size() + 1
        // and at least three products; returns false otherwise.
        bool emit_chain(std::span<const uint64_t> customers,
                        std::span<const Product *const> products,
                        int64_t base_timestamp,
                        std::vector<Transaction> &out);

    private:
        Transaction make_transaction(uint64_t customer_id, const Product &product, int64_t timestamp);
        int64_t days_ago(int32_t lo, int32_t hi);
        PatternOutcome skip(const std::string &name, const std::string &reason);
        PatternOutcome done(const std::string &name, size_t before, const PatternResult &out);

        const GeneratorConfig &config_;
        const SeedCatalog &seeds_;
        RandomStream rng_;
        uint64_t next_transaction_id_ = 1;
        uint64_t next_interaction_id_ = 1;
    };

} // namespace RetailForge
