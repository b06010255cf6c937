#pragma once

// ============================================================================
// TransactionSynthesizer — bulk transaction and interaction volume
// ============================================================================
// Walks customer positions in order and expands each one into a handful of
// rows:
//
//   primary ─┬─ basket companion   (p = 0.3, same category, +0..7 days)
//            └─ ...
//   cross-category pass            (p = 0.4 per primary, +5..120 minutes)
//
// Only one customer's rows are pending at a time, so memory stays bounded
// whatever the scale tier. Both sources are restartable: reset() rewinds the
// RandomStream and the customer cursor, and the second pass reproduces the
// first row for row.
// ============================================================================

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include "../config/GeneratorConfig.hpp"
#include "../context/GenerationContext.hpp"
#include "../model/Entities.hpp"
#include "../random/RandomStream.hpp"
#include "../stream/ChunkSequence.hpp"

namespace RetailForge
{

    enum class RowOrigin : uint8_t
    {
        Primary,
        BasketCompanion,
        CrossCategory
    };

    // Where a synthesized row came from. 'primary' is the index, in the same
    // output vector, of the primary purchase the row follows; a primary
    // points at itself.
    struct RowLineage
    {
        RowOrigin origin;
        size_t primary;
    };

    class TransactionSynthesizer
    {
    public:
        static constexpr double kAffinityPreference = 0.6;
        static constexpr double kCompletedRate = 0.9;
        static constexpr double kBasketRate = 0.3;
        static constexpr double kCrossCategoryRate = 0.4;
        static constexpr int32_t kBasketMaxDays = 7;

        // Both references must outlive every source this object hands out.
        TransactionSynthesizer(const GeneratorConfig &config, const GenerationContext &context);

        // Bulk transactions over every non-pattern-managed customer, ids from
        // kBulkEventIdBase.
        [[nodiscard]]
        std::unique_ptr<RowSource<Transaction>> transaction_source() const;

        // customer_count * interactions_per_customer rows, ids from
        // kBulkEventIdBase.
        [[nodiscard]]
        std::unique_ptr<RowSource<Interaction>> interaction_source() const;

        // Appends every bulk row for the customer at 'position'. next_id is
        // advanced by the number of rows appended. When 'lineage' is given it
        // receives one entry per appended row.
        void synthesize_customer(size_t position, RandomStream &rng,
                                 uint64_t &next_id, std::vector<Transaction> &out,
                                 std::vector<RowLineage> *lineage = nullptr) const;

        // Number of primary transactions for one customer.
        uint32_t transaction_count(const CustomerProfile &profile, RandomStream &rng) const;

        // Product position for one purchase, honoring affinity and exclusions.
        uint32_t pick_product(const CustomerProfile &profile, RandomStream &rng) const;

        Interaction draw_interaction(uint64_t id, RandomStream &rng) const;

    private:
        std::optional<uint32_t> basket_companion(const Product &product, uint32_t position,
                                                 RandomStream &rng) const;
        std::optional<uint32_t> cross_category(const Product &product, CategoryMask excluded,
                                               RandomStream &rng) const;

        const GeneratorConfig &config_;
        const GenerationContext &context_;
    };

} // namespace RetailForge
