#include <gtest/gtest.h>

#include <array>
#include <map>
#include <set>
#include <unordered_map>
#include "generator/PatternInjector.hpp"
#include "generator/TransactionSynthesizer.hpp"
#include "test_support.hpp"

using namespace RetailForge;

class TransactionSynthesizerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        context = test_support::make_context(config, &seeds);
        for (size_t i = 0; i < context->products().size(); ++i)
            product_pos[context->products()[i].product_id] = i;
    }

    const Product &product_of(const Transaction &t) const
    {
        return context->product_at(static_cast<uint32_t>(product_pos.at(t.product_id)));
    }

    // Every bulk row of every customer, with the lineage of each row. Lineage
    // indices are rebased onto 'rows'.
    void synthesize_all(std::vector<Transaction> &rows, std::vector<RowLineage> &lineage,
                        std::vector<size_t> &owner) const
    {
        TransactionSynthesizer synthesizer(config, *context);
        RandomStream rng(2024);
        uint64_t next_id = kBulkEventIdBase;
        for (size_t pos = 0; pos < context->customer_count(); ++pos)
        {
            const size_t base = rows.size();
            std::vector<RowLineage> local;
            synthesizer.synthesize_customer(pos, rng, next_id, rows, &local);
            ASSERT_EQ(local.size(), rows.size() - base);
            for (auto l : local)
            {
                l.primary += base;
                lineage.push_back(l);
                owner.push_back(pos);
            }
        }
    }

    size_t customer_position(uint64_t id) const
    {
        if (id < kBulkEntityIdBase)
            return static_cast<size_t>(id - 1);
        return context->seed_customer_count() + static_cast<size_t>(id - kBulkEntityIdBase);
    }

    GeneratorConfig config = test_support::small_config();
    SeedCatalog seeds = SeedCatalog::build(config.seed_customers_per_segment, config.reference_time);
    std::unique_ptr<GenerationContext> context;
    std::unordered_map<uint64_t, size_t> product_pos;
};

TEST_F(TransactionSynthesizerTest, RowsReferenceExistingEntities)
{
    TransactionSynthesizer synthesizer(config, *context);
    auto source = synthesizer.transaction_source();
    const auto rows = test_support::drain(*source);
    ASSERT_FALSE(rows.empty());

    for (size_t i = 0; i < rows.size(); ++i)
    {
        const auto &t = rows[i];
        EXPECT_EQ(t.transaction_id, kBulkEventIdBase + i);
        EXPECT_LT(customer_position(t.customer_id), context->customer_count());
        EXPECT_EQ(product_pos.count(t.product_id), 1u);
        EXPECT_GT(t.amount, 0.0);
        EXPECT_GE(t.quantity, 1u);
        EXPECT_LE(t.quantity, 3u);
    }
}

TEST_F(TransactionSynthesizerTest, ExclusionsAreRespected)
{
    TransactionSynthesizer synthesizer(config, *context);
    auto source = synthesizer.transaction_source();
    const auto rows = test_support::drain(*source);

    size_t checked = 0;
    for (const auto &t : rows)
    {
        const auto &profile = context->profile_at(customer_position(t.customer_id));
        if (profile.exclusions == 0)
            continue;
        const auto &product = context->product_at(static_cast<uint32_t>(product_pos.at(t.product_id)));
        EXPECT_FALSE(is_excluded(profile.exclusions, product.category))
            << "customer " << t.customer_id << " bought " << product.name;
        ++checked;
    }
    EXPECT_GT(checked, 0u);
}

TEST_F(TransactionSynthesizerTest, PatternManagedCustomersAreSkipped)
{
    TransactionSynthesizer synthesizer(config, *context);
    auto source = synthesizer.transaction_source();
    const auto rows = test_support::drain(*source);

    std::set<uint64_t> buyers;
    for (const auto &t : rows)
        buyers.insert(t.customer_id);

    for (size_t pos = 0; pos < context->seed_customer_count(); ++pos)
    {
        if (context->profile_at(pos).pattern_managed)
            EXPECT_EQ(buyers.count(context->customer_id_at(pos)), 0u) << "position " << pos;
    }
}

TEST_F(TransactionSynthesizerTest, SynthesizeCustomerAdvancesIds)
{
    TransactionSynthesizer synthesizer(config, *context);
    RandomStream rng(7);
    uint64_t next_id = 100;
    std::vector<Transaction> out;

    // VIP slot 0 has a Poisson mean of 25 primaries.
    synthesizer.synthesize_customer(0, rng, next_id, out);
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(next_id, 100 + out.size());
    for (size_t i = 0; i < out.size(); ++i)
    {
        EXPECT_EQ(out[i].transaction_id, 100 + i);
        EXPECT_EQ(out[i].customer_id, 1u);
    }

    const size_t before = out.size();
    synthesizer.synthesize_customer(SeedCatalog::kChurnRiskFirstSlot, rng, next_id, out);
    EXPECT_EQ(out.size(), before);
}

TEST_F(TransactionSynthesizerTest, PickProductHonoursAffinity)
{
    TransactionSynthesizer synthesizer(config, *context);
    RandomStream rng(11);

    CustomerProfile apple_fan;
    apple_fan.segment = Segment::Vip;
    apple_fan.brand_affinity = *find_brand("Apple");

    size_t apple = 0;
    constexpr size_t kDraws = 5'000;
    for (size_t i = 0; i < kDraws; ++i)
    {
        if (context->product_at(synthesizer.pick_product(apple_fan, rng)).brand == "Apple")
            ++apple;
    }
    // At least the 60% preference share.
    EXPECT_GT(static_cast<double>(apple) / kDraws, 0.55);
}

TEST_F(TransactionSynthesizerTest, PickProductFallsBackWhenEverythingExcluded)
{
    TransactionSynthesizer synthesizer(config, *context);
    RandomStream rng(3);

    CustomerProfile nothing_left;
    nothing_left.exclusions = 0x3F;
    for (int i = 0; i < 100; ++i)
        EXPECT_LT(synthesizer.pick_product(nothing_left, rng), context->products().size());
}

TEST_F(TransactionSynthesizerTest, LowEngagementDrawsOneOrTwo)
{
    config.low_engagement_fraction = 1.0;
    TransactionSynthesizer synthesizer(config, *context);
    RandomStream rng(5);

    CustomerProfile vip;
    vip.segment = Segment::Vip;
    for (int i = 0; i < 200; ++i)
    {
        const auto n = synthesizer.transaction_count(vip, rng);
        EXPECT_GE(n, 1u);
        EXPECT_LE(n, 2u);
    }
}

TEST_F(TransactionSynthesizerTest, ResetReplaysIdenticalRows)
{
    TransactionSynthesizer synthesizer(config, *context);
    auto source = synthesizer.transaction_source();

    const auto first = test_support::drain(*source, 500);
    source->reset();
    const auto second = test_support::drain(*source, 7'919);
    EXPECT_EQ(first, second);

    auto fresh = TransactionSynthesizer(config, *context).transaction_source();
    EXPECT_EQ(test_support::drain(*fresh, 1), first);
}

TEST_F(TransactionSynthesizerTest, InteractionVolumeAndRanges)
{
    TransactionSynthesizer synthesizer(config, *context);
    auto source = synthesizer.interaction_source();
    const auto rows = test_support::drain(*source);

    ASSERT_EQ(rows.size(), context->customer_count() * config.interactions_per_customer);
    for (size_t i = 0; i < rows.size(); ++i)
    {
        const auto &it = rows[i];
        EXPECT_EQ(it.interaction_id, kBulkEventIdBase + i);
        EXPECT_LT(customer_position(it.customer_id), context->customer_count());
        EXPECT_EQ(product_pos.count(it.product_id), 1u);
        EXPECT_GE(it.duration_seconds, 10u);
        EXPECT_LE(it.duration_seconds, 300u);
        EXPECT_LE(it.timestamp, config.reference_time);
        EXPECT_GT(it.timestamp, config.reference_time - 180 * kSecondsPerDay);
    }

    source->reset();
    EXPECT_EQ(test_support::drain(*source, 64), rows);
}

TEST_F(TransactionSynthesizerTest, BulkOnlyContext)
{
    config.include_seed_patterns = false;
    const auto bulk_only = test_support::make_context(config, nullptr);
    ASSERT_EQ(bulk_only->customer_count(), config.customer_count);

    TransactionSynthesizer synthesizer(config, *bulk_only);
    auto source = synthesizer.transaction_source();
    for (const auto &t : test_support::drain(*source))
        EXPECT_GE(t.customer_id, kBulkEntityIdBase);
}

TEST_F(TransactionSynthesizerTest, PrimaryPurchasesFollowRecencyAmountAndStatusRules)
{
    std::vector<Transaction> rows;
    std::vector<RowLineage> lineage;
    std::vector<size_t> owner;
    synthesize_all(rows, lineage, owner);

    std::array<size_t, 3> buckets{};
    size_t primaries = 0;
    size_t completed = 0;
    for (size_t i = 0; i < rows.size(); ++i)
    {
        if (lineage[i].origin != RowOrigin::Primary)
            continue;
        const auto &t = rows[i];
        EXPECT_EQ(lineage[i].primary, i);
        ++primaries;

        const int64_t days = (config.reference_time - t.timestamp) / kSecondsPerDay;
        ASSERT_GE(days, 0);
        ASSERT_LT(days, 365);
        ++buckets[days < 90 ? 0 : days < 180 ? 1 : 2];

        const double base = product_of(t).price *
                            profile_of(context->profile_at(owner[i]).segment).amount_multiplier;
        EXPECT_GE(t.amount, base * 0.7 - 0.01) << "row " << i;
        EXPECT_LE(t.amount, base * 1.3 + 0.01) << "row " << i;

        if (t.status == TxnStatus::Completed)
            ++completed;
    }

    ASSERT_GT(primaries, 10'000u);
    const double n = static_cast<double>(primaries);
    EXPECT_NEAR(static_cast<double>(buckets[0]) / n, 0.60, 0.02);
    EXPECT_NEAR(static_cast<double>(buckets[1]) / n, 0.30, 0.02);
    EXPECT_NEAR(static_cast<double>(buckets[2]) / n, 0.10, 0.02);
    EXPECT_NEAR(static_cast<double>(completed) / n, TransactionSynthesizer::kCompletedRate, 0.02);
}

TEST_F(TransactionSynthesizerTest, BasketCompanionsStayInCategoryWithinAWeek)
{
    std::vector<Transaction> rows;
    std::vector<RowLineage> lineage;
    std::vector<size_t> owner;
    synthesize_all(rows, lineage, owner);

    size_t primaries = 0;
    size_t companions = 0;
    for (size_t i = 0; i < rows.size(); ++i)
    {
        if (lineage[i].origin == RowOrigin::Primary)
            ++primaries;
        if (lineage[i].origin != RowOrigin::BasketCompanion)
            continue;
        ++companions;

        const auto &primary = rows[lineage[i].primary];
        const auto &b = rows[i];
        const auto &bought = product_of(primary);
        const auto &added = product_of(b);

        ASSERT_EQ(lineage[lineage[i].primary].origin, RowOrigin::Primary);
        EXPECT_EQ(b.customer_id, primary.customer_id);
        EXPECT_NE(b.product_id, primary.product_id);
        EXPECT_EQ(added.category, bought.category);
        if (context->index().in(bought.category, *find_brand(bought.brand)).size() > 1)
            EXPECT_EQ(added.brand, bought.brand) << "row " << i;

        const int64_t delta = b.timestamp - primary.timestamp;
        EXPECT_GE(delta, 0);
        EXPECT_LE(delta, TransactionSynthesizer::kBasketMaxDays * kSecondsPerDay);
        EXPECT_EQ(b.channel, primary.channel);
        EXPECT_EQ(b.quantity, 1u);
        EXPECT_EQ(b.status, TxnStatus::Completed);
        EXPECT_DOUBLE_EQ(b.amount, round_cents(added.price *
                                               profile_of(context->profile_at(owner[i]).segment).amount_multiplier));
    }

    ASSERT_GT(primaries, 0u);
    EXPECT_NEAR(static_cast<double>(companions) / static_cast<double>(primaries),
                TransactionSynthesizer::kBasketRate, 0.02);
}

TEST_F(TransactionSynthesizerTest, CrossCategoryFollowUpsUseLinkedCategories)
{
    std::vector<Transaction> rows;
    std::vector<RowLineage> lineage;
    std::vector<size_t> owner;
    synthesize_all(rows, lineage, owner);

    size_t follow_ups = 0;
    for (size_t i = 0; i < rows.size(); ++i)
    {
        if (lineage[i].origin != RowOrigin::CrossCategory)
            continue;
        ++follow_ups;

        const auto &primary = rows[lineage[i].primary];
        const auto &x = rows[i];
        ASSERT_EQ(lineage[lineage[i].primary].origin, RowOrigin::Primary);

        const auto &from = profile_of(product_of(primary).category);
        const Category to = product_of(x).category;
        bool linked = false;
        for (uint8_t k = 0; k < from.cross_sell_count; ++k)
            linked = linked || from.cross_sell[k] == to;
        EXPECT_TRUE(linked) << product_of(primary).name << " -> " << product_of(x).name;
        EXPECT_FALSE(is_excluded(context->profile_at(owner[i]).exclusions, to));

        const int64_t delta = x.timestamp - primary.timestamp;
        EXPECT_GE(delta, 5 * 60);
        EXPECT_LE(delta, 120 * 60);
        EXPECT_EQ(x.channel, primary.channel);
        EXPECT_EQ(x.customer_id, primary.customer_id);
        EXPECT_EQ(x.quantity, 1u);
    }
    EXPECT_GT(follow_ups, 1'000u);
}

TEST_F(TransactionSynthesizerTest, SkippedChurnPatternLeavesVipSlotsWithHistory)
{
    constexpr std::array<SeedProductSpec, 2> specs = {{
        {Category::Beauty, "MAC", 2, 20.0, 40.0},
        {Category::Books, "Harper", 2, 10.0, 30.0},
    }};
    const auto sparse = SeedCatalog::build(config.seed_customers_per_segment, config.reference_time, specs);
    const auto sparse_context = test_support::make_context(config, &sparse);

    PatternInjector injector(config, sparse);
    const auto patterns = injector.inject(*sparse_context);
    ASSERT_TRUE(patterns.outcome("churn_risk")->skipped);

    TransactionSynthesizer synthesizer(config, *sparse_context);
    auto source = synthesizer.transaction_source();
    std::map<uint64_t, size_t> per_customer;
    for (const auto &t : patterns.transactions)
        ++per_customer[t.customer_id];
    for (const auto &t : test_support::drain(*source))
        ++per_customer[t.customer_id];

    const auto vip = sparse.segment(Segment::Vip);
    for (uint32_t slot = SeedCatalog::kChurnRiskFirstSlot; slot <= SeedCatalog::kChurnRiskLastSlot; ++slot)
        EXPECT_GT(per_customer[vip[slot].customer_id], 0u) << "VIP slot " << slot;
}
