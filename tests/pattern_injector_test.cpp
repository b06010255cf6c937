#include <gtest/gtest.h>

#include <array>
#include <map>
#include <set>
#include "generator/PatternInjector.hpp"
#include "test_support.hpp"

using namespace RetailForge;

class PatternInjectorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        context = test_support::make_context(config, &seeds);
    }

    const Product &seed_product(uint64_t id) const
    {
        return seeds.products().at(id - 1);
    }

    static std::map<uint64_t, std::vector<const Transaction *>> by_customer(const std::vector<Transaction> &rows)
    {
        std::map<uint64_t, std::vector<const Transaction *>> out;
        for (const auto &t : rows)
            out[t.customer_id].push_back(&t);
        return out;
    }

    GeneratorConfig config = test_support::small_config();
    SeedCatalog seeds = SeedCatalog::build(config.seed_customers_per_segment, config.reference_time);
    std::unique_ptr<GenerationContext> context;
};

TEST_F(PatternInjectorTest, CollaborativeChainOverlapsConsecutiveCustomers)
{
    PatternInjector injector(config, seeds);
    PatternResult result;
    const auto outcome = injector.collaborative_chain(result);

    EXPECT_FALSE(outcome.skipped);
    ASSERT_EQ(outcome.transactions, 6u);
    ASSERT_EQ(result.transactions.size(), 6u);

    const auto vip = seeds.segment(Segment::Vip);
    const auto samsung = seeds.products_of(Category::Electronics, "Samsung");
    for (size_t j = 0; j < 3; ++j)
    {
        std::set<uint64_t> buyers;
        for (const auto &t : result.transactions)
        {
            if (t.product_id == samsung[j].product_id)
                buyers.insert(t.customer_id);
        }
        const std::set<uint64_t> expected = {vip[j].customer_id, vip[j + 1].customer_id};
        EXPECT_EQ(buyers, expected) << "product " << j;
    }
}

TEST_F(PatternInjectorTest, EmitChainRejectsShortOrMismatchedInput)
{
    PatternInjector injector(config, seeds);
    const auto apple = seeds.products_of(Category::Electronics, "Apple");
    const std::array<const Product *, 2> two = {&apple[0], &apple[1]};
    const std::array<uint64_t, 3> three_customers = {1, 2, 3};

    std::vector<Transaction> out;
    EXPECT_FALSE(injector.emit_chain(three_customers, two, config.reference_time, out));

    const std::array<const Product *, 3> products = {&apple[0], &apple[1], &apple[2]};
    EXPECT_FALSE(injector.emit_chain(three_customers, products, config.reference_time, out));
    EXPECT_TRUE(out.empty());

    const std::array<uint64_t, 4> four_customers = {1, 2, 3, 4};
    EXPECT_TRUE(injector.emit_chain(four_customers, products, config.reference_time, out));
    EXPECT_EQ(out.size(), 6u);
}

TEST_F(PatternInjectorTest, BrandLoyaltyBuysThreeAppleProducts)
{
    PatternInjector injector(config, seeds);
    PatternResult result;
    EXPECT_EQ(injector.brand_loyalty(result).transactions, 15u);

    const auto grouped = by_customer(result.transactions);
    ASSERT_EQ(grouped.size(), 5u);
    for (const auto &[customer, rows] : grouped)
    {
        EXPECT_LE(customer, 5u);
        std::set<uint64_t> products;
        for (const auto *t : rows)
        {
            EXPECT_EQ(seed_product(t->product_id).brand, "Apple");
            products.insert(t->product_id);
        }
        EXPECT_GE(products.size(), 3u);
    }
}

TEST_F(PatternInjectorTest, BasketFitsInsideWindow)
{
    PatternInjector injector(config, seeds);
    PatternResult result;
    injector.basket_window(result);

    const auto grouped = by_customer(result.transactions);
    ASSERT_EQ(grouped.size(), 5u);
    for (const auto &[customer, rows] : grouped)
    {
        ASSERT_EQ(rows.size(), 3u);
        int64_t lo = rows.front()->timestamp;
        int64_t hi = lo;
        for (const auto *t : rows)
        {
            lo = std::min(lo, t->timestamp);
            hi = std::max(hi, t->timestamp);
            EXPECT_EQ(seed_product(t->product_id).brand, "Adidas");
        }
        EXPECT_LE(hi - lo, PatternInjector::kBasketWindowDays * kSecondsPerDay) << customer;
    }
}

TEST_F(PatternInjectorTest, CategoryGapAvoidsExcludedCategory)
{
    PatternInjector injector(config, seeds);
    PatternResult result;
    const auto outcome = injector.category_gap(result);
    ASSERT_FALSE(outcome.skipped);

    // VIP and Premium slots 8 and 9 exclude Electronics.
    const auto grouped = by_customer(result.transactions);
    ASSERT_EQ(grouped.size(), 4u);
    for (const auto &[customer, rows] : grouped)
    {
        EXPECT_TRUE(is_excluded(seeds.profiles()[customer - 1].exclusions, Category::Electronics));
        std::set<Category> categories;
        for (const auto *t : rows)
            categories.insert(seed_product(t->product_id).category);
        EXPECT_EQ(categories.size(), 5u);
        EXPECT_EQ(categories.count(Category::Electronics), 0u);
    }
}

TEST_F(PatternInjectorTest, CrossSegmentChainsAvoidElectronics)
{
    PatternInjector injector(config, seeds);
    PatternResult result;
    const auto outcome = injector.cross_segment_chains(result);
    ASSERT_FALSE(outcome.skipped);
    EXPECT_EQ(outcome.transactions, 5u * 6u);

    std::set<Segment> segments;
    for (const auto &t : result.transactions)
    {
        EXPECT_NE(seed_product(t.product_id).category, Category::Electronics);
        segments.insert(seeds.customers()[t.customer_id - 1].segment);
    }
    const std::set<Segment> expected = {Segment::Vip, Segment::Premium, Segment::Regular};
    EXPECT_EQ(segments, expected);
}

TEST_F(PatternInjectorTest, ChurnRiskCustomersStayNearlyInactive)
{
    PatternInjector injector(config, seeds);
    const auto result = injector.inject(*context);
    const auto grouped = by_customer(result.transactions);

    const auto vip = seeds.segment(Segment::Vip);
    for (uint32_t slot = SeedCatalog::kChurnRiskFirstSlot; slot <= SeedCatalog::kChurnRiskLastSlot; ++slot)
    {
        const auto it = grouped.find(vip[slot].customer_id);
        ASSERT_NE(it, grouped.end());
        EXPECT_GE(it->second.size(), 1u);
        EXPECT_LE(it->second.size(), 2u);
        for (const auto *t : it->second)
            EXPECT_LE(t->timestamp, config.reference_time - 90 * kSecondsPerDay);
    }
}

TEST_F(PatternInjectorTest, DiversityCustomersSpanFourCategories)
{
    PatternInjector injector(config, seeds);
    const auto result = injector.inject(*context);
    const auto grouped = by_customer(result.transactions);

    const auto premium = seeds.segment(Segment::Premium);
    for (uint32_t slot = 5; slot < 8; ++slot)
    {
        std::set<Category> categories;
        for (const auto *t : grouped.at(premium[slot].customer_id))
            categories.insert(seed_product(t->product_id).category);
        EXPECT_GE(categories.size(), PatternInjector::kMinDiversityCategories);
    }
}

TEST_F(PatternInjectorTest, BulkChainsStayInsideOneEligibleSegment)
{
    PatternInjector injector(config, seeds);
    PatternResult result;
    const auto outcome = injector.bulk_chains(*context, result);
    ASSERT_FALSE(outcome.skipped);
    ASSERT_EQ(result.transactions.size(), config.bulk_recommendation_chains * 6u);

    constexpr std::array<Segment, 3> kRotation = {Segment::Vip, Segment::Premium, Segment::Regular};
    const size_t first_bulk = context->seed_customer_count();

    for (size_t k = 0; k < config.bulk_recommendation_chains; ++k)
    {
        std::set<uint64_t> customers;
        std::set<uint64_t> products;
        for (size_t r = k * 6; r < k * 6 + 6; ++r)
        {
            const auto &t = result.transactions[r];
            ASSERT_GE(t.customer_id, kBulkEntityIdBase);
            const size_t pos = first_bulk + (t.customer_id - kBulkEntityIdBase);
            const auto &profile = context->profile_at(pos);

            EXPECT_EQ(profile.segment, kRotation[k % kRotation.size()]);
            EXPECT_FALSE(is_excluded(profile.exclusions, Category::Electronics));
            EXPECT_LE(t.timestamp, config.reference_time);
            EXPECT_EQ(t.quantity, 1u);
            customers.insert(t.customer_id);
            products.insert(t.product_id);
        }
        EXPECT_EQ(customers.size(), 4u);
        EXPECT_EQ(products.size(), 3u);
    }

    for (const auto &t : result.transactions)
    {
        bool electronics = false;
        for (uint32_t pos : context->index().in_category(Category::Electronics))
            electronics = electronics || context->product_at(pos).product_id == t.product_id;
        EXPECT_TRUE(electronics);
    }
}

TEST_F(PatternInjectorTest, SeedInteractionsPerCustomer)
{
    PatternInjector injector(config, seeds);
    const auto result = injector.inject(*context);

    std::map<uint64_t, size_t> counts;
    for (const auto &it : result.interactions)
    {
        ++counts[it.customer_id];
        EXPECT_LE(it.product_id, seeds.products().size());
        EXPECT_GE(it.duration_seconds, 10u);
        EXPECT_LE(it.timestamp, config.reference_time);
    }
    ASSERT_EQ(counts.size(), seeds.customers().size());
    for (const auto &[customer, n] : counts)
    {
        EXPECT_GE(n, 5u) << customer;
        EXPECT_LE(n, 10u) << customer;
    }
}

TEST_F(PatternInjectorTest, IdsAreSequentialAndRunIsDeterministic)
{
    const auto first = PatternInjector(config, seeds).inject(*context);
    const auto second = PatternInjector(config, seeds).inject(*context);

    EXPECT_EQ(first.transactions, second.transactions);
    EXPECT_EQ(first.interactions, second.interactions);

    for (size_t i = 0; i < first.transactions.size(); ++i)
        EXPECT_EQ(first.transactions[i].transaction_id, i + 1);
    for (const auto &o : first.outcomes)
        EXPECT_FALSE(o.skipped) << o.name << ": " << o.reason;
}

TEST_F(PatternInjectorTest, MissingAnchorsAreSkippedNotFatal)
{
    constexpr std::array<SeedProductSpec, 2> specs = {{
        {Category::Beauty, "MAC", 2, 20.0, 40.0},
        {Category::Books, "Harper", 2, 10.0, 30.0},
    }};
    const auto sparse = SeedCatalog::build(config.seed_customers_per_segment, config.reference_time, specs);
    const auto sparse_context = test_support::make_context(config, &sparse);

    PatternInjector injector(config, sparse);
    PatternResult result;
    ASSERT_NO_THROW(result = injector.inject(*sparse_context));

    ASSERT_NE(result.outcome("brand_loyalty"), nullptr);
    EXPECT_TRUE(result.outcome("brand_loyalty")->skipped);
    EXPECT_TRUE(result.outcome("collaborative_chain")->skipped);
    EXPECT_TRUE(result.outcome("churn_risk")->skipped);
    EXPECT_TRUE(result.outcome("basket_window")->skipped);
    EXPECT_FALSE(result.outcome("bulk_chains")->skipped);
    EXPECT_FALSE(result.interactions.empty());
}

TEST_F(PatternInjectorTest, SmallSeedSegmentsSkipChains)
{
    const auto small = SeedCatalog::build(3, config.reference_time);
    PatternInjector injector(config, small);

    PatternResult result;
    EXPECT_TRUE(injector.brand_loyalty(result).skipped);
    EXPECT_TRUE(injector.collaborative_chain(result).skipped);
    EXPECT_TRUE(injector.cross_segment_chains(result).skipped);
    EXPECT_TRUE(injector.churn_risk(result).skipped);
    EXPECT_TRUE(result.transactions.empty());
}
