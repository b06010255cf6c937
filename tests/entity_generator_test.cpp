#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include "generator/EntityGenerator.hpp"
#include "test_support.hpp"

using namespace RetailForge;

class EntityGeneratorTest : public ::testing::Test
{
protected:
    GeneratorConfig config = test_support::small_config(5'050, 800);
};

TEST_F(EntityGeneratorTest, SegmentFrequenciesFollowWeights)
{
    config.customer_count = 100'050;
    EntityGenerator generator(config);
    const auto profiles = generator.generate_customer_profiles();
    ASSERT_EQ(profiles.size(), 100'000u);

    std::array<size_t, kSegmentCount> counts{};
    for (const auto &p : profiles)
        ++counts[static_cast<size_t>(p.segment)];

    for (size_t s = 0; s < kSegmentCount; ++s)
    {
        const double observed = static_cast<double>(counts[s]) / static_cast<double>(profiles.size());
        EXPECT_NEAR(observed, config.segment_weights[s], 0.01) << to_string(static_cast<Segment>(s));
    }
}

TEST_F(EntityGeneratorTest, ExclusionsOnlyForHighValueSegments)
{
    EntityGenerator generator(config);
    const auto profiles = generator.generate_customer_profiles();

    size_t excluded = 0;
    for (const auto &p : profiles)
    {
        if (p.exclusions == 0)
            continue;
        ++excluded;
        EXPECT_TRUE(profile_of(p.segment).high_value);
        EXPECT_EQ(p.exclusions, category_bit(Category::Electronics));
    }
    EXPECT_GT(excluded, 0u);
}

TEST_F(EntityGeneratorTest, AffinityBrandsComeFromSegmentPool)
{
    EntityGenerator generator(config);
    for (const auto &p : generator.generate_customer_profiles())
    {
        if (p.brand_affinity == kNoBrand)
            continue;
        const auto &pool = profile_of(p.segment).high_value ? kHighValueAffinityBrands
                                                            : kStandardAffinityBrands;
        EXPECT_NE(std::find(pool.begin(), pool.end(), p.brand_affinity), pool.end());
    }
}

TEST_F(EntityGeneratorTest, RowStreamMatchesProfilePass)
{
    EntityGenerator generator(config);
    const auto profiles = generator.generate_customer_profiles();

    auto source = generator.customer_source();
    const auto rows = test_support::drain(*source);
    ASSERT_EQ(rows.size(), profiles.size());

    for (size_t i = 0; i < rows.size(); ++i)
    {
        EXPECT_EQ(rows[i].customer_id, kBulkEntityIdBase + i);
        EXPECT_EQ(rows[i].segment, profiles[i].segment);
        const auto &seg = profile_of(rows[i].segment);
        EXPECT_GE(rows[i].ltv, seg.min_ltv);
        EXPECT_LE(rows[i].ltv, seg.max_ltv);
        EXPECT_NE(rows[i].email.find('@'), std::string::npos);
    }
}

TEST_F(EntityGeneratorTest, CustomerSourceResetReplaysRows)
{
    EntityGenerator generator(config);
    auto source = generator.customer_source();

    const auto first = test_support::drain(*source, 333);
    source->reset();
    const auto second = test_support::drain(*source, 1024);
    EXPECT_EQ(first, second);
}

TEST_F(EntityGeneratorTest, ProductsStayInCategoryRanges)
{
    EntityGenerator generator(config);
    const auto products = generator.generate_products();
    ASSERT_EQ(products.size(), 800u);

    for (size_t i = 0; i < products.size(); ++i)
    {
        const auto &p = products[i];
        EXPECT_EQ(p.product_id, kBulkEntityIdBase + i);

        const auto &cat = profile_of(p.category);
        EXPECT_GE(p.price, cat.min_price);
        EXPECT_LE(p.price, cat.max_price);

        const auto brand = find_brand(p.brand);
        ASSERT_TRUE(brand.has_value());
        const auto end = cat.brands.begin() + cat.brand_count;
        EXPECT_NE(std::find(cat.brands.begin(), end, *brand), end) << p.brand;
    }
}

TEST_F(EntityGeneratorTest, CategoryWeightsAreHonoured)
{
    config.category_weights = {0.0, 0.0, 0.0, 1.0, 0.0, 0.0};
    EntityGenerator generator(config);
    for (const auto &p : generator.generate_products())
        EXPECT_EQ(p.category, Category::Books);
}

TEST_F(EntityGeneratorTest, SameSeedSameOutput)
{
    const auto a = EntityGenerator(config).generate_products();
    const auto b = EntityGenerator(config).generate_products();
    EXPECT_EQ(a, b);

    config.master_seed = 43;
    const auto c = EntityGenerator(config).generate_products();
    EXPECT_NE(a, c);
}

TEST_F(EntityGeneratorTest, InvalidWeightsRejected)
{
    config.segment_weights = {0.5, 0.5, 0.5, 0.5, 0.5};
    EXPECT_THROW({ EntityGenerator generator(config); }, ConfigError);
}

TEST_F(EntityGeneratorTest, ProductIndexGroupsByCategoryAndBrand)
{
    EntityGenerator generator(config);
    const auto products = generator.generate_products();
    const auto index = EntityGenerator::build_product_index(products);

    EXPECT_EQ(index.size(), products.size());
    EXPECT_EQ(index.eligible_count(0), products.size());

    const size_t electronics = index.in_category(Category::Electronics).size();
    EXPECT_EQ(index.eligible_count(category_bit(Category::Electronics)), products.size() - electronics);

    for (uint32_t pos : index.in(Category::Clothing, *find_brand("Nike")))
    {
        EXPECT_EQ(products[pos].category, Category::Clothing);
        EXPECT_EQ(products[pos].brand, "Nike");
    }

    auto bad = products;
    bad.front().brand = "Acme";
    EXPECT_THROW(EntityGenerator::build_product_index(bad), std::invalid_argument);
}
