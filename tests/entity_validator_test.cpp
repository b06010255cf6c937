#include <gtest/gtest.h>

#include "validator/EntityValidator.hpp"

using namespace RetailForge;

class EntityValidatorTest : public ::testing::Test
{
protected:
    Customer customer{kBulkEntityIdBase, 1'735'689'600, 950.0, "mary.jones.17@mail.com",
                      "Mary Jones", 19'900, Segment::Regular};
    Product product{kBulkEntityIdBase, 129.99, "Nike Clothing Product 4", "Nike", 19'800, Category::Clothing};
};

TEST_F(EntityValidatorTest, GeneratedShapesPass)
{
    EXPECT_TRUE(EntityValidator::validate(customer).valid);
    EXPECT_TRUE(EntityValidator::validate(product).valid);

    customer.email = "seed_vip_0@example.com";
    customer.name = "Seed VIP Customer 0";
    customer.segment = Segment::Vip;
    customer.ltv = 8'000.0;
    EXPECT_TRUE(EntityValidator::validate(customer).valid);
}

TEST_F(EntityValidatorTest, RejectsMalformedText)
{
    customer.email = "not-an-email";
    EXPECT_FALSE(EntityValidator::validate(customer).valid);

    customer.email = "mary.jones.17@mail.com";
    customer.name = "mary jones";
    const auto result = EntityValidator::validate(customer);
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.reason.find("name"), std::string::npos);

    product.brand = "Acme";
    EXPECT_FALSE(EntityValidator::validate(product).valid);
}

TEST_F(EntityValidatorTest, RejectsOutOfRangeValues)
{
    customer.ltv = 5'000.0; // Regular tops out at 3,000
    EXPECT_FALSE(EntityValidator::validate(customer).valid);

    product.price = 900.0; // Clothing tops out at 500
    EXPECT_FALSE(EntityValidator::validate(product).valid);

    Transaction t{1, 1, 1, 1'735'000'000, 0.0, 1, Channel::Web, TxnStatus::Completed};
    EXPECT_FALSE(EntityValidator::validate(t).valid);
    t.amount = 10.0;
    EXPECT_TRUE(EntityValidator::validate(t).valid);
    t.quantity = 0;
    EXPECT_FALSE(EntityValidator::validate(t).valid);

    Interaction i{1, 1, 1, 42, 1'735'000'000, 0, InteractionType::View, Device::Mobile};
    EXPECT_FALSE(EntityValidator::validate(i).valid);
    i.duration_seconds = 30;
    EXPECT_TRUE(EntityValidator::validate(i).valid);
}

TEST_F(EntityValidatorTest, CountInvalidKeepsCounting)
{
    std::vector<Customer> rows(8, customer);
    rows[2].email = "broken";
    rows[5].ltv = -1.0;
    rows[7].name = "";
    EXPECT_EQ(EntityValidator::count_invalid(rows, "customers"), 3u);
}
