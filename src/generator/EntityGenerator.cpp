#include "EntityGenerator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace RetailForge
{

    namespace
    {
        constexpr std::array<std::string_view, 20> kFirstNames = {
            "James", "Mary", "Robert", "Patricia", "John", "Jennifer", "Michael",
            "Linda", "David", "Elizabeth", "William", "Barbara", "Richard", "Susan",
            "Joseph", "Jessica", "Thomas", "Sarah", "Charles", "Karen"};

        constexpr std::array<std::string_view, 20> kLastNames = {
            "Smith", "Johnson", "Williams", "Brown", "Jones", "Garcia", "Miller",
            "Davis", "Rodriguez", "Martinez", "Hernandez", "Lopez", "Gonzalez",
            "Wilson", "Anderson", "Thomas", "Taylor", "Moore", "Jackson", "Martin"};

        constexpr std::array<std::string_view, 4> kEmailDomains = {
            "example.com", "mail.com", "shopmail.net", "inbox.org"};

        constexpr double kBrandAffinityRate = 0.30;
        constexpr double kElectronicsExclusionRate = 0.20;
        constexpr int32_t kLaunchWindowDays = 3 * 365;

        const GeneratorConfig &validated(const GeneratorConfig &config)
        {
            config.validate();
            return config;
        }

        std::string lower(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        // --------------------------------------------------------------------
        // BulkCustomerSource — streams bulk customer rows in ordinal order
        // --------------------------------------------------------------------
        class BulkCustomerSource : public RowSource<Customer>
        {
        public:
            BulkCustomerSource(EntityGenerator generator, uint64_t seed)
                : generator_(std::move(generator)), rng_(seed) {}

            size_t fill(std::vector<Customer> &out, size_t max_rows) override
            {
                size_t n = 0;
                CustomerProfile profile;
                while (n < max_rows && next_ < generator_.bulk_customer_count())
                {
                    Customer row;
                    generator_.draw_customer(next_, rng_, profile, &row);
                    out.push_back(std::move(row));
                    ++next_;
                    ++n;
                }
                return n;
            }

            void reset() override
            {
                rng_.reset();
                next_ = 0;
            }

        private:
            EntityGenerator generator_;
            RandomStream rng_;
            uint64_t next_ = 0;
        };
    } // namespace

    EntityGenerator::EntityGenerator(const GeneratorConfig &config)
        : config_(config),
          segment_choice_(validated(config).segment_weights),
          category_choice_(config.category_weights),
          bulk_customers_(config.bulk_customer_count())
    {
    }

    // =========================================================================
    // draw_customer()
    // =========================================================================
    // Draw order is fixed: segment, ltv, first name, last name, domain,
    // affinity roll (+ brand), exclusion roll. Registration dates follow
    // twelve monthly cohorts by ordinal and use no randomness.
    // =========================================================================
    void EntityGenerator::draw_customer(uint64_t ordinal, RandomStream &rng,
                                        CustomerProfile &profile, Customer *row) const
    {
        const auto segment = static_cast<Segment>(segment_choice_.sample(rng));
        const auto &seg = profile_of(segment);

        const double ltv = rng.uniform(seg.min_ltv, seg.max_ltv);
        const size_t first = rng.index(kFirstNames.size());
        const size_t last = rng.index(kLastNames.size());
        const size_t domain = rng.index(kEmailDomains.size());

        profile = CustomerProfile{};
        profile.segment = segment;

        if (rng.chance(kBrandAffinityRate))
        {
            const auto &pool = seg.high_value ? kHighValueAffinityBrands : kStandardAffinityBrands;
            profile.brand_affinity = pool[rng.index(pool.size())];
        }
        if (seg.high_value && rng.chance(kElectronicsExclusionRate))
            profile.exclusions = category_bit(Category::Electronics);

        if (row == nullptr)
            return;

        const int32_t reference_day = static_cast<int32_t>(config_.reference_time / kSecondsPerDay);
        const int32_t cohort_month = static_cast<int32_t>(ordinal % 12);

        row->customer_id = kBulkEntityIdBase + ordinal;
        row->name = std::string(kFirstNames[first]) + " " + std::string(kLastNames[last]);
        row->email = lower(kFirstNames[first]) + "." + lower(kLastNames[last]) + "." +
                     std::to_string(ordinal) + "@" + std::string(kEmailDomains[domain]);
        row->segment = segment;
        row->ltv = round_cents(ltv);
        row->registration_date = reference_day - (365 - cohort_month * 30);
        row->created_at = config_.reference_time;
    }

    std::vector<CustomerProfile> EntityGenerator::generate_customer_profiles() const
    {
        std::cout << "[GENERATOR] Building profiles for " << bulk_customers_
                  << " bulk customers...\n";
        auto t0 = std::chrono::steady_clock::now();

        RandomStream rng = RandomStream::derive(config_.master_seed, config_.seed_offsets.customers);

        std::vector<CustomerProfile> profiles(bulk_customers_);
        for (uint64_t i = 0; i < bulk_customers_; ++i)
            draw_customer(i, rng, profiles[i], nullptr);

        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - t0)
                      .count();
        std::cout << "[GENERATOR] Profiles ready in " << ms << "ms\n";
        return profiles;
    }

    std::unique_ptr<RowSource<Customer>> EntityGenerator::customer_source() const
    {
        return std::make_unique<BulkCustomerSource>(
            *this, config_.master_seed + config_.seed_offsets.customers);
    }

    // =========================================================================
    // generate_products()
    // =========================================================================
    // Category by weighted choice, brand uniform within the category, price
    // uniform within the category range, launch date within the last three
    // years.
    // =========================================================================
    std::vector<Product> EntityGenerator::generate_products() const
    {
        std::cout << "[GENERATOR] Generating " << config_.product_count << " products...\n";

        RandomStream rng = RandomStream::derive(config_.master_seed, config_.seed_offsets.products);
        const int32_t reference_day = static_cast<int32_t>(config_.reference_time / kSecondsPerDay);

        std::vector<Product> products;
        products.reserve(config_.product_count);

        for (uint64_t i = 0; i < config_.product_count; ++i)
        {
            const auto category = static_cast<Category>(category_choice_.sample(rng));
            const auto &cat = profile_of(category);
            const BrandId brand = cat.brands[rng.index(cat.brand_count)];

            Product p;
            p.product_id = kBulkEntityIdBase + i;
            p.category = category;
            p.brand = std::string(brand_name(brand));
            p.price = round_cents(rng.uniform(cat.min_price, cat.max_price));
            p.launch_date = reference_day - rng.uniform_int<int32_t>(0, kLaunchWindowDays);
            p.name = p.brand + " " + std::string(to_string(category)) + " Product " + std::to_string(i + 1);
            products.push_back(std::move(p));
        }

        std::cout << "[GENERATOR] Products ready: " << products.size() << "\n";
        return products;
    }

    ProductIndex EntityGenerator::build_product_index(const std::vector<Product> &products)
    {
        ProductIndex index;
        for (size_t i = 0; i < products.size(); ++i)
        {
            const auto brand = find_brand(products[i].brand);
            if (!brand)
                throw std::invalid_argument("build_product_index: unknown brand '" + products[i].brand + "'");
            index.add(static_cast<uint32_t>(i), products[i].category, *brand);
        }
        return index;
    }

} // namespace RetailForge
