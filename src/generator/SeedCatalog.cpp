#include "SeedCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>

namespace RetailForge
{

    namespace
    {
        std::string lower(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        // Midpoint of the i-th of n equal sub-ranges of [lo, hi].
        double spaced(double lo, double hi, uint32_t i, uint32_t n)
        {
            return round_cents(lo + (hi - lo) * (static_cast<double>(i) + 0.5) / static_cast<double>(n));
        }
    } // namespace

    SeedCatalog SeedCatalog::build(uint32_t customers_per_segment,
                                   int64_t reference_time,
                                   std::span<const SeedProductSpec> product_specs)
    {
        std::cout << "[SEED] Building seed catalog: " << customers_per_segment
                  << " customers per segment, " << product_specs.size()
                  << " product groups\n";

        uint64_t seed_products = 0;
        for (const auto &spec : product_specs)
            seed_products += spec.count;
        if (static_cast<uint64_t>(customers_per_segment) * kSegmentCount >= kBulkEntityIdBase ||
            seed_products >= kBulkEntityIdBase)
            throw std::invalid_argument("SeedCatalog::build: seed ids would reach the bulk id range");

        SeedCatalog catalog;
        catalog.per_segment_ = customers_per_segment;

        const int32_t reference_day = static_cast<int32_t>(reference_time / kSecondsPerDay);
        const BrandId apple = *find_brand("Apple");
        const BrandId samsung = *find_brand("Samsung");

        // ------------------------------------------------------------------
        // Customers
        // ------------------------------------------------------------------
        catalog.customers_.reserve(static_cast<size_t>(customers_per_segment) * kSegmentCount);
        catalog.profiles_.reserve(catalog.customers_.capacity());

        uint64_t next_id = 1;
        for (size_t s = 0; s < kSegmentCount; ++s)
        {
            const auto segment = static_cast<Segment>(s);
            const auto &profile = profile_of(segment);
            const std::string tag = lower(to_string(segment));

            for (uint32_t i = 0; i < customers_per_segment; ++i)
            {
                Customer c;
                c.customer_id = next_id++;
                c.email = "seed_" + tag + "_" + std::to_string(i) + "@example.com";
                c.name = "Seed " + std::string(to_string(segment)) + " Customer " + std::to_string(i);
                c.segment = segment;
                c.ltv = spaced(profile.min_ltv, profile.max_ltv, i, customers_per_segment);
                c.registration_date = reference_day - static_cast<int32_t>(30 + (i * 33) % 335);
                c.created_at = reference_time;
                catalog.customers_.push_back(std::move(c));

                CustomerProfile p;
                p.segment = segment;
                if (profile.high_value)
                {
                    p.brand_affinity = i < kAppleAffinitySlots ? apple : samsung;
                    if (i >= kExclusionFirstSlot)
                        p.exclusions = category_bit(Category::Electronics);
                }
                catalog.profiles_.push_back(p);
            }
        }

        // ------------------------------------------------------------------
        // Products
        // ------------------------------------------------------------------
        uint64_t next_product = 1;
        for (const auto &spec : product_specs)
        {
            ProductGroup group{spec.category, spec.brand, catalog.products_.size(), spec.count};

            for (uint32_t i = 0; i < spec.count; ++i)
            {
                Product p;
                p.product_id = next_product++;
                p.name = std::string(spec.brand) + " " + std::string(to_string(spec.category)) +
                         " Seed " + std::to_string(i + 1);
                p.category = spec.category;
                p.brand = std::string(spec.brand);
                p.price = spaced(spec.min_price, spec.max_price, i, spec.count);
                p.launch_date = reference_day - static_cast<int32_t>(60 + 45 * i);
                catalog.products_.push_back(std::move(p));
            }
            catalog.groups_.push_back(group);
        }

        // Churn-risk slots are handed to the pattern only when it can run;
        // otherwise they stay ordinary VIPs and get bulk history.
        if (catalog.has_churn_anchors())
        {
            for (uint32_t slot = kChurnRiskFirstSlot; slot <= kChurnRiskLastSlot; ++slot)
                catalog.profiles_[slot].pattern_managed = true;
        }
        else
        {
            std::cout << "[SEED] Churn-risk anchors missing: VIP slots " << kChurnRiskFirstSlot
                      << "-" << kChurnRiskLastSlot << " keep bulk history\n";
        }

        std::cout << "[SEED] Seed catalog ready: " << catalog.customers_.size()
                  << " customers, " << catalog.products_.size() << " products\n";
        return catalog;
    }

    std::span<const Customer> SeedCatalog::segment(Segment s) const
    {
        const size_t begin = static_cast<size_t>(s) * per_segment_;
        if (begin >= customers_.size())
            return {};
        return std::span<const Customer>(customers_).subspan(begin, per_segment_);
    }

    std::span<const Product> SeedCatalog::products_of(Category category, std::string_view brand) const
    {
        for (const auto &g : groups_)
        {
            if (g.category == category && g.brand == brand)
                return std::span<const Product>(products_).subspan(g.begin, g.count);
        }
        return {};
    }

    std::vector<const Product *> SeedCatalog::churn_products() const
    {
        std::vector<const Product *> out;
        for (const char *brand : {"Apple", "Samsung"})
        {
            for (const auto &p : products_of(Category::Electronics, brand))
                out.push_back(&p);
        }
        return out;
    }

    bool SeedCatalog::has_churn_anchors() const
    {
        return per_segment_ > kChurnRiskLastSlot && churn_products().size() >= kMinChurnProducts;
    }

    std::vector<const Product *> SeedCatalog::products_in(Category category) const
    {
        std::vector<const Product *> out;
        for (const auto &p : products_)
        {
            if (p.category == category)
                out.push_back(&p);
        }
        return out;
    }

} // namespace RetailForge
