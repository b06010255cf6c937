#include "PatternInjector.hpp"

#include <algorithm>
#include <cstddef>
#include <array>
#include <iostream>
#include <set>
#include "Timeline.hpp"

namespace RetailForge
{

    namespace
    {
        constexpr int32_t kDefaultPatternWindowDays = 90;
        constexpr uint32_t kMinSeedInteractions = 5;
        constexpr uint32_t kMaxSeedInteractions = 10;
        constexpr int32_t kInteractionWindowDays = 180;
        constexpr uint32_t kBulkChainSampleAttempts = 100'000;
        constexpr double kBulkChainAmountFactor = 1.5;

        std::vector<const Product *> pointers(std::span<const Product> products, size_t n)
        {
            std::vector<const Product *> out;
            for (size_t i = 0; i < std::min(n, products.size()); ++i)
                out.push_back(&products[i]);
            return out;
        }
    } // namespace

    const PatternOutcome *PatternResult::outcome(const std::string &name) const
    {
        for (const auto &o : outcomes)
        {
            if (o.name == name)
                return &o;
        }
        return nullptr;
    }

    PatternInjector::PatternInjector(const GeneratorConfig &config, const SeedCatalog &seeds)
        : config_(config),
          seeds_(seeds),
          rng_(RandomStream::derive(config.master_seed, config.seed_offsets.patterns))
    {
    }

    // =========================================================================
    // inject()
    // =========================================================================
    PatternResult PatternInjector::inject(const GenerationContext &context)
    {
        std::cout << "[PATTERN] Injecting guaranteed patterns...\n";

        PatternResult result;
        result.outcomes.push_back(brand_loyalty(result));
        result.outcomes.push_back(collaborative_chain(result));
        result.outcomes.push_back(product_affinity(result));
        result.outcomes.push_back(category_expansion(result));
        result.outcomes.push_back(category_gap(result));
        result.outcomes.push_back(basket_window(result));
        result.outcomes.push_back(cross_segment_chains(result));
        result.outcomes.push_back(churn_risk(result));
        result.outcomes.push_back(diversity(result));
        result.outcomes.push_back(segment_coverage(result));
        result.outcomes.push_back(bulk_chains(context, result));
        seed_interactions(result);

        for (const auto &o : result.outcomes)
        {
            if (o.skipped)
                std::cout << "[PATTERN] SKIPPED " << o.name << ": " << o.reason << "\n";
            else if (config_.verbose)
                std::cout << "[PATTERN]   " << o.name << ": " << o.transactions << " transactions\n";
        }
        std::cout << "[PATTERN] Done: " << result.transactions.size() << " transactions, "
                  << result.interactions.size() << " interactions\n";
        return result;
    }

    // =========================================================================
    // Helpers
    // =========================================================================
    Transaction PatternInjector::make_transaction(uint64_t customer_id, const Product &product,
                                                  int64_t timestamp)
    {
        Transaction t;
        t.transaction_id = next_transaction_id_++;
        t.customer_id = customer_id;
        t.product_id = product.product_id;
        t.amount = round_cents(product.price * rng_.uniform(0.9, 1.3));
        t.quantity = rng_.uniform_int<uint32_t>(1, 2);
        t.timestamp = timestamp;
        t.channel = static_cast<Channel>(rng_.index(kChannelCount));
        t.status = TxnStatus::Completed;
        return t;
    }

    int64_t PatternInjector::days_ago(int32_t lo, int32_t hi)
    {
        const int32_t days = rng_.uniform_int<int32_t>(lo, hi);
        const int64_t second_of_day = rng_.uniform_int<int64_t>(0, kSecondsPerDay - 1);
        return config_.reference_time - static_cast<int64_t>(days) * kSecondsPerDay - second_of_day;
    }

    PatternOutcome PatternInjector::skip(const std::string &name, const std::string &reason)
    {
        return PatternOutcome{name, 0, true, reason};
    }

    PatternOutcome PatternInjector::done(const std::string &name, size_t before, const PatternResult &out)
    {
        return PatternOutcome{name, out.transactions.size() - before, false, {}};
    }

    bool PatternInjector::emit_chain(std::span<const uint64_t> customers,
                                     std::span<const Product *const> products,
                                     int64_t base_timestamp,
                                     std::vector<Transaction> &out)
    {
        if (products.size() < kChainProducts || customers.size() != products.size() + 1)
            return false;

        // (C0,P0) (C1,P0) (C1,P1) (C2,P1) ... (Cn,Pn-1)
        for (size_t p = 0; p < products.size(); ++p)
        {
            const int64_t ts = base_timestamp + static_cast<int64_t>(p) * kSecondsPerDay;
            out.push_back(make_transaction(customers[p], *products[p], ts));
            out.push_back(make_transaction(customers[p + 1], *products[p], ts + 3600));
        }
        return true;
    }

    // =========================================================================
    // Seed patterns
    // =========================================================================
    PatternOutcome PatternInjector::brand_loyalty(PatternResult &out)
    {
        const std::string name = "brand_loyalty";
        const auto vip = seeds_.segment(Segment::Vip);
        const auto apple = seeds_.products_of(Category::Electronics, "Apple");

        if (vip.size() < kLoyaltyCustomers || apple.size() < kLoyaltyProducts)
            return skip(name, "needs 5 VIP seed customers and 3 Apple seed products");

        const size_t before = out.transactions.size();
        for (uint32_t c = 0; c < kLoyaltyCustomers; ++c)
        {
            for (uint32_t p = 0; p < kLoyaltyProducts; ++p)
                out.transactions.push_back(make_transaction(vip[c].customer_id, apple[p], days_ago(10, 60)));
        }
        return done(name, before, out);
    }

    PatternOutcome PatternInjector::collaborative_chain(PatternResult &out)
    {
        const std::string name = "collaborative_chain";
        const auto vip = seeds_.segment(Segment::Vip);
        const auto samsung = seeds_.products_of(Category::Electronics, "Samsung");

        if (vip.size() < kChainCustomers || samsung.size() < kChainProducts)
            return skip(name, "needs 4 VIP seed customers and 3 Samsung seed products");

        std::array<uint64_t, kChainCustomers> customers{};
        for (uint32_t i = 0; i < kChainCustomers; ++i)
            customers[i] = vip[i].customer_id;
        const auto products = pointers(samsung, kChainProducts);

        const size_t before = out.transactions.size();
        emit_chain(customers, products, days_ago(20, kDefaultPatternWindowDays), out.transactions);
        return done(name, before, out);
    }

    PatternOutcome PatternInjector::product_affinity(PatternResult &out)
    {
        const std::string name = "product_affinity";
        const auto premium = seeds_.segment(Segment::Premium);
        const auto sony = seeds_.products_of(Category::Electronics, "Sony");

        if (premium.size() < 5 || sony.size() < 3)
            return skip(name, "needs 5 Premium seed customers and 3 Sony seed products");

        const size_t before = out.transactions.size();
        for (uint32_t c = 0; c < 5; ++c)
        {
            const uint32_t count = 2 + c % 2;
            for (uint32_t p = 0; p < count; ++p)
                out.transactions.push_back(make_transaction(
                    premium[c].customer_id, sony[p], days_ago(1, kDefaultPatternWindowDays)));
        }
        return done(name, before, out);
    }

    PatternOutcome PatternInjector::category_expansion(PatternResult &out)
    {
        const std::string name = "category_expansion";
        const auto vip = seeds_.segment(Segment::Vip);
        const auto nike = seeds_.products_of(Category::Clothing, "Nike");
        const auto ikea = seeds_.products_of(Category::Home, "IKEA");

        if (vip.size() < 3 || nike.empty() || ikea.empty())
            return skip(name, "needs 3 VIP seed customers, Nike clothing and IKEA home products");

        const size_t before = out.transactions.size();
        for (uint32_t c = 0; c < 3; ++c)
        {
            out.transactions.push_back(make_transaction(vip[c].customer_id, nike[0], days_ago(1, kDefaultPatternWindowDays)));
            out.transactions.push_back(make_transaction(vip[c].customer_id, ikea[0], days_ago(1, kDefaultPatternWindowDays)));
        }
        return done(name, before, out);
    }

    // -------------------------------------------------------------------------
    // category_gap — every seed customer carrying an exclusion set buys one
    // product from each category outside it.
    // -------------------------------------------------------------------------
    PatternOutcome PatternInjector::category_gap(PatternResult &out)
    {
        const std::string name = "category_gap";
        const auto &customers = seeds_.customers();
        const auto &profiles = seeds_.profiles();

        std::array<std::vector<const Product *>, kCategoryCount> by_category;
        for (size_t c = 0; c < kCategoryCount; ++c)
            by_category[c] = seeds_.products_in(static_cast<Category>(c));

        std::vector<size_t> targets;
        for (size_t i = 0; i < customers.size(); ++i)
        {
            if (profiles[i].exclusions != 0)
                targets.push_back(i);
        }
        if (targets.empty())
            return skip(name, "no seed customer carries a category exclusion");

        for (size_t i : targets)
        {
            for (size_t c = 0; c < kCategoryCount; ++c)
            {
                if (!is_excluded(profiles[i].exclusions, static_cast<Category>(c)) && by_category[c].empty())
                    return skip(name, "no seed product in category " + std::string(to_string(static_cast<Category>(c))));
            }
        }

        const size_t before = out.transactions.size();
        for (size_t i : targets)
        {
            for (size_t c = 0; c < kCategoryCount; ++c)
            {
                if (is_excluded(profiles[i].exclusions, static_cast<Category>(c)))
                    continue;
                const auto &pool = by_category[c];
                out.transactions.push_back(make_transaction(
                    customers[i].customer_id, *pool[i % pool.size()], days_ago(1, kDefaultPatternWindowDays)));
            }
        }
        return done(name, before, out);
    }

    // -------------------------------------------------------------------------
    // basket_window — three purchases at +0, +2 and +4 days.
    // -------------------------------------------------------------------------
    PatternOutcome PatternInjector::basket_window(PatternResult &out)
    {
        const std::string name = "basket_window";
        const auto regular = seeds_.segment(Segment::Regular);
        const auto adidas = seeds_.products_of(Category::Clothing, "Adidas");

        if (regular.size() < 5 || adidas.size() < 2)
            return skip(name, "needs 5 Regular seed customers and 2 Adidas seed products");

        const size_t basket = std::min<size_t>(3, adidas.size());
        const size_t before = out.transactions.size();
        for (uint32_t c = 0; c < 5; ++c)
        {
            const int64_t base = days_ago(30, 60);
            for (size_t p = 0; p < basket; ++p)
            {
                const int64_t ts = base + static_cast<int64_t>(p * kBasketSpacingDays) * kSecondsPerDay;
                out.transactions.push_back(make_transaction(regular[c].customer_id, adidas[p], ts));
            }
        }
        return done(name, before, out);
    }

    PatternOutcome PatternInjector::cross_segment_chains(PatternResult &out)
    {
        const std::string name = "cross_segment_chains";
        const auto vip = seeds_.segment(Segment::Vip);
        const auto premium = seeds_.segment(Segment::Premium);
        const auto regular = seeds_.segment(Segment::Regular);
        const auto &products = seeds_.products();

        if (vip.size() < kCrossSegmentChains || premium.size() < kCrossSegmentChains ||
            regular.size() < 2 * kCrossSegmentChains || products.size() < kChainProducts)
            return skip(name, "needs 5 VIP, 5 Premium, 10 Regular seed customers and 3 seed products");

        const size_t before = out.transactions.size();
        for (uint32_t k = 0; k < kCrossSegmentChains; ++k)
        {
            const std::array<uint64_t, kChainCustomers> customers = {
                vip[k].customer_id, premium[k].customer_id,
                regular[k].customer_id, regular[k + kCrossSegmentChains].customer_id};

            // Non-Electronics products keep the chain valid for any customer.
            std::vector<const Product *> chain;
            for (size_t step = 0; chain.size() < kChainProducts && step < products.size(); ++step)
            {
                const auto &p = products[(k * 7 + step * 5) % products.size()];
                if (p.category != Category::Electronics &&
                    std::find(chain.begin(), chain.end(), &p) == chain.end())
                    chain.push_back(&p);
            }
            if (!emit_chain(customers, chain, days_ago(5, kDefaultPatternWindowDays), out.transactions))
                return skip(name, "not enough non-Electronics seed products for a chain");
        }
        return done(name, before, out);
    }

    // -------------------------------------------------------------------------
    // churn_risk — high value, one or two purchases in total.
    // -------------------------------------------------------------------------
    PatternOutcome PatternInjector::churn_risk(PatternResult &out)
    {
        const std::string name = "churn_risk";
        if (!seeds_.has_churn_anchors())
            return skip(name, "needs 8 VIP seed customers and 2 Apple/Samsung seed products");

        const auto vip = seeds_.segment(Segment::Vip);
        const auto pool = seeds_.churn_products();

        const size_t before = out.transactions.size();
        for (uint32_t slot = SeedCatalog::kChurnRiskFirstSlot; slot <= SeedCatalog::kChurnRiskLastSlot; ++slot)
        {
            const uint32_t count = 1 + (slot + 1) % 2;
            for (uint32_t j = 0; j < count; ++j)
                out.transactions.push_back(make_transaction(
                    vip[slot].customer_id, *pool[(slot + j) % pool.size()], days_ago(90, 300)));
        }
        return done(name, before, out);
    }

    PatternOutcome PatternInjector::diversity(PatternResult &out)
    {
        const std::string name = "diversity";
        const auto premium = seeds_.segment(Segment::Premium);

        const std::array<std::span<const Product>, 5> groups = {
            seeds_.products_of(Category::Electronics, "Apple"),
            seeds_.products_of(Category::Clothing, "Nike"),
            seeds_.products_of(Category::Books, "Penguin"),
            seeds_.products_of(Category::Sports, "Nike"),
            seeds_.products_of(Category::Beauty, "Loreal")};

        const auto available = std::count_if(groups.begin(), groups.end(),
                                             [](const auto &g)
                                             { return !g.empty(); });
        if (premium.size() < 8 || available < static_cast<std::ptrdiff_t>(kMinDiversityCategories))
            return skip(name, "needs 8 Premium seed customers and 4 seeded categories");

        const size_t before = out.transactions.size();
        for (uint32_t slot = 5; slot < 8; ++slot)
        {
            for (const auto &g : groups)
            {
                if (!g.empty())
                    out.transactions.push_back(make_transaction(
                        premium[slot].customer_id, g[slot % g.size()], days_ago(1, kDefaultPatternWindowDays)));
            }
        }
        return done(name, before, out);
    }

    PatternOutcome PatternInjector::segment_coverage(PatternResult &out)
    {
        const std::string name = "segment_coverage";
        const auto wayfair = seeds_.products_of(Category::Home, "Wayfair");
        const auto adidas = seeds_.products_of(Category::Clothing, "Adidas");

        if (wayfair.empty() || adidas.empty())
            return skip(name, "needs Wayfair and Adidas seed products");

        const size_t before = out.transactions.size();
        for (Segment s : {Segment::Basic, Segment::New})
        {
            const auto customers = seeds_.segment(s);
            for (size_t c = 0; c < std::min<size_t>(5, customers.size()); ++c)
            {
                out.transactions.push_back(make_transaction(
                    customers[c].customer_id, wayfair[c % wayfair.size()], days_ago(1, kDefaultPatternWindowDays)));
                out.transactions.push_back(make_transaction(
                    customers[c].customer_id, adidas[c % adidas.size()], days_ago(1, kDefaultPatternWindowDays)));
            }
        }
        return done(name, before, out);
    }

    // =========================================================================
    // bulk_chains — four same-segment bulk customers over three Electronics
    // products, segments rotating VIP, Premium, Regular.
    // =========================================================================
    // Chain k, for segment S = kChainSegments[k % 3]:
    //
    //   C0 ── P0 ── C1 ── P1 ── C2 ── P2 ── C3      6 transactions
    //
    // Customers are drawn by rejection from the bulk positions: a draw counts
    // only if its profile is in S and does not exclude Electronics, so the
    // chain never contradicts the exclusions TransactionSynthesizer honours.
    // The draw budget (kBulkChainSampleAttempts) bounds the loop when S is
    // rare; a chain that runs out is logged and the next k continues.
    //
    // Bulk customers keep their ordinary synthesized history as well. The
    // chain only adds six edges on top of it.
    // =========================================================================
    PatternOutcome PatternInjector::bulk_chains(const GenerationContext &context, PatternResult &out)
    {
        const std::string name = "bulk_chains";
        const auto &electronics = context.index().in_category(Category::Electronics);

        if (config_.bulk_recommendation_chains == 0)
            return skip(name, "disabled");
        if (electronics.size() < kChainProducts)
            return skip(name, "fewer than 3 Electronics products");
        if (context.bulk_customer_count() < kChainCustomers)
            return skip(name, "fewer than 4 bulk customers");

        static constexpr std::array<Segment, 3> kChainSegments = {Segment::Vip, Segment::Premium, Segment::Regular};
        const size_t first_bulk = context.seed_customer_count();
        const size_t bulk = context.bulk_customer_count();

        const size_t before = out.transactions.size();
        uint32_t built = 0;
        for (uint32_t k = 0; k < config_.bulk_recommendation_chains; ++k)
        {
            const Segment segment = kChainSegments[k % kChainSegments.size()];

            std::vector<size_t> picked;
            for (uint32_t attempt = 0; attempt < kBulkChainSampleAttempts && picked.size() < kChainCustomers; ++attempt)
            {
                const size_t pos = first_bulk + rng_.index(bulk);
                const auto &profile = context.profile_at(pos);
                if (profile.segment != segment || is_excluded(profile.exclusions, Category::Electronics))
                    continue;
                if (std::find(picked.begin(), picked.end(), pos) == picked.end())
                    picked.push_back(pos);
            }
            if (picked.size() < kChainCustomers)
            {
                std::cout << "[PATTERN] bulk chain " << k << " skipped: not enough "
                          << to_string(segment) << " bulk customers\n";
                continue;
            }

            std::vector<uint32_t> positions;
            while (positions.size() < kChainProducts)
            {
                const uint32_t p = electronics[rng_.index(electronics.size())];
                if (std::find(positions.begin(), positions.end(), p) == positions.end())
                    positions.push_back(p);
            }

            const int64_t base = recency_biased_timestamp(rng_, config_.reference_time);
            for (size_t p = 0; p < kChainProducts; ++p)
            {
                const auto &product = context.product_at(positions[p]);
                for (size_t c : {p, p + 1})
                {
                    Transaction t = make_transaction(
                        context.customer_id_at(picked[c]), product,
                        std::min(base + rng_.uniform_int<int64_t>(0, 30) * kSecondsPerDay, config_.reference_time));
                    t.amount = round_cents(product.price * kBulkChainAmountFactor);
                    t.quantity = 1;
                    out.transactions.push_back(t);
                }
            }
            ++built;
        }

        if (built == 0)
            return skip(name, "no segment had enough eligible bulk customers");
        return done(name, before, out);
    }

    // =========================================================================
    // seed_interactions — 5 to 10 browsing events per seed customer
    // =========================================================================
    void PatternInjector::seed_interactions(PatternResult &out)
    {
        const auto &products = seeds_.products();
        if (products.empty())
        {
            std::cout << "[PATTERN] SKIPPED seed_interactions: no seed products\n";
            return;
        }

        for (const auto &customer : seeds_.customers())
        {
            const uint32_t n = rng_.uniform_int<uint32_t>(kMinSeedInteractions, kMaxSeedInteractions);
            for (uint32_t i = 0; i < n; ++i)
            {
                Interaction it;
                it.interaction_id = next_interaction_id_++;
                it.customer_id = customer.customer_id;
                it.product_id = products[rng_.index(products.size())].product_id;
                it.type = static_cast<InteractionType>(rng_.index(kInteractionTypeCount));
                it.timestamp = uniform_recent_timestamp(rng_, config_.reference_time, kInteractionWindowDays);
                it.duration_seconds = rng_.uniform_int<uint32_t>(10, 300);
                it.device = static_cast<Device>(rng_.index(kDeviceCount));
                it.session_id = rng_.next_u64();
                out.interactions.push_back(it);
            }
        }
    }

} // namespace RetailForge
