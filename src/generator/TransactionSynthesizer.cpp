#include "TransactionSynthesizer.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include "../model/Catalog.hpp"
#include "Timeline.hpp"

namespace RetailForge
{

    namespace
    {
        constexpr uint32_t kLowEngagementMin = 1;
        constexpr uint32_t kLowEngagementMax = 2;
        constexpr uint32_t kMaxQuantity = 3;
        constexpr int64_t kCrossCategoryMinSeconds = 5 * 60;
        constexpr int64_t kCrossCategoryMaxSeconds = 120 * 60;
        constexpr int32_t kInteractionWindowDays = 180;
        constexpr uint32_t kMinDurationSeconds = 10;
        constexpr uint32_t kMaxDurationSeconds = 300;

        // Uniform choice among the positions in 'bucket' other than 'exclude'.
        // Index buckets are in ascending position order.
        std::optional<uint32_t> other_than(const std::vector<uint32_t> &bucket, uint32_t exclude,
                                           RandomStream &rng)
        {
            const auto it = std::lower_bound(bucket.begin(), bucket.end(), exclude);
            if (it == bucket.end() || *it != exclude)
            {
                if (bucket.empty())
                    return std::nullopt;
                return bucket[rng.index(bucket.size())];
            }
            if (bucket.size() == 1)
                return std::nullopt;

            const size_t skipped = static_cast<size_t>(it - bucket.begin());
            const size_t k = rng.index(bucket.size() - 1);
            return bucket[k < skipped ? k : k + 1];
        }

        // --------------------------------------------------------------------
        // TransactionSource
        // --------------------------------------------------------------------
        class TransactionSource : public RowSource<Transaction>
        {
        public:
            TransactionSource(TransactionSynthesizer synthesizer, size_t customers, uint64_t seed)
                : synthesizer_(synthesizer), customers_(customers), rng_(seed) {}

            size_t fill(std::vector<Transaction> &out, size_t max_rows) override
            {
                size_t n = 0;
                while (n < max_rows)
                {
                    if (pending_pos_ == pending_.size())
                    {
                        if (next_customer_ == customers_)
                            break;
                        pending_.clear();
                        pending_pos_ = 0;
                        synthesizer_.synthesize_customer(next_customer_++, rng_, next_id_, pending_);
                        continue;
                    }
                    const size_t take = std::min(max_rows - n, pending_.size() - pending_pos_);
                    out.insert(out.end(), pending_.begin() + pending_pos_, pending_.begin() + pending_pos_ + take);
                    pending_pos_ += take;
                    n += take;
                }
                return n;
            }

            void reset() override
            {
                rng_.reset();
                pending_.clear();
                pending_pos_ = 0;
                next_customer_ = 0;
                next_id_ = kBulkEventIdBase;
            }

        private:
            TransactionSynthesizer synthesizer_;
            size_t customers_;
            RandomStream rng_;
            std::vector<Transaction> pending_;
            size_t pending_pos_ = 0;
            size_t next_customer_ = 0;
            uint64_t next_id_ = kBulkEventIdBase;
        };

        // --------------------------------------------------------------------
        // InteractionSource
        // --------------------------------------------------------------------
        class InteractionSource : public RowSource<Interaction>
        {
        public:
            InteractionSource(TransactionSynthesizer synthesizer, uint64_t total, uint64_t seed)
                : synthesizer_(synthesizer), total_(total), rng_(seed) {}

            size_t fill(std::vector<Interaction> &out, size_t max_rows) override
            {
                size_t n = 0;
                while (n < max_rows && emitted_ < total_)
                {
                    out.push_back(synthesizer_.draw_interaction(kBulkEventIdBase + emitted_, rng_));
                    ++emitted_;
                    ++n;
                }
                return n;
            }

            void reset() override
            {
                rng_.reset();
                emitted_ = 0;
            }

        private:
            TransactionSynthesizer synthesizer_;
            uint64_t total_;
            RandomStream rng_;
            uint64_t emitted_ = 0;
        };
    } // namespace

    TransactionSynthesizer::TransactionSynthesizer(const GeneratorConfig &config, const GenerationContext &context)
        : config_(config), context_(context)
    {
        if (context_.products().empty())
            throw std::invalid_argument("TransactionSynthesizer: context has no products");
    }

    std::unique_ptr<RowSource<Transaction>> TransactionSynthesizer::transaction_source() const
    {
        return std::make_unique<TransactionSource>(
            *this, context_.customer_count(),
            config_.master_seed + config_.seed_offsets.transactions);
    }

    std::unique_ptr<RowSource<Interaction>> TransactionSynthesizer::interaction_source() const
    {
        return std::make_unique<InteractionSource>(
            *this, static_cast<uint64_t>(context_.customer_count()) * config_.interactions_per_customer,
            config_.master_seed + config_.seed_offsets.interactions);
    }

    uint32_t TransactionSynthesizer::transaction_count(const CustomerProfile &profile, RandomStream &rng) const
    {
        const auto &seg = profile_of(profile.segment);
        if (seg.high_value && rng.chance(config_.low_engagement_fraction))
            return rng.uniform_int<uint32_t>(kLowEngagementMin, kLowEngagementMax);
        return rng.poisson(seg.frequency);
    }

    // =========================================================================
    // pick_product()
    // =========================================================================
    // 1. p = 0.6 and an affinity brand: uniform over that brand's products
    //    outside the exclusion set.
    // 2. Otherwise uniform over all products outside the exclusion set.
    // 3. Nothing eligible: uniform over the whole catalog.
    // =========================================================================
    uint32_t TransactionSynthesizer::pick_product(const CustomerProfile &profile, RandomStream &rng) const
    {
        const auto &index = context_.index();

        if (profile.brand_affinity != kNoBrand && rng.chance(kAffinityPreference))
        {
            const size_t n = index.eligible_brand_count(profile.brand_affinity, profile.exclusions);
            if (n > 0)
                return index.eligible_brand_at(profile.brand_affinity, profile.exclusions, rng.index(n));
        }

        const size_t n = index.eligible_count(profile.exclusions);
        if (n > 0)
            return index.eligible_at(profile.exclusions, rng.index(n));

        return static_cast<uint32_t>(rng.index(context_.products().size()));
    }

    std::optional<uint32_t> TransactionSynthesizer::basket_companion(const Product &product, uint32_t position,
                                                                     RandomStream &rng) const
    {
        const auto &index = context_.index();
        if (const auto brand = find_brand(product.brand))
        {
            if (auto same_brand = other_than(index.in(product.category, *brand), position, rng))
                return same_brand;
        }
        return other_than(index.in_category(product.category), position, rng);
    }

    std::optional<uint32_t> TransactionSynthesizer::cross_category(const Product &product, CategoryMask excluded,
                                                                   RandomStream &rng) const
    {
        const auto &cat = profile_of(product.category);
        if (cat.cross_sell_count == 0)
            return std::nullopt;

        const Category linked = cat.cross_sell[rng.index(cat.cross_sell_count)];
        if (is_excluded(excluded, linked))
            return std::nullopt;

        const auto &bucket = context_.index().in_category(linked);
        if (bucket.empty())
            return std::nullopt;
        return bucket[rng.index(bucket.size())];
    }

    // =========================================================================
    // synthesize_customer()
    // =========================================================================
    void TransactionSynthesizer::synthesize_customer(size_t position, RandomStream &rng,
                                                     uint64_t &next_id, std::vector<Transaction> &out,
                                                     std::vector<RowLineage> *lineage) const
    {
        const auto &profile = context_.profile_at(position);
        if (profile.pattern_managed)
            return;

        const uint64_t customer_id = context_.customer_id_at(position);
        const auto &seg = profile_of(profile.segment);
        const uint32_t count = transaction_count(profile, rng);

        // (row index in 'out', product position) of each primary purchase
        std::vector<std::pair<size_t, uint32_t>> primaries;
        primaries.reserve(count);

        for (uint32_t i = 0; i < count; ++i)
        {
            const uint32_t product_pos = pick_product(profile, rng);
            const auto &product = context_.product_at(product_pos);

            Transaction t;
            t.transaction_id = next_id++;
            t.customer_id = customer_id;
            t.product_id = product.product_id;
            t.timestamp = recency_biased_timestamp(rng, config_.reference_time);
            t.amount = round_cents(product.price * seg.amount_multiplier * rng.uniform(0.7, 1.3));
            t.quantity = rng.uniform_int<uint32_t>(1, kMaxQuantity);
            t.channel = static_cast<Channel>(rng.index(kChannelCount));
            t.status = rng.chance(kCompletedRate) ? TxnStatus::Completed : TxnStatus::Cancelled;
            const size_t primary_row = out.size();
            primaries.emplace_back(primary_row, product_pos);
            out.push_back(t);
            if (lineage)
                lineage->push_back({RowOrigin::Primary, primary_row});

            if (rng.chance(kBasketRate))
            {
                if (const auto companion = basket_companion(product, product_pos, rng))
                {
                    const auto &other = context_.product_at(*companion);
                    Transaction b;
                    b.transaction_id = next_id++;
                    b.customer_id = customer_id;
                    b.product_id = other.product_id;
                    b.timestamp = t.timestamp + rng.uniform_int<int64_t>(0, kBasketMaxDays * kSecondsPerDay);
                    b.amount = round_cents(other.price * seg.amount_multiplier);
                    b.quantity = 1;
                    b.channel = t.channel;
                    b.status = TxnStatus::Completed;
                    out.push_back(b);
                    if (lineage)
                        lineage->push_back({RowOrigin::BasketCompanion, primary_row});
                }
            }
        }

        for (const auto &[row, product_pos] : primaries)
        {
            if (!rng.chance(kCrossCategoryRate))
                continue;

            const auto linked = cross_category(context_.product_at(product_pos), profile.exclusions, rng);
            if (!linked)
                continue;

            const Transaction primary = out[row];
            const auto &other = context_.product_at(*linked);
            Transaction x;
            x.transaction_id = next_id++;
            x.customer_id = customer_id;
            x.product_id = other.product_id;
            x.timestamp = primary.timestamp + rng.uniform_int<int64_t>(kCrossCategoryMinSeconds, kCrossCategoryMaxSeconds);
            x.amount = round_cents(other.price * seg.amount_multiplier);
            x.quantity = 1;
            x.channel = primary.channel;
            x.status = TxnStatus::Completed;
            out.push_back(x);
            if (lineage)
                lineage->push_back({RowOrigin::CrossCategory, row});
        }
    }

    Interaction TransactionSynthesizer::draw_interaction(uint64_t id, RandomStream &rng) const
    {
        const size_t customer = rng.index(context_.customer_count());
        const size_t product = rng.index(context_.products().size());

        Interaction it;
        it.interaction_id = id;
        it.customer_id = context_.customer_id_at(customer);
        it.product_id = context_.product_at(static_cast<uint32_t>(product)).product_id;
        it.type = static_cast<InteractionType>(rng.index(kInteractionTypeCount));
        it.device = static_cast<Device>(rng.index(kDeviceCount));
        it.duration_seconds = rng.uniform_int<uint32_t>(kMinDurationSeconds, kMaxDurationSeconds);
        it.timestamp = uniform_recent_timestamp(rng, config_.reference_time, kInteractionWindowDays);
        it.session_id = rng.next_u64();
        return it;
    }

} // namespace RetailForge
