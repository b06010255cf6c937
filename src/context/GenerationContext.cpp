#include "GenerationContext.hpp"

#include <stdexcept>
#include <utility>

namespace RetailForge
{

    void ProductIndex::add(uint32_t position, Category category, BrandId brand)
    {
        if (brand >= kBrandNames.size())
            throw std::invalid_argument("ProductIndex::add: unknown brand id");
        if (total_ > 0 && position <= last_position_)
            throw std::invalid_argument("ProductIndex::add: positions must be added in ascending order");

        by_category_[static_cast<size_t>(category)].push_back(position);
        by_brand_[static_cast<size_t>(category)][brand].push_back(position);
        last_position_ = position;
        ++total_;
    }

    size_t ProductIndex::eligible_count(CategoryMask excluded) const
    {
        size_t n = 0;
        for (size_t c = 0; c < kCategoryCount; ++c)
        {
            if (!is_excluded(excluded, static_cast<Category>(c)))
                n += by_category_[c].size();
        }
        return n;
    }

    size_t ProductIndex::eligible_brand_count(BrandId brand, CategoryMask excluded) const
    {
        size_t n = 0;
        for (size_t c = 0; c < kCategoryCount; ++c)
        {
            if (!is_excluded(excluded, static_cast<Category>(c)))
                n += by_brand_[c][brand].size();
        }
        return n;
    }

    uint32_t ProductIndex::eligible_at(CategoryMask excluded, size_t k) const
    {
        for (size_t c = 0; c < kCategoryCount; ++c)
        {
            if (is_excluded(excluded, static_cast<Category>(c)))
                continue;
            const auto &bucket = by_category_[c];
            if (k < bucket.size())
                return bucket[k];
            k -= bucket.size();
        }
        throw std::out_of_range("ProductIndex::eligible_at: position past eligible set");
    }

    uint32_t ProductIndex::eligible_brand_at(BrandId brand, CategoryMask excluded, size_t k) const
    {
        for (size_t c = 0; c < kCategoryCount; ++c)
        {
            if (is_excluded(excluded, static_cast<Category>(c)))
                continue;
            const auto &bucket = by_brand_[c][brand];
            if (k < bucket.size())
                return bucket[k];
            k -= bucket.size();
        }
        throw std::out_of_range("ProductIndex::eligible_brand_at: position past eligible set");
    }

    GenerationContext::GenerationContext(std::vector<Customer> seed_customers,
                                         std::vector<CustomerProfile> profiles,
                                         std::vector<Product> products,
                                         ProductIndex index)
        : seed_customers_(std::move(seed_customers)),
          profiles_(std::move(profiles)),
          products_(std::move(products)),
          index_(std::move(index))
    {
        if (profiles_.size() < seed_customers_.size())
            throw std::invalid_argument("GenerationContext: fewer profiles than seed customers");
        if (index_.size() != products_.size())
            throw std::invalid_argument("GenerationContext: product index does not cover the product list");
        if (products_.empty())
            throw std::invalid_argument("GenerationContext: empty product catalog");
    }

} // namespace RetailForge
