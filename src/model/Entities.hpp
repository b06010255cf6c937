#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace RetailForge
{

    // ============================================================================
    // Enumerations shared by every table
    // ============================================================================
    // The numeric values double as array indices into the profile tables in
    // model/Catalog.hpp, so the order here is part of the data contract.
    // ============================================================================
    enum class Segment : uint8_t
    {
        Vip = 0,
        Premium,
        Regular,
        Basic,
        New
    };
    inline constexpr size_t kSegmentCount = 5;

    enum class Category : uint8_t
    {
        Electronics = 0,
        Clothing,
        Home,
        Books,
        Sports,
        Beauty
    };
    inline constexpr size_t kCategoryCount = 6;

    enum class Channel : uint8_t
    {
        Web = 0,
        MobileApp,
        Store
    };
    inline constexpr size_t kChannelCount = 3;

    enum class TxnStatus : uint8_t
    {
        Completed = 0,
        Cancelled
    };

    enum class InteractionType : uint8_t
    {
        View = 0,
        Click,
        Search,
        CartAdd
    };
    inline constexpr size_t kInteractionTypeCount = 4;

    enum class Device : uint8_t
    {
        Desktop = 0,
        Mobile,
        Tablet
    };
    inline constexpr size_t kDeviceCount = 3;

    // ----------------------------------------------------------------------------
    // Display names, written verbatim into the Parquet dictionary columns.
    // ----------------------------------------------------------------------------
    inline constexpr std::array<std::string_view, kSegmentCount> kSegmentNames = {
        "VIP", "Premium", "Regular", "Basic", "New"};

    inline constexpr std::array<std::string_view, kCategoryCount> kCategoryNames = {
        "Electronics", "Clothing", "Home", "Books", "Sports", "Beauty"};

    inline constexpr std::array<std::string_view, kChannelCount> kChannelNames = {
        "web", "mobile_app", "store"};

    inline constexpr std::array<std::string_view, 2> kStatusNames = {
        "completed", "cancelled"};

    inline constexpr std::array<std::string_view, kInteractionTypeCount> kInteractionTypeNames = {
        "view", "click", "search", "cart_add"};

    inline constexpr std::array<std::string_view, kDeviceCount> kDeviceNames = {
        "desktop", "mobile", "tablet"};

    inline std::string_view to_string(Segment s) { return kSegmentNames[static_cast<size_t>(s)]; }
    inline std::string_view to_string(Category c) { return kCategoryNames[static_cast<size_t>(c)]; }
    inline std::string_view to_string(Channel c) { return kChannelNames[static_cast<size_t>(c)]; }
    inline std::string_view to_string(TxnStatus s) { return kStatusNames[static_cast<size_t>(s)]; }
    inline std::string_view to_string(InteractionType t) { return kInteractionTypeNames[static_cast<size_t>(t)]; }
    inline std::string_view to_string(Device d) { return kDeviceNames[static_cast<size_t>(d)]; }

    // ============================================================================
    // Row types
    // ============================================================================
    // Dates are days since 1970-01-01 (Parquet DATE), timestamps are seconds
    // since epoch UTC. Fields are ordered largest-to-smallest.
    // ============================================================================

    struct Customer
    {
        uint64_t customer_id;
        int64_t created_at;
        double ltv;
        std::string email;
        std::string name;
        int32_t registration_date;
        Segment segment;

        auto operator<=>(const Customer &) const = default;
    };

    struct Product
    {
        uint64_t product_id;
        double price;
        std::string name;
        std::string brand;
        int32_t launch_date;
        Category category;

        auto operator<=>(const Product &) const = default;
    };

    struct Transaction
    {
        uint64_t transaction_id;
        uint64_t customer_id;
        uint64_t product_id;
        int64_t timestamp;
        double amount;
        uint32_t quantity;
        Channel channel;
        TxnStatus status;

        auto operator<=>(const Transaction &) const = default;
    };

    struct Interaction
    {
        uint64_t interaction_id;
        uint64_t customer_id;
        uint64_t product_id;
        uint64_t session_id;
        int64_t timestamp;
        uint32_t duration_seconds;
        InteractionType type;
        Device device;

        auto operator<=>(const Interaction &) const = default;
    };

    // Identifier bases. Seed entities count up from 1.
    inline constexpr uint64_t kBulkEntityIdBase = 1'000'000;
    inline constexpr uint64_t kBulkEventIdBase = 10'000'000'000ULL;

    inline constexpr int64_t kSecondsPerDay = 86'400;

} // namespace RetailForge
