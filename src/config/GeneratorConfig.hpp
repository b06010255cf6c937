#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include "../model/Entities.hpp"

namespace RetailForge
{

    // Raised by GeneratorConfig::validate() and the loaders. Always fatal,
    // always before any row is generated.
    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &what)
            : std::runtime_error("[CONFIG ERROR] " + what) {}
    };

    // ============================================================================
    // SeedOffsets — fixed per-stream offsets added to the master seed
    // ============================================================================
    struct SeedOffsets
    {
        uint64_t customers = 1;
        uint64_t products = 2;
        uint64_t transactions = 3;
        uint64_t interactions = 4;
        uint64_t patterns = 5;
    };

    // ============================================================================
    // RetryPolicy — bounded retry for artifact writes
    // ============================================================================
    // delay(attempt) for attempt = 1..max_attempts-1 returns
    //   initial_delay * backoff_multiplier^(attempt-1)
    // A multiplier of 1.0 gives a fixed delay; a zero delay is used by tests.
    // ============================================================================
    struct RetryPolicy
    {
        uint32_t max_attempts = 3;
        std::chrono::milliseconds initial_delay{500};
        double backoff_multiplier = 1.0;

        [[nodiscard]]
        std::chrono::milliseconds delay(uint32_t attempt) const;

        static RetryPolicy no_delay(uint32_t attempts)
        {
            return RetryPolicy{attempts, std::chrono::milliseconds{0}, 1.0};
        }
    };

    // ============================================================================
    // GeneratorConfig
    // ============================================================================
    // scale_tier selects customer_count, product_count and the average number
    // of transactions per customer:
    //
    //   "1m"     ->   1,000,000 customers, 10,000 products,  8 txns/customer
    //   "10m"    ->  10,000,000 customers, 25,000 products, 10 txns/customer
    //   "100m"   -> 100,000,000 customers, 50,000 products, 12 txns/customer
    //   "custom" -> customer_count / product_count are taken as given
    //
    // apply_scale_tier() resolves the derived fields; validate() must pass
    // before the config is handed to the pipeline.
    // ============================================================================
    struct GeneratorConfig
    {
        std::string scale_tier = "1m";
        uint64_t customer_count = 1'000'000;
        uint64_t product_count = 10'000;
        double avg_transactions_per_customer = 8.0;

        uint64_t master_seed = 42;
        SeedOffsets seed_offsets;

        uint64_t batch_size = 100'000;
        uint64_t single_file_max_rows = 100'000;
        std::string compression = "snappy";
        bool overwrite_existing = false;
        bool include_seed_patterns = true;
        std::filesystem::path output_dir = "data";

        uint32_t seed_customers_per_segment = 10;
        uint32_t interactions_per_customer = 25;
        uint32_t bulk_recommendation_chains = 20;
        double low_engagement_fraction = 0.10;

        std::array<double, kSegmentCount> segment_weights = {0.10, 0.20, 0.30, 0.25, 0.15};
        std::array<double, kCategoryCount> category_weights = {
            1.0 / 6, 1.0 / 6, 1.0 / 6, 1.0 / 6, 1.0 / 6, 1.0 / 6};

        RetryPolicy retry;
        uint32_t worker_threads = 1;

        // 2025-01-01T00:00:00Z. Every date and timestamp is computed relative
        // to this instant.
        int64_t reference_time = 1'735'689'600;

        bool verbose = false;

        // Resolves tier-derived fields. Throws ConfigError on an unknown tier.
        void apply_scale_tier();

        // Throws ConfigError describing the first violated constraint.
        void validate() const;

        // Number of bulk (non-seed) customers for this run.
        [[nodiscard]]
        uint64_t bulk_customer_count() const;

        void print() const;
    };

    class ConfigLoader
    {
    public:
        // Reads a YAML file; unknown keys are rejected. The result has the
        // scale tier applied but is not yet validated.
        static GeneratorConfig load_from_yaml(const std::filesystem::path &path);

        // Same as load_from_yaml() but from an in-memory document.
        static GeneratorConfig load_from_string(const std::string &yaml_text);

        // Applies CUSTOMER_SCALE, RANDOM_SEED, BATCH_FILE_SIZE, DATA_OUTPUT_DIR,
        // PARQUET_COMPRESSION, OVERWRITE_EXISTING_DATA and VERBOSE_LOGGING.
        static void apply_environment(GeneratorConfig &config);
    };

} // namespace RetailForge
