#include "GeneratorConfig.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <set>
#include <sstream>

namespace RetailForge
{

    namespace
    {
        constexpr double kWeightTolerance = 1e-3;

        struct TierDefaults
        {
            uint64_t customers;
            uint64_t products;
            double avg_transactions;
        };

        // Tier thresholds for a custom customer count.
        TierDefaults defaults_for_count(uint64_t customers)
        {
            if (customers <= 1'000'000)
                return {customers, 10'000, 8.0};
            if (customers <= 10'000'000)
                return {customers, 25'000, 10.0};
            return {customers, 50'000, 12.0};
        }

        template <size_t N>
        void check_weights(const std::array<double, N> &weights, const char *name)
        {
            for (double w : weights)
            {
                if (!(w >= 0.0) || !std::isfinite(w))
                    throw ConfigError(std::string(name) + " contains a negative or non-finite weight");
            }
            const double sum = std::accumulate(weights.begin(), weights.end(), 0.0);
            if (std::fabs(sum - 1.0) > kWeightTolerance)
            {
                std::ostringstream oss;
                oss << name << " must sum to 1.0 (got " << std::setprecision(6) << sum << ")";
                throw ConfigError(oss.str());
            }
        }

        template <size_t N>
        std::array<double, N> read_weights(const YAML::Node &node, const char *name)
        {
            if (!node.IsSequence() || node.size() != N)
                throw ConfigError(std::string(name) + " must be a list of " + std::to_string(N) + " numbers");

            std::array<double, N> out{};
            for (size_t i = 0; i < N; ++i)
                out[i] = node[i].as<double>();
            return out;
        }

        bool parse_bool(const std::string &value)
        {
            return value == "true" || value == "1" || value == "yes" || value == "TRUE" || value == "True";
        }

        // ------------------------------------------------------------------
        // Key walkers. Unknown keys are configuration errors so that typos
        // do not silently fall back to defaults.
        // ------------------------------------------------------------------
        void read_retry(const YAML::Node &node, RetryPolicy &retry)
        {
            for (const auto &kv : node)
            {
                const auto key = kv.first.as<std::string>();
                if (key == "max_attempts")
                    retry.max_attempts = kv.second.as<uint32_t>();
                else if (key == "delay_ms")
                    retry.initial_delay = std::chrono::milliseconds(kv.second.as<int64_t>());
                else if (key == "backoff_multiplier")
                    retry.backoff_multiplier = kv.second.as<double>();
                else
                    throw ConfigError("unknown key retry." + key);
            }
        }

        void read_offsets(const YAML::Node &node, SeedOffsets &offsets)
        {
            for (const auto &kv : node)
            {
                const auto key = kv.first.as<std::string>();
                const auto value = kv.second.as<uint64_t>();
                if (key == "customers")
                    offsets.customers = value;
                else if (key == "products")
                    offsets.products = value;
                else if (key == "transactions")
                    offsets.transactions = value;
                else if (key == "interactions")
                    offsets.interactions = value;
                else if (key == "patterns")
                    offsets.patterns = value;
                else
                    throw ConfigError("unknown key seed_offsets." + key);
            }
        }

        GeneratorConfig from_node(const YAML::Node &root)
        {
            GeneratorConfig config;
            if (root.IsNull())
            {
                config.apply_scale_tier();
                return config;
            }
            if (!root.IsMap())
                throw ConfigError("top level of the configuration must be a mapping");

            bool explicit_customers = false;
            bool explicit_products = false;

            try
            {
                for (const auto &kv : root)
                {
                    const auto key = kv.first.as<std::string>();
                    const YAML::Node &value = kv.second;

                    if (key == "scale_tier")
                        config.scale_tier = value.as<std::string>();
                    else if (key == "customer_count")
                    {
                        config.customer_count = value.as<uint64_t>();
                        explicit_customers = true;
                    }
                    else if (key == "product_count")
                    {
                        config.product_count = value.as<uint64_t>();
                        explicit_products = true;
                    }
                    else if (key == "master_seed")
                        config.master_seed = value.as<uint64_t>();
                    else if (key == "seed_offsets")
                        read_offsets(value, config.seed_offsets);
                    else if (key == "batch_size")
                        config.batch_size = value.as<uint64_t>();
                    else if (key == "single_file_max_rows")
                        config.single_file_max_rows = value.as<uint64_t>();
                    else if (key == "compression")
                        config.compression = value.as<std::string>();
                    else if (key == "overwrite_existing")
                        config.overwrite_existing = value.as<bool>();
                    else if (key == "include_seed_patterns")
                        config.include_seed_patterns = value.as<bool>();
                    else if (key == "output_dir")
                        config.output_dir = value.as<std::string>();
                    else if (key == "seed_customers_per_segment")
                        config.seed_customers_per_segment = value.as<uint32_t>();
                    else if (key == "interactions_per_customer")
                        config.interactions_per_customer = value.as<uint32_t>();
                    else if (key == "bulk_recommendation_chains")
                        config.bulk_recommendation_chains = value.as<uint32_t>();
                    else if (key == "low_engagement_fraction")
                        config.low_engagement_fraction = value.as<double>();
                    else if (key == "segment_weights")
                        config.segment_weights = read_weights<kSegmentCount>(value, "segment_weights");
                    else if (key == "category_weights")
                        config.category_weights = read_weights<kCategoryCount>(value, "category_weights");
                    else if (key == "retry")
                        read_retry(value, config.retry);
                    else if (key == "worker_threads")
                        config.worker_threads = value.as<uint32_t>();
                    else if (key == "reference_time")
                        config.reference_time = value.as<int64_t>();
                    else if (key == "verbose")
                        config.verbose = value.as<bool>();
                    else
                        throw ConfigError("unknown key " + key);
                }
            }
            catch (const YAML::Exception &e)
            {
                throw ConfigError(std::string("malformed value: ") + e.what());
            }

            if (config.scale_tier != "custom" && (explicit_customers || explicit_products))
                throw ConfigError("customer_count/product_count are only honoured with scale_tier 'custom' (tier is '" +
                                  config.scale_tier + "')");
            if (config.scale_tier == "custom")
            {
                if (!explicit_customers)
                    throw ConfigError("scale_tier 'custom' requires customer_count");
                if (!explicit_products)
                    config.product_count = 0;
            }
            config.apply_scale_tier();
            return config;
        }
    } // namespace

    // =========================================================================
    // RetryPolicy
    // =========================================================================
    std::chrono::milliseconds RetryPolicy::delay(uint32_t attempt) const
    {
        if (attempt == 0)
            return std::chrono::milliseconds{0};

        const double factor = std::pow(backoff_multiplier, static_cast<double>(attempt - 1));
        return std::chrono::milliseconds(
            static_cast<int64_t>(static_cast<double>(initial_delay.count()) * factor));
    }

    // =========================================================================
    // GeneratorConfig
    // =========================================================================
    void GeneratorConfig::apply_scale_tier()
    {
        if (scale_tier == "1m")
        {
            customer_count = 1'000'000;
            product_count = 10'000;
            avg_transactions_per_customer = 8.0;
        }
        else if (scale_tier == "10m")
        {
            customer_count = 10'000'000;
            product_count = 25'000;
            avg_transactions_per_customer = 10.0;
        }
        else if (scale_tier == "100m")
        {
            customer_count = 100'000'000;
            product_count = 50'000;
            avg_transactions_per_customer = 12.0;
        }
        else if (scale_tier == "custom")
        {
            const auto defaults = defaults_for_count(customer_count);
            if (product_count == 0)
                product_count = defaults.products;
            avg_transactions_per_customer = defaults.avg_transactions;
        }
        else
        {
            throw ConfigError("unsupported scale_tier '" + scale_tier +
                              "' (expected 1m, 10m, 100m or custom)");
        }
    }

    uint64_t GeneratorConfig::bulk_customer_count() const
    {
        if (!include_seed_patterns)
            return customer_count;
        const uint64_t seeds = static_cast<uint64_t>(seed_customers_per_segment) * kSegmentCount;
        return customer_count > seeds ? customer_count - seeds : 0;
    }

    void GeneratorConfig::validate() const
    {
        static const std::set<std::string> kTiers = {"1m", "10m", "100m", "custom"};
        static const std::set<std::string> kCodecs = {"snappy", "gzip", "lz4", "zstd", "uncompressed", "none"};

        if (kTiers.count(scale_tier) == 0)
            throw ConfigError("unsupported scale_tier '" + scale_tier + "'");
        if (customer_count == 0)
            throw ConfigError("customer_count must be positive");
        if (product_count == 0)
            throw ConfigError("product_count must be positive");
        if (batch_size == 0)
            throw ConfigError("batch_size must be positive");
        if (single_file_max_rows > batch_size)
            throw ConfigError("single_file_max_rows must not exceed batch_size");
        if (kCodecs.count(compression) == 0)
            throw ConfigError("unsupported compression codec '" + compression + "'");
        if (retry.max_attempts == 0)
            throw ConfigError("retry.max_attempts must be at least 1");
        if (retry.initial_delay.count() < 0 || retry.backoff_multiplier < 1.0)
            throw ConfigError("retry delay must be >= 0 and backoff_multiplier >= 1.0");
        if (worker_threads == 0)
            throw ConfigError("worker_threads must be at least 1");
        if (low_engagement_fraction < 0.0 || low_engagement_fraction > 1.0)
            throw ConfigError("low_engagement_fraction must be within [0, 1]");
        if (include_seed_patterns && seed_customers_per_segment == 0)
            throw ConfigError("seed_customers_per_segment must be positive when seed patterns are enabled");
        if (include_seed_patterns &&
            customer_count < static_cast<uint64_t>(seed_customers_per_segment) * kSegmentCount)
            throw ConfigError("customer_count is smaller than the seed customer population");
        // Seed ids count up from 1 and must stay below the first bulk id.
        if (include_seed_patterns &&
            static_cast<uint64_t>(seed_customers_per_segment) * kSegmentCount >= kBulkEntityIdBase)
            throw ConfigError("seed_customers_per_segment must be below " +
                              std::to_string(kBulkEntityIdBase / kSegmentCount) +
                              " so seed ids stay below the bulk id range");

        check_weights(segment_weights, "segment_weights");
        check_weights(category_weights, "category_weights");
    }

    void GeneratorConfig::print() const
    {
        std::cout << "[CONFIG] Scale tier      : " << scale_tier << "\n";
        std::cout << "[CONFIG]   Customers     : " << customer_count
                  << " (" << bulk_customer_count() << " bulk)\n";
        std::cout << "[CONFIG]   Products      : " << product_count << "\n";
        std::cout << "[CONFIG]   Avg txns/cust : " << avg_transactions_per_customer << "\n";
        std::cout << "[CONFIG]   Seed          : " << master_seed << "\n";
        std::cout << "[CONFIG]   Batch size    : " << batch_size << "\n";
        std::cout << "[CONFIG]   Compression   : " << compression << "\n";
        std::cout << "[CONFIG]   Output dir    : " << output_dir << "\n";
        std::cout << "[CONFIG]   Overwrite     : " << (overwrite_existing ? "yes" : "no") << "\n";
        std::cout << "[CONFIG]   Seed patterns : " << (include_seed_patterns ? "yes" : "no") << "\n";
        std::cout << "[CONFIG]   Workers       : " << worker_threads << "\n";
    }

    // =========================================================================
    // ConfigLoader
    // =========================================================================
    GeneratorConfig ConfigLoader::load_from_yaml(const std::filesystem::path &path)
    {
        YAML::Node root;
        try
        {
            root = YAML::LoadFile(path.string());
        }
        catch (const YAML::Exception &e)
        {
            throw ConfigError("failed to load " + path.string() + ": " + e.what());
        }
        return from_node(root);
    }

    GeneratorConfig ConfigLoader::load_from_string(const std::string &yaml_text)
    {
        YAML::Node root;
        try
        {
            root = YAML::Load(yaml_text);
        }
        catch (const YAML::Exception &e)
        {
            throw ConfigError(std::string("failed to parse configuration: ") + e.what());
        }
        return from_node(root);
    }

    void ConfigLoader::apply_environment(GeneratorConfig &config)
    {
        try
        {
            if (const char *v = std::getenv("CUSTOMER_SCALE"))
            {
                const uint64_t scale = std::stoull(v);
                if (scale == 1'000'000)
                    config.scale_tier = "1m";
                else if (scale == 10'000'000)
                    config.scale_tier = "10m";
                else if (scale == 100'000'000)
                    config.scale_tier = "100m";
                else
                {
                    config.scale_tier = "custom";
                    config.customer_count = scale;
                    config.product_count = 0;
                }
                config.apply_scale_tier();
            }
            if (const char *v = std::getenv("RANDOM_SEED"))
                config.master_seed = std::stoull(v);
            if (const char *v = std::getenv("BATCH_FILE_SIZE"))
            {
                config.batch_size = std::stoull(v);
                config.single_file_max_rows = config.batch_size;
            }
        }
        catch (const std::logic_error &e)
        {
            throw ConfigError(std::string("invalid numeric environment override: ") + e.what());
        }

        if (const char *v = std::getenv("DATA_OUTPUT_DIR"))
            config.output_dir = v;
        if (const char *v = std::getenv("PARQUET_COMPRESSION"))
            config.compression = v;
        if (const char *v = std::getenv("OVERWRITE_EXISTING_DATA"))
            config.overwrite_existing = parse_bool(v);
        if (const char *v = std::getenv("VERBOSE_LOGGING"))
            config.verbose = parse_bool(v);
    }

} // namespace RetailForge
