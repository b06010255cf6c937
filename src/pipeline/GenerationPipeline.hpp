#pragma once

// ============================================================================
// GenerationPipeline — end-to-end run
// ============================================================================
//
//   validate config
//        │
//   SeedCatalog ──────────────┐         (skipped when seed patterns are off)
//   EntityGenerator ──────────┤
//        │                    ▼
//        └────────> GenerationContext (read-only from here on)
//                             │
//                      PatternInjector
//                             │
//        ┌──────────┬─────────┴─────┬──────────────┐
//   customers   products      transactions    interactions    one job each
//        └──────────┴───────┬───────┴──────────────┘          on the ThreadPool
//                       BatchWriter
//                           │
//                       RunReport
//
// Table contents, in row order:
//   customers     seed customers, then bulk customers
//   products      seed products, then bulk products
//   transactions  pattern transactions, then bulk transactions
//   interactions  seed interactions, then bulk interactions
// ============================================================================

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../config/GeneratorConfig.hpp"
#include "../context/GenerationContext.hpp"
#include "../generator/EntityGenerator.hpp"
#include "../generator/PatternInjector.hpp"
#include "../generator/SeedCatalog.hpp"
#include "../output/BatchWriter.hpp"
#include "../report/RunReport.hpp"
#include "../stream/ChunkSequence.hpp"

namespace RetailForge
{

    inline constexpr const char *kCustomersTable = "customers";
    inline constexpr const char *kProductsTable = "products";
    inline constexpr const char *kTransactionsTable = "transactions";
    inline constexpr const char *kInteractionsTable = "interactions";

    class GenerationPipeline
    {
    public:
        // Throws ConfigError if the config does not validate.
        explicit GenerationPipeline(GeneratorConfig config);

        // Builds seeds, bulk entities, the context and the patterns. Called by
        // run(); callable on its own to inspect tables without writing them.
        void prepare();

        // prepare() if needed, then writes every table. Table jobs that throw
        // rethrow here; chunk write failures are reported, not thrown.
        RunReport run();

        // Full row streams per table. Valid after prepare().
        [[nodiscard]] std::unique_ptr<RowSource<Customer>> customer_source() const;
        [[nodiscard]] std::unique_ptr<RowSource<Product>> product_source() const;
        [[nodiscard]] std::unique_ptr<RowSource<Transaction>> transaction_source() const;
        [[nodiscard]] std::unique_ptr<RowSource<Interaction>> interaction_source() const;

        const GeneratorConfig &config() const { return config_; }
        const GenerationContext &context() const;
        const PatternResult &patterns() const { return patterns_; }
        const std::optional<SeedCatalog> &seeds() const { return seeds_; }
        bool prepared() const { return context_ != nullptr; }

        // Members hold references into config_.
        GenerationPipeline(const GenerationPipeline &) = delete;
        GenerationPipeline &operator=(const GenerationPipeline &) = delete;

    private:
        template <typename Row>
        TableReport write(BatchWriter &writer, const std::string &table,
                          std::unique_ptr<RowSource<Row>> source) const;

        GeneratorConfig config_;
        EntityGenerator entities_;
        std::optional<SeedCatalog> seeds_;
        std::unique_ptr<GenerationContext> context_;
        PatternResult patterns_;
        std::vector<StageResult> stages_;
    };

} // namespace RetailForge
