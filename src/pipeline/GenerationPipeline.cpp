#include "GenerationPipeline.hpp"

#include <future>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <utility>
#include "../generator/TransactionSynthesizer.hpp"
#include "../output/ParquetWriter.hpp"
#include "../threading/ThreadPool.hpp"
#include "../validator/EntityValidator.hpp"

namespace RetailForge
{

    GenerationPipeline::GenerationPipeline(GeneratorConfig config)
        : config_(std::move(config)),
          entities_(config_)
    {
    }

    const GenerationContext &GenerationPipeline::context() const
    {
        if (!context_)
            throw std::logic_error("GenerationPipeline::context: prepare() has not run");
        return *context_;
    }

    // =========================================================================
    // prepare()
    // =========================================================================
    void GenerationPipeline::prepare()
    {
        if (context_)
            return;

        std::vector<Customer> seed_customers;
        std::vector<CustomerProfile> profiles;
        std::vector<Product> products;

        if (config_.include_seed_patterns)
        {
            StageTimer t("Seed catalog", 0, stages_);
            seeds_.emplace(SeedCatalog::build(config_.seed_customers_per_segment, config_.reference_time));
            seed_customers = seeds_->customers();
            profiles = seeds_->profiles();
            products = seeds_->products();
            t.set_item_count(seed_customers.size() + products.size());
        }
        else
        {
            std::cout << "[PIPELINE] Seed patterns disabled: bulk data only\n";
        }

        {
            StageTimer t("Bulk products", config_.product_count, stages_);
            auto bulk = entities_.generate_products();
            products.insert(products.end(),
                            std::make_move_iterator(bulk.begin()),
                            std::make_move_iterator(bulk.end()));
        }

        {
            StageTimer t("Customer profiles", entities_.bulk_customer_count(), stages_);
            auto bulk = entities_.generate_customer_profiles();
            profiles.insert(profiles.end(), bulk.begin(), bulk.end());
        }

        {
            StageTimer t("Context", products.size(), stages_);
            auto index = EntityGenerator::build_product_index(products);
            context_ = std::make_unique<GenerationContext>(
                std::move(seed_customers), std::move(profiles), std::move(products), std::move(index));
        }

        if (seeds_)
        {
            StageTimer t("Pattern injection", 0, stages_);
            PatternInjector injector(config_, *seeds_);
            patterns_ = injector.inject(*context_);
            t.set_item_count(patterns_.transactions.size() + patterns_.interactions.size());
        }

        const auto estimated = static_cast<uint64_t>(
            static_cast<double>(context_->customer_count()) * config_.avg_transactions_per_customer);
        std::cout << "[PIPELINE] Context ready: " << context_->customer_count() << " customers, "
                  << context_->products().size() << " products, ~" << estimated
                  << " transactions expected for tier " << config_.scale_tier << "\n";
    }

    // =========================================================================
    // Table sources
    // =========================================================================
    std::unique_ptr<RowSource<Customer>> GenerationPipeline::customer_source() const
    {
        auto source = std::make_unique<ConcatSource<Customer>>();
        const auto seeds = context().seed_customers();
        source->append(std::make_unique<VectorSource<Customer>>(
            std::vector<Customer>(seeds.begin(), seeds.end())));
        source->append(entities_.customer_source());
        return source;
    }

    std::unique_ptr<RowSource<Product>> GenerationPipeline::product_source() const
    {
        const auto products = context().products();
        return std::make_unique<VectorSource<Product>>(
            std::vector<Product>(products.begin(), products.end()));
    }

    std::unique_ptr<RowSource<Transaction>> GenerationPipeline::transaction_source() const
    {
        auto source = std::make_unique<ConcatSource<Transaction>>();
        source->append(std::make_unique<VectorSource<Transaction>>(patterns_.transactions));
        source->append(TransactionSynthesizer(config_, context()).transaction_source());
        return source;
    }

    std::unique_ptr<RowSource<Interaction>> GenerationPipeline::interaction_source() const
    {
        auto source = std::make_unique<ConcatSource<Interaction>>();
        source->append(std::make_unique<VectorSource<Interaction>>(patterns_.interactions));
        source->append(TransactionSynthesizer(config_, context()).interaction_source());
        return source;
    }

    template <typename Row>
    TableReport GenerationPipeline::write(BatchWriter &writer, const std::string &table,
                                          std::unique_ptr<RowSource<Row>> source) const
    {
        ChunkSequence<Row> chunks(std::move(source), config_.batch_size);
        ParquetArtifactWriter<Row> artifact(config_.compression);
        auto report = writer.write_table<Row>(table, chunks, artifact,
                                              [&table](const std::vector<Row> &rows)
                                              { return EntityValidator::count_invalid(rows, table); });
        if (!report.skipped)
            std::cout << "[PARQUET] " << table << ": encoding took "
                      << static_cast<double>(artifact.encode_ns()) / 1'000'000.0 << " ms\n";
        return report;
    }

    // =========================================================================
    // run()
    // =========================================================================
    RunReport GenerationPipeline::run()
    {
        config_.print();
        prepare();

        BatchWriter writer(BatchWriterOptions::from(config_));
        RunReport report;

        {
            ThreadPool pool(config_.worker_threads);
            std::cout << "[PIPELINE] Writing 4 tables with " << pool.worker_count()
                      << " worker thread(s)...\n";

            std::vector<std::future<TableReport>> jobs;
            jobs.push_back(pool.submit([&]
                                       { return write(writer, kCustomersTable, customer_source()); }));
            jobs.push_back(pool.submit([&]
                                       { return write(writer, kProductsTable, product_source()); }));
            jobs.push_back(pool.submit([&]
                                       { return write(writer, kTransactionsTable, transaction_source()); }));
            jobs.push_back(pool.submit([&]
                                       { return write(writer, kInteractionsTable, interaction_source()); }));

            for (auto &job : jobs)
                report.tables.push_back(job.get());
        }

        report.stages = stages_;
        for (const auto &t : report.tables)
            report.stages.push_back({"Write " + t.table, t.duration_ns, static_cast<size_t>(t.rows_written)});
        report.patterns = patterns_.outcomes;

        print_run_report(report);
        return report;
    }

} // namespace RetailForge
