#include <filesystem>
#include <iostream>
#include "../config/GeneratorConfig.hpp"
#include "../pipeline/GenerationPipeline.hpp"

// ============================================================================
// generate_data — writes the customers / products / transactions /
// interactions tables as Parquet
//
// Usage:
//   ./generate_data                     defaults (1m tier, seed 42, ./data)
//   ./generate_data config.yaml         settings from YAML
//
// Environment overrides are applied on top of either:
//   CUSTOMER_SCALE  RANDOM_SEED  BATCH_FILE_SIZE  DATA_OUTPUT_DIR
//   PARQUET_COMPRESSION  OVERWRITE_EXISTING_DATA  VERBOSE_LOGGING
//
// Exit codes:
//   0  every table written (or skipped as already complete)
//   1  configuration error or fatal failure
//   2  partial success: at least one chunk failed after all retries
// ============================================================================
int main(int argc, char *argv[])
{
    std::ios_base::sync_with_stdio(false);

    std::cout << "===================================================\n";
    std::cout << "   RetailForge — Synthetic Retail Data Generator\n";
    std::cout << "===================================================\n\n";

    try
    {
        RetailForge::GeneratorConfig config;
        if (argc > 1)
        {
            const std::filesystem::path config_path = argv[1];
            std::cout << "[CONFIG] Loading " << config_path.string() << "\n";
            config = RetailForge::ConfigLoader::load_from_yaml(config_path);
        }
        else
        {
            config.apply_scale_tier();
        }
        RetailForge::ConfigLoader::apply_environment(config);

        RetailForge::GenerationPipeline pipeline(config);
        const auto report = pipeline.run();

        if (report.has_failures())
        {
            std::cerr << "[PIPELINE] Finished with failed chunks. Re-run with overwrite_existing "
                      << "to regenerate the affected tables.\n";
            return 2;
        }

        std::cout << "[SUCCESS] Data written to " << config.output_dir.string() << "\n";
        std::cout << "===================================================\n";
    }
    catch (const RetailForge::ConfigError &e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[CRITICAL ERROR] Generation failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
