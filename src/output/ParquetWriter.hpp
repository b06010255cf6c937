#pragma once

// ============================================================================
// ParquetWriter — row chunks to Apache Parquet
// ============================================================================
// One overload per table. Each converts a chunk of rows into an Arrow table
// (one builder per column) and writes it as a single row group:
//
//   vector<Row> ──builders──> arrow::Table ──WriteTable──> file.parquet
//
// Column types:
//   identifiers          uint64
//   money                float64, rounded to cents upstream
//   enum-like strings    dictionary<utf8>  (segment, category, brand, channel,
//                                           status, interaction type, device)
//   calendar dates       date32
//   event times          timestamp[s], UTC
//
// The writer embeds the Arrow schema in the footer and nothing run-specific
// (no wall-clock time, no hostname), so equal input gives equal bytes.
// ============================================================================

#include <filesystem>
#include <string>
#include <vector>
#include "../model/Entities.hpp"

namespace RetailForge
{

    class ParquetWriter
    {
    public:
        // Each write() throws std::runtime_error if an Arrow/Parquet call
        // fails or the codec name is unknown. Returns the duration in
        // nanoseconds.
        [[nodiscard]]
        static long long write(const std::vector<Customer> &rows,
                               const std::filesystem::path &output_path,
                               const std::string &compression);

        [[nodiscard]]
        static long long write(const std::vector<Product> &rows,
                               const std::filesystem::path &output_path,
                               const std::string &compression);

        [[nodiscard]]
        static long long write(const std::vector<Transaction> &rows,
                               const std::filesystem::path &output_path,
                               const std::string &compression);

        [[nodiscard]]
        static long long write(const std::vector<Interaction> &rows,
                               const std::filesystem::path &output_path,
                               const std::string &compression);
    };

} // namespace RetailForge
