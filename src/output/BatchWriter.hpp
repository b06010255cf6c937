#pragma once

// ============================================================================
// BatchWriter — idempotent, resumable per-table persistence
// ============================================================================
// Layout for a table named T under output_dir:
//
//   output_dir/T/T_batch_0000.parquet      batch mode, one file per chunk
//   output_dir/T/T_batch_0001.parquet
//   ...
//   output_dir/T/T.parquet                 single-file mode
//
// Per table:
//   1. Completed artifacts present and overwrite off  -> skip, nothing written.
//      Completed artifacts present and overwrite on   -> purge, then write.
//   2. Leftover *.tmp files from an interrupted run are removed.
//   3. If the whole table fits in single_file_max_rows it becomes T.parquet,
//      otherwise every chunk becomes T_batch_<seq>.parquet.
//   4. Each artifact is written to "<name>.tmp" and renamed on success, so a
//      ".parquet" suffix always means a complete file.
//   5. A failed write is retried under the RetryPolicy. A chunk that
//      exhausts its attempts is recorded in failed_chunks and the remaining
//      chunks are still written.
// ============================================================================

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../config/GeneratorConfig.hpp"
#include "../stream/ChunkSequence.hpp"
#include "ParquetWriter.hpp"

namespace RetailForge
{

    // ============================================================================
    // ArtifactWriter — persists one chunk to one path
    // ============================================================================
    template <typename Row>
    class ArtifactWriter
    {
    public:
        virtual ~ArtifactWriter() = default;

        // Throws on failure. 'path' is the temporary name; the caller renames.
        virtual void write(const std::vector<Row> &rows, const std::filesystem::path &path) = 0;
    };

    template <typename Row>
    class ParquetArtifactWriter : public ArtifactWriter<Row>
    {
    public:
        explicit ParquetArtifactWriter(std::string compression)
            : compression_(std::move(compression)) {}

        void write(const std::vector<Row> &rows, const std::filesystem::path &path) override
        {
            encode_ns_ += ParquetWriter::write(rows, path, compression_);
        }

        // Time spent inside ParquetWriter across every attempt.
        long long encode_ns() const { return encode_ns_; }

    private:
        std::string compression_;
        long long encode_ns_ = 0;
    };

    // ============================================================================
    // TableReport — outcome of one table
    // ============================================================================
    struct TableReport
    {
        std::string table;
        uint64_t rows_written = 0;
        uint64_t artifacts = 0;
        uint64_t invalid_rows = 0;
        bool skipped = false;
        bool single_file = false;
        std::vector<uint64_t> failed_chunks;
        long long duration_ns = 0;

        bool ok() const { return failed_chunks.empty(); }
    };

    struct BatchWriterOptions
    {
        std::filesystem::path output_dir;
        uint64_t single_file_max_rows = 100'000;
        bool overwrite = false;
        bool verbose = false;
        RetryPolicy retry;

        static BatchWriterOptions from(const GeneratorConfig &config)
        {
            return BatchWriterOptions{config.output_dir, config.single_file_max_rows,
                                      config.overwrite_existing, config.verbose, config.retry};
        }
    };

    class BatchWriter
    {
    public:
        explicit BatchWriter(BatchWriterOptions options);

        // Counts rows failing validation in one chunk. Rows are written anyway.
        template <typename Row>
        using RowCheck = std::function<uint64_t(const std::vector<Row> &)>;

        // Writes every chunk of 'chunks' for 'table'. The sequence is read
        // from its current position; it is not reset here.
        template <typename Row>
        TableReport write_table(const std::string &table,
                                ChunkSequence<Row> &chunks,
                                ArtifactWriter<Row> &writer,
                                const RowCheck<Row> &check = {});

        std::filesystem::path table_dir(const std::string &table) const;

        static std::filesystem::path batch_artifact_name(const std::string &table, uint64_t sequence);
        static std::filesystem::path single_artifact_name(const std::string &table);

        // True if 'dir' holds at least one completed (*.parquet) artifact.
        static bool has_completed_artifacts(const std::filesystem::path &dir);

        const BatchWriterOptions &options() const { return options_; }

    private:
        // Prepares the table directory. Returns false when the table is
        // skipped because completed artifacts exist and overwrite is off.
        bool prepare(const std::string &table);

        // tmp-write + rename under the retry policy. Returns false once every
        // attempt failed.
        bool persist(const std::function<void(const std::filesystem::path &)> &write_tmp,
                     const std::filesystem::path &final_path);

        BatchWriterOptions options_;
    };

    // ============================================================================
    // write_table()
    // ============================================================================
    // Single-file detection needs at most one chunk of lookahead: the table
    // is single-file exactly when the first chunk fits the threshold and no
    // second chunk follows.
    // ============================================================================
    template <typename Row>
    TableReport BatchWriter::write_table(const std::string &table,
                                         ChunkSequence<Row> &chunks,
                                         ArtifactWriter<Row> &writer,
                                         const RowCheck<Row> &check)
    {
        auto t0 = std::chrono::steady_clock::now();
        TableReport report;
        report.table = table;

        if (!prepare(table))
        {
            report.skipped = true;
            std::cout << "[BATCH] " << table << ": completed artifacts found, skipping "
                      << "(set overwrite_existing to regenerate)\n";
            return report;
        }

        const auto dir = table_dir(table);

        auto write_chunk = [&](const Chunk<Row> &chunk, const std::filesystem::path &name)
        {
            if (check)
                report.invalid_rows += check(chunk.rows);

            const bool ok = persist(
                [&](const std::filesystem::path &tmp)
                { writer.write(chunk.rows, tmp); },
                dir / name);

            if (ok)
            {
                report.rows_written += chunk.rows.size();
                ++report.artifacts;
                if (options_.verbose)
                    std::cout << "[BATCH] " << table << ": wrote " << name.string()
                              << " (" << chunk.rows.size() << " rows)\n";
            }
            else
            {
                report.failed_chunks.push_back(chunk.sequence);
                std::cerr << "[BATCH] " << table << ": chunk " << chunk.sequence
                          << " FAILED after " << options_.retry.max_attempts << " attempts\n";
            }
        };

        auto first = chunks.next();
        if (!first)
        {
            std::cout << "[BATCH] " << table << ": no rows, nothing written\n";
            return report;
        }

        std::optional<Chunk<Row>> second;
        if (first->rows.size() <= options_.single_file_max_rows)
            second = chunks.next();

        if (first->rows.size() <= options_.single_file_max_rows && !second)
        {
            report.single_file = true;
            write_chunk(*first, single_artifact_name(table));
        }
        else
        {
            write_chunk(*first, batch_artifact_name(table, first->sequence));
            first.reset();
            if (second)
            {
                write_chunk(*second, batch_artifact_name(table, second->sequence));
                second.reset();
            }
            while (auto chunk = chunks.next())
                write_chunk(*chunk, batch_artifact_name(table, chunk->sequence));
        }

        report.duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                                 std::chrono::steady_clock::now() - t0)
                                 .count();

        std::cout << "[BATCH] " << table << ": " << report.rows_written << " rows in "
                  << report.artifacts << (report.single_file ? " file" : " batch file(s)");
        if (!report.failed_chunks.empty())
            std::cout << ", " << report.failed_chunks.size() << " failed chunk(s)";
        std::cout << "\n";
        return report;
    }

} // namespace RetailForge
