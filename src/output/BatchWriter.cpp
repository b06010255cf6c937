#include "BatchWriter.hpp"

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace RetailForge
{

    namespace
    {
        constexpr const char *kArtifactSuffix = ".parquet";
        constexpr const char *kTemporarySuffix = ".tmp";

        // Removes leftovers of an interrupted run. Completed artifacts are
        // never touched here.
        void remove_temporaries(const std::filesystem::path &dir)
        {
            for (const auto &entry : std::filesystem::directory_iterator(dir))
            {
                if (entry.is_regular_file() && entry.path().extension() == kTemporarySuffix)
                {
                    std::cout << "[BATCH] Removing stale " << entry.path().filename().string() << "\n";
                    std::filesystem::remove(entry.path());
                }
            }
        }
    } // namespace

    BatchWriter::BatchWriter(BatchWriterOptions options)
        : options_(std::move(options))
    {
        if (options_.retry.max_attempts == 0)
            throw std::invalid_argument("BatchWriter: retry.max_attempts must be at least 1");
    }

    std::filesystem::path BatchWriter::table_dir(const std::string &table) const
    {
        return options_.output_dir / table;
    }

    std::filesystem::path BatchWriter::batch_artifact_name(const std::string &table, uint64_t sequence)
    {
        char seq[32];
        std::snprintf(seq, sizeof(seq), "%04llu", static_cast<unsigned long long>(sequence));
        return table + "_batch_" + seq + kArtifactSuffix;
    }

    std::filesystem::path BatchWriter::single_artifact_name(const std::string &table)
    {
        return table + kArtifactSuffix;
    }

    bool BatchWriter::has_completed_artifacts(const std::filesystem::path &dir)
    {
        if (!std::filesystem::is_directory(dir))
            return false;
        for (const auto &entry : std::filesystem::directory_iterator(dir))
        {
            if (entry.is_regular_file() && entry.path().extension() == kArtifactSuffix)
                return true;
        }
        return false;
    }

    bool BatchWriter::prepare(const std::string &table)
    {
        const auto dir = table_dir(table);

        if (has_completed_artifacts(dir))
        {
            if (!options_.overwrite)
                return false;

            // All-or-nothing: old and new chunks never share a directory.
            std::cout << "[BATCH] " << table << ": overwrite enabled, purging " << dir.string() << "\n";
            std::filesystem::remove_all(dir);
        }

        std::filesystem::create_directories(dir);
        remove_temporaries(dir);
        return true;
    }

    // =========================================================================
    // persist() — tmp write and rename under the retry policy
    // =========================================================================
    // An artifact becomes visible only through rename():
    //
    //   attempt 1:  write customers_batch_0003.parquet.tmp  -> throws
    //               remove the .tmp, sleep retry.delay(1)
    //   attempt 2:  write customers_batch_0003.parquet.tmp  -> ok
    //               rename to customers_batch_0003.parquet
    //
    // The .tmp sits next to its final name, so both are on one filesystem and
    // the rename is atomic. A process killed mid-write leaves at most a .tmp,
    // which prepare() deletes on the next run, and has_completed_artifacts()
    // only counts names ending in .parquet. A directory holding any .parquet
    // file therefore holds only complete footers.
    //
    // Returns false once every attempt has failed; the caller records the
    // chunk and moves on.
    // =========================================================================
    bool BatchWriter::persist(const std::function<void(const std::filesystem::path &)> &write_tmp,
                              const std::filesystem::path &final_path)
    {
        auto tmp = final_path;
        tmp += kTemporarySuffix;

        for (uint32_t attempt = 1; attempt <= options_.retry.max_attempts; ++attempt)
        {
            try
            {
                write_tmp(tmp);
                std::filesystem::rename(tmp, final_path);
                return true;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[BATCH] Write attempt " << attempt << "/" << options_.retry.max_attempts
                          << " for " << final_path.filename().string() << " failed: " << e.what() << "\n";
            }

            std::error_code ec;
            std::filesystem::remove(tmp, ec);

            if (attempt < options_.retry.max_attempts)
            {
                const auto wait = options_.retry.delay(attempt);
                if (wait.count() > 0)
                    std::this_thread::sleep_for(wait);
            }
        }
        return false;
    }

} // namespace RetailForge
