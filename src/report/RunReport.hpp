#pragma once

// ============================================================================
// RunReport — stage timings, per-table outcomes and pattern outcomes
// ============================================================================
// StageTimer is a scoped timer: construction records the start, destruction
// appends a StageResult, so a stage is timed even when it throws.
//
//   std::vector<StageResult> stages;
//   {
//       StageTimer t("Seed catalog", 50, stages);
//       ...
//   }
// ============================================================================

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "../generator/PatternInjector.hpp"
#include "../output/BatchWriter.hpp"

namespace RetailForge
{

    struct StageResult
    {
        std::string label;
        long long duration_ns;
        size_t item_count;

        double duration_ms() const
        {
            return static_cast<double>(duration_ns) / 1'000'000.0;
        }

        double items_per_second() const
        {
            if (duration_ns == 0)
                return 0.0;
            return static_cast<double>(item_count) * 1'000'000'000.0 / static_cast<double>(duration_ns);
        }
    };

    class StageTimer
    {
    public:
        using Clock = std::chrono::steady_clock;

        StageTimer(std::string label, size_t item_count, std::vector<StageResult> &results)
            : label_(std::move(label)), item_count_(item_count), results_(results), start_(Clock::now())
        {
        }

        // Item count known only once the stage has run.
        void set_item_count(size_t n) { item_count_ = n; }

        ~StageTimer()
        {
            auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                                   Clock::now() - start_)
                                   .count();
            results_.push_back({label_, duration_ns, item_count_});
        }

        StageTimer(const StageTimer &) = delete;
        StageTimer &operator=(const StageTimer &) = delete;

    private:
        std::string label_;
        size_t item_count_;
        std::vector<StageResult> &results_;
        Clock::time_point start_;
    };

    struct RunReport
    {
        std::vector<StageResult> stages;
        std::vector<TableReport> tables;
        std::vector<PatternOutcome> patterns;

        bool has_failures() const
        {
            for (const auto &t : tables)
            {
                if (!t.ok())
                    return true;
            }
            return false;
        }

        const TableReport *table(const std::string &name) const
        {
            for (const auto &t : tables)
            {
                if (t.table == name)
                    return &t;
            }
            return nullptr;
        }
    };

    inline void print_run_report(const RunReport &report)
    {
        std::cout << "\n";
        std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
        std::cout << "║                RetailForge — Generation Report               ║\n";
        std::cout << "╠══════════════════════════╦═══════════════╦═══════════════════╣\n";
        std::cout << "║ Stage                    ║  Duration(ms) ║          rows/sec ║\n";
        std::cout << "╠══════════════════════════╬═══════════════╬═══════════════════╣\n";

        long long total_ns = 0;
        for (const auto &s : report.stages)
        {
            total_ns += s.duration_ns;
            std::cout << "║ "
                      << std::left << std::setw(24) << s.label
                      << " ║ "
                      << std::right << std::fixed << std::setprecision(3)
                      << std::setw(13) << s.duration_ms()
                      << " ║ "
                      << std::right << std::fixed << std::setprecision(0)
                      << std::setw(17) << s.items_per_second()
                      << " ║\n";
        }
        std::cout << "╠══════════════════════════╬═══════════════╬═══════════════════╣\n";
        std::cout << "║ "
                  << std::left << std::setw(24) << "TOTAL"
                  << " ║ "
                  << std::right << std::fixed << std::setprecision(3)
                  << std::setw(13) << static_cast<double>(total_ns) / 1'000'000.0
                  << " ║                   ║\n";
        std::cout << "╚══════════════════════════╩═══════════════╩═══════════════════╝\n\n";

        std::cout << "┌──────────────┬──────────────┬───────────┬─────────┬──────────┬──────────┐\n";
        std::cout << "│ Table        │         Rows │ Artifacts │ Invalid │ Mode     │ Failed   │\n";
        std::cout << "├──────────────┼──────────────┼───────────┼─────────┼──────────┼──────────┤\n";
        for (const auto &t : report.tables)
        {
            const char *mode = t.skipped ? "skipped" : (t.single_file ? "single" : "batched");
            std::cout << "│ " << std::left << std::setw(12) << t.table
                      << " │ " << std::right << std::setw(12) << t.rows_written
                      << " │ " << std::setw(9) << t.artifacts
                      << " │ " << std::setw(7) << t.invalid_rows
                      << " │ " << std::left << std::setw(8) << mode
                      << " │ " << std::right << std::setw(8) << t.failed_chunks.size()
                      << " │\n";
        }
        std::cout << "└──────────────┴──────────────┴───────────┴─────────┴──────────┴──────────┘\n";

        for (const auto &t : report.tables)
        {
            if (t.failed_chunks.empty())
                continue;
            std::cout << "[PIPELINE] " << t.table << " failed chunks:";
            for (uint64_t id : t.failed_chunks)
                std::cout << " " << id;
            std::cout << "\n";
        }

        size_t skipped = 0;
        for (const auto &p : report.patterns)
        {
            if (p.skipped)
            {
                ++skipped;
                std::cout << "[PIPELINE] pattern " << p.name << " skipped: " << p.reason << "\n";
            }
        }
        std::cout << "[PIPELINE] Patterns: " << report.patterns.size() - skipped << " injected, "
                  << skipped << " skipped\n";
    }

} // namespace RetailForge
