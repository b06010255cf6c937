#pragma once

// ============================================================================
// ChunkSequence — restartable chunked row streams
// ============================================================================
// A table is never materialized in full. Each table is a RowSource that can
// append "up to N more rows" to a buffer and can be rewound to its first row.
// ChunkSequence cuts that stream into fixed-size chunks numbered from 0:
//
//   RowSource ──fill(buf, N)──> ChunkSequence ──next()──> Chunk{seq, rows}
//
// Chunk boundaries depend only on batch_size, and the row order depends only
// on the source, so writing with batch_size = 1000 or batch_size = 10^6
// produces the same rows in the same order.
// ============================================================================

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace RetailForge
{

    template <typename Row>
    class RowSource
    {
    public:
        virtual ~RowSource() = default;

        // Appends at most max_rows rows to out. Returns the number appended;
        // 0 means the source is exhausted.
        virtual size_t fill(std::vector<Row> &out, size_t max_rows) = 0;

        // Rewinds to the first row. The next fill() calls reproduce the same
        // rows as the first pass.
        virtual void reset() = 0;
    };

    // ----------------------------------------------------------------------------
    // VectorSource — rows already held in memory (seed tables, products)
    // ----------------------------------------------------------------------------
    template <typename Row>
    class VectorSource : public RowSource<Row>
    {
    public:
        explicit VectorSource(std::vector<Row> rows)
            : rows_(std::move(rows)) {}

        size_t fill(std::vector<Row> &out, size_t max_rows) override
        {
            const size_t n = std::min(max_rows, rows_.size() - cursor_);
            out.insert(out.end(), rows_.begin() + cursor_, rows_.begin() + cursor_ + n);
            cursor_ += n;
            return n;
        }

        void reset() override { cursor_ = 0; }

    private:
        std::vector<Row> rows_;
        size_t cursor_ = 0;
    };

    // ----------------------------------------------------------------------------
    // ConcatSource — seed rows first, then bulk rows
    // ----------------------------------------------------------------------------
    template <typename Row>
    class ConcatSource : public RowSource<Row>
    {
    public:
        ConcatSource() = default;

        void append(std::unique_ptr<RowSource<Row>> part)
        {
            if (!part)
                throw std::invalid_argument("ConcatSource::append: null source");
            parts_.push_back(std::move(part));
        }

        size_t fill(std::vector<Row> &out, size_t max_rows) override
        {
            size_t appended = 0;
            while (appended < max_rows && current_ < parts_.size())
            {
                const size_t n = parts_[current_]->fill(out, max_rows - appended);
                if (n == 0)
                    ++current_;
                appended += n;
            }
            return appended;
        }

        void reset() override
        {
            for (auto &p : parts_)
                p->reset();
            current_ = 0;
        }

    private:
        std::vector<std::unique_ptr<RowSource<Row>>> parts_;
        size_t current_ = 0;
    };

    template <typename Row>
    struct Chunk
    {
        uint64_t sequence = 0;
        std::vector<Row> rows;
    };

    // ============================================================================
    // ChunkSequence
    // ============================================================================
    template <typename Row>
    class ChunkSequence
    {
    public:
        ChunkSequence(std::unique_ptr<RowSource<Row>> source, size_t chunk_rows)
            : source_(std::move(source)), chunk_rows_(chunk_rows)
        {
            if (!source_)
                throw std::invalid_argument("ChunkSequence: null source");
            if (chunk_rows_ == 0)
                throw std::invalid_argument("ChunkSequence: chunk size must be positive");
        }

        // Returns the next chunk, or nullopt once the source is exhausted.
        // Every chunk except the last holds exactly chunk_rows rows.
        std::optional<Chunk<Row>> next()
        {
            if (exhausted_)
                return std::nullopt;

            Chunk<Row> chunk;
            chunk.sequence = next_sequence_;
            chunk.rows.reserve(chunk_rows_);

            while (chunk.rows.size() < chunk_rows_)
            {
                const size_t n = source_->fill(chunk.rows, chunk_rows_ - chunk.rows.size());
                if (n == 0)
                {
                    exhausted_ = true;
                    break;
                }
            }

            if (chunk.rows.empty())
                return std::nullopt;

            ++next_sequence_;
            return chunk;
        }

        void reset()
        {
            source_->reset();
            next_sequence_ = 0;
            exhausted_ = false;
        }

        size_t chunk_rows() const { return chunk_rows_; }

    private:
        std::unique_ptr<RowSource<Row>> source_;
        size_t chunk_rows_;
        uint64_t next_sequence_ = 0;
        bool exhausted_ = false;
    };

} // namespace RetailForge
