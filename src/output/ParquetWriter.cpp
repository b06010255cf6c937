#include "ParquetWriter.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string_view>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

// Arrow calls return arrow::Status; any failure becomes std::runtime_error.
#define RETAILFORGE_THROW_IF_NOT_OK(expr)                 \
    do                                                    \
    {                                                     \
        ::arrow::Status _s = (expr);                      \
        if (!_s.ok())                                     \
        {                                                 \
            throw std::runtime_error(                     \
                std::string("[PARQUET ERROR] ") + #expr + \
                " -> " + _s.ToString());                  \
        }                                                 \
    } while (0)

namespace RetailForge
{

    namespace
    {
        struct Codec
        {
            std::string_view name;
            arrow::Compression::type type;
        };

        constexpr Codec kCodecs[] = {
            {"snappy", arrow::Compression::SNAPPY},
            {"gzip", arrow::Compression::GZIP},
            {"lz4", arrow::Compression::LZ4},
            {"zstd", arrow::Compression::ZSTD},
            {"uncompressed", arrow::Compression::UNCOMPRESSED},
            {"none", arrow::Compression::UNCOMPRESSED},
        };

        arrow::Compression::type codec_of(const std::string &name)
        {
            for (const auto &c : kCodecs)
            {
                if (c.name == name)
                    return c.type;
            }
            throw std::runtime_error("[PARQUET ERROR] Unknown compression codec: " + name);
        }

        std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder &builder)
        {
            std::shared_ptr<arrow::Array> out;
            RETAILFORGE_THROW_IF_NOT_OK(builder.Finish(&out));
            return out;
        }

        // Dictionary index width is chosen by the builder, so the schema is
        // taken from the finished arrays rather than declared up front.
        std::shared_ptr<arrow::Table> make_table(
            const std::vector<std::string> &names,
            const std::vector<std::shared_ptr<arrow::Array>> &columns)
        {
            arrow::FieldVector fields;
            fields.reserve(columns.size());
            for (size_t i = 0; i < columns.size(); ++i)
                fields.push_back(arrow::field(names[i], columns[i]->type(), /*nullable=*/false));
            return arrow::Table::Make(arrow::schema(fields), columns);
        }

        // =====================================================================
        // write_table() — Arrow table to one Parquet file, one row group
        // =====================================================================
        long long write_table(const arrow::Table &table,
                              const std::filesystem::path &output_path,
                              const std::string &compression)
        {
            auto t0 = std::chrono::steady_clock::now();
            const auto codec = codec_of(compression);

            auto outfile_result = arrow::io::FileOutputStream::Open(output_path.string());
            if (!outfile_result.ok())
            {
                throw std::runtime_error(
                    "[PARQUET ERROR] Cannot create output file: " +
                    output_path.string() + " -> " + outfile_result.status().ToString());
            }
            auto outfile = outfile_result.ValueOrDie();

            const int64_t rows = std::max<int64_t>(1, table.num_rows());
            auto writer_props = parquet::WriterProperties::Builder()
                                    .compression(codec)
                                    ->max_row_group_length(rows)
                                    ->build();

            auto arrow_props = parquet::ArrowWriterProperties::Builder()
                                   .store_schema()
                                   ->build();

            RETAILFORGE_THROW_IF_NOT_OK(parquet::arrow::WriteTable(
                table, arrow::default_memory_pool(), outfile, rows, writer_props, arrow_props));

            // Close() writes the footer.
            RETAILFORGE_THROW_IF_NOT_OK(outfile->Close());

            return std::chrono::duration_cast<std::chrono::nanoseconds>(
                       std::chrono::steady_clock::now() - t0)
                .count();
        }
    } // namespace

    // =========================================================================
    // customers
    // =========================================================================
    // Each write() turns one chunk of row structs into Arrow columns:
    //
    //   vector<Customer>            arrow::Table
    //   ┌────┬───────┬─────┐        customer_id  [1, 2, 3, ...]
    //   │ id │ email │ ... │  ───>  email        ["a@..", ...]
    //   └────┴───────┴─────┘        segment      dict{VIP, Premium, ...}
    //
    // Fixed-width columns are reserved up front and filled with UnsafeAppend,
    // which skips the per-value capacity check. String builders grow on their
    // own, so they go through Append and its Status.
    //
    // WHY DICTIONARY COLUMNS FOR ENUMS?
    // segment, category, channel, status, type and device each take a handful
    // of values. Stored as dictionaries, a 10^6-row chunk carries six strings
    // plus one small integer per row, and readers see them as categoricals.
    //
    // Timestamps are seconds since the epoch and dates are days since the
    // epoch, matching Entities.hpp exactly, so no value is converted here.
    // =========================================================================
    long long ParquetWriter::write(const std::vector<Customer> &rows,
                                   const std::filesystem::path &output_path,
                                   const std::string &compression)
    {
        auto *pool = arrow::default_memory_pool();
        const auto n = static_cast<int64_t>(rows.size());

        arrow::UInt64Builder id_builder(pool);
        arrow::StringBuilder email_builder(pool);
        arrow::StringBuilder name_builder(pool);
        arrow::StringDictionaryBuilder segment_builder(pool);
        arrow::DoubleBuilder ltv_builder(pool);
        arrow::Date32Builder registration_builder(pool);
        arrow::TimestampBuilder created_builder(arrow::timestamp(arrow::TimeUnit::SECOND), pool);

        RETAILFORGE_THROW_IF_NOT_OK(id_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(ltv_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(registration_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(created_builder.Reserve(n));

        for (const auto &c : rows)
        {
            id_builder.UnsafeAppend(c.customer_id);
            ltv_builder.UnsafeAppend(c.ltv);
            registration_builder.UnsafeAppend(c.registration_date);
            created_builder.UnsafeAppend(c.created_at);
            RETAILFORGE_THROW_IF_NOT_OK(email_builder.Append(c.email));
            RETAILFORGE_THROW_IF_NOT_OK(name_builder.Append(c.name));
            RETAILFORGE_THROW_IF_NOT_OK(segment_builder.Append(to_string(c.segment)));
        }

        auto table = make_table(
            {"customer_id", "email", "name", "segment", "ltv", "registration_date", "created_at"},
            {finish(id_builder), finish(email_builder), finish(name_builder), finish(segment_builder),
             finish(ltv_builder), finish(registration_builder), finish(created_builder)});
        return write_table(*table, output_path, compression);
    }

    // =========================================================================
    // products
    // =========================================================================
    long long ParquetWriter::write(const std::vector<Product> &rows,
                                   const std::filesystem::path &output_path,
                                   const std::string &compression)
    {
        auto *pool = arrow::default_memory_pool();
        const auto n = static_cast<int64_t>(rows.size());

        arrow::UInt64Builder id_builder(pool);
        arrow::StringBuilder name_builder(pool);
        arrow::StringDictionaryBuilder category_builder(pool);
        arrow::StringDictionaryBuilder brand_builder(pool);
        arrow::DoubleBuilder price_builder(pool);
        arrow::Date32Builder launch_builder(pool);

        RETAILFORGE_THROW_IF_NOT_OK(id_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(price_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(launch_builder.Reserve(n));

        for (const auto &p : rows)
        {
            id_builder.UnsafeAppend(p.product_id);
            price_builder.UnsafeAppend(p.price);
            launch_builder.UnsafeAppend(p.launch_date);
            RETAILFORGE_THROW_IF_NOT_OK(name_builder.Append(p.name));
            RETAILFORGE_THROW_IF_NOT_OK(category_builder.Append(to_string(p.category)));
            RETAILFORGE_THROW_IF_NOT_OK(brand_builder.Append(p.brand));
        }

        auto table = make_table(
            {"product_id", "name", "category", "brand", "price", "launch_date"},
            {finish(id_builder), finish(name_builder), finish(category_builder),
             finish(brand_builder), finish(price_builder), finish(launch_builder)});
        return write_table(*table, output_path, compression);
    }

    // =========================================================================
    // transactions
    // =========================================================================
    long long ParquetWriter::write(const std::vector<Transaction> &rows,
                                   const std::filesystem::path &output_path,
                                   const std::string &compression)
    {
        auto *pool = arrow::default_memory_pool();
        const auto n = static_cast<int64_t>(rows.size());

        arrow::UInt64Builder id_builder(pool);
        arrow::UInt64Builder customer_builder(pool);
        arrow::UInt64Builder product_builder(pool);
        arrow::TimestampBuilder timestamp_builder(arrow::timestamp(arrow::TimeUnit::SECOND), pool);
        arrow::DoubleBuilder amount_builder(pool);
        arrow::UInt32Builder quantity_builder(pool);
        arrow::StringDictionaryBuilder channel_builder(pool);
        arrow::StringDictionaryBuilder status_builder(pool);

        RETAILFORGE_THROW_IF_NOT_OK(id_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(customer_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(product_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(timestamp_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(amount_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(quantity_builder.Reserve(n));

        for (const auto &t : rows)
        {
            id_builder.UnsafeAppend(t.transaction_id);
            customer_builder.UnsafeAppend(t.customer_id);
            product_builder.UnsafeAppend(t.product_id);
            timestamp_builder.UnsafeAppend(t.timestamp);
            amount_builder.UnsafeAppend(t.amount);
            quantity_builder.UnsafeAppend(t.quantity);
            RETAILFORGE_THROW_IF_NOT_OK(channel_builder.Append(to_string(t.channel)));
            RETAILFORGE_THROW_IF_NOT_OK(status_builder.Append(to_string(t.status)));
        }

        auto table = make_table(
            {"transaction_id", "customer_id", "product_id", "timestamp",
             "amount", "quantity", "channel", "status"},
            {finish(id_builder), finish(customer_builder), finish(product_builder),
             finish(timestamp_builder), finish(amount_builder), finish(quantity_builder),
             finish(channel_builder), finish(status_builder)});
        return write_table(*table, output_path, compression);
    }

    // =========================================================================
    // interactions
    // =========================================================================
    long long ParquetWriter::write(const std::vector<Interaction> &rows,
                                   const std::filesystem::path &output_path,
                                   const std::string &compression)
    {
        auto *pool = arrow::default_memory_pool();
        const auto n = static_cast<int64_t>(rows.size());

        arrow::UInt64Builder id_builder(pool);
        arrow::UInt64Builder customer_builder(pool);
        arrow::UInt64Builder product_builder(pool);
        arrow::UInt64Builder session_builder(pool);
        arrow::StringDictionaryBuilder type_builder(pool);
        arrow::TimestampBuilder timestamp_builder(arrow::timestamp(arrow::TimeUnit::SECOND), pool);
        arrow::UInt32Builder duration_builder(pool);
        arrow::StringDictionaryBuilder device_builder(pool);

        RETAILFORGE_THROW_IF_NOT_OK(id_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(customer_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(product_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(session_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(timestamp_builder.Reserve(n));
        RETAILFORGE_THROW_IF_NOT_OK(duration_builder.Reserve(n));

        for (const auto &i : rows)
        {
            id_builder.UnsafeAppend(i.interaction_id);
            customer_builder.UnsafeAppend(i.customer_id);
            product_builder.UnsafeAppend(i.product_id);
            session_builder.UnsafeAppend(i.session_id);
            timestamp_builder.UnsafeAppend(i.timestamp);
            duration_builder.UnsafeAppend(i.duration_seconds);
            RETAILFORGE_THROW_IF_NOT_OK(type_builder.Append(to_string(i.type)));
            RETAILFORGE_THROW_IF_NOT_OK(device_builder.Append(to_string(i.device)));
        }

        auto table = make_table(
            {"interaction_id", "customer_id", "product_id", "session_id",
             "interaction_type", "timestamp", "duration_seconds", "device"},
            {finish(id_builder), finish(customer_builder), finish(product_builder),
             finish(session_builder), finish(type_builder), finish(timestamp_builder),
             finish(duration_builder), finish(device_builder)});
        return write_table(*table, output_path, compression);
    }

} // namespace RetailForge
