#pragma once

// ============================================================================
// EntityValidator — format and range checks on generated rows
// ============================================================================
// Text fields are checked with CTRE: the patterns are compiled into the
// binary, so checking every row of a 10^8-row table stays cheap.
//
// Generated rows should always pass. A failing row is counted in the run
// report and logged (first few only); it is never dropped, because dropping
// a row could break referential integrity downstream.
// ============================================================================

#include <ctre.hpp>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "../model/Catalog.hpp"
#include "../model/Entities.hpp"

namespace RetailForge
{

    struct ValidationResult
    {
        bool valid;
        std::string reason;

        static ValidationResult ok()
        {
            return {true, ""};
        }

        static ValidationResult fail(std::string reason)
        {
            return {false, std::move(reason)};
        }
    };

    class EntityValidator
    {
    public:
        static constexpr size_t kMaxLoggedRejects = 5;

        [[nodiscard]]
        static ValidationResult validate(const Customer &c)
        {
            if (!ctre::match<"[a-z0-9._]+@[a-z0-9-]+(\\.[a-z0-9-]+)*\\.[a-z]{2,}">(c.email))
                return ValidationResult::fail("Invalid email: '" + c.email + "'");

            if (!ctre::match<"[A-Z][A-Za-z0-9]*( [A-Za-z0-9]+)*">(c.name))
                return ValidationResult::fail("Invalid name: '" + c.name + "'");

            const auto &seg = profile_of(c.segment);
            if (c.ltv < seg.min_ltv || c.ltv > seg.max_ltv)
                return ValidationResult::fail("ltv " + std::to_string(c.ltv) + " outside segment range");

            if (c.registration_date <= 0 || c.created_at <= 0)
                return ValidationResult::fail("Non-positive registration/creation time");

            return ValidationResult::ok();
        }

        [[nodiscard]]
        static ValidationResult validate(const Product &p)
        {
            if (!ctre::match<"[A-Z][A-Za-z0-9']*( [A-Za-z0-9']+)*">(p.name))
                return ValidationResult::fail("Invalid product name: '" + p.name + "'");

            if (!find_brand(p.brand))
                return ValidationResult::fail("Unknown brand: '" + p.brand + "'");

            const auto &cat = profile_of(p.category);
            if (p.price < cat.min_price || p.price > cat.max_price)
                return ValidationResult::fail("price " + std::to_string(p.price) + " outside category range");

            return ValidationResult::ok();
        }

        [[nodiscard]]
        static ValidationResult validate(const Transaction &t)
        {
            if (t.amount <= 0.0)
                return ValidationResult::fail("Non-positive amount: " + std::to_string(t.amount));
            if (t.quantity == 0)
                return ValidationResult::fail("Invalid quantity: 0");
            if (t.timestamp <= 0)
                return ValidationResult::fail("Non-positive timestamp");
            return ValidationResult::ok();
        }

        [[nodiscard]]
        static ValidationResult validate(const Interaction &i)
        {
            if (i.duration_seconds == 0)
                return ValidationResult::fail("Invalid duration: 0");
            if (i.timestamp <= 0)
                return ValidationResult::fail("Non-positive timestamp");
            return ValidationResult::ok();
        }

        // Number of rows in 'rows' that fail validate(). The first few
        // rejects of each call are logged to stderr.
        template <typename Row>
        static uint64_t count_invalid(const std::vector<Row> &rows, std::string_view table)
        {
            uint64_t invalid = 0;
            for (const auto &row : rows)
            {
                auto result = validate(row);
                if (result.valid)
                    continue;
                if (invalid < kMaxLoggedRejects)
                    std::cerr << "[VALIDATOR] " << table << ": " << result.reason << "\n";
                ++invalid;
            }
            return invalid;
        }
    };

} // namespace RetailForge
