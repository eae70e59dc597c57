#pragma once

#include "core/types.hpp"
#include <span>
#include <string>
#include <string_view>

namespace ddlbridge {

/**
 * @brief Argument pattern a type rule matches
 */
enum class ArgShape {
    NONE,       // INT
    ONE,        // VARCHAR(50)
    TWO,        // DECIMAL(18,2)
    ANY,        // DATETIME2 / DATETIME2(3) / NUMERIC(10)
    MAX         // NVARCHAR(MAX)
};

/**
 * @brief How source arguments become target arguments
 */
enum class ArgTransform {
    DROP,               // VARBINARY(16) -> BYTEA
    KEEP,               // NVARCHAR(50) -> VARCHAR(50)
    FIXED,              // MONEY -> NUMERIC(19,4)
    CLAMP_PRECISION,    // DATETIME2(7) -> TIMESTAMP(6); missing precision = 7
    FLOAT_BITS          // FLOAT(24) -> REAL, FLOAT(53) -> DOUBLE PRECISION
};

enum class TypeFeature { NONE, GEOGRAPHY, GEOMETRY };

struct TypeRule {
    std::string_view source;
    ArgShape shape;
    std::string_view target;
    ArgTransform transform;
    std::string_view fixed_args;    // FIXED only, comma separated
    TypeFeature feature = TypeFeature::NONE;
};

struct TypeMapping {
    TypeRef type;
    bool mapped = false;            // false = no rule matched, type unchanged
    TypeFeature feature = TypeFeature::NONE;
};

/**
 * @brief Declarative SQL Server -> PostgreSQL column type mapping
 *
 * Rules are matched in table order on (case-insensitive name, argument
 * shape). PostgreSQL spellings map to themselves so converted output maps
 * to itself. Types without a rule are returned unchanged with mapped=false.
 *
 * Thread-safety: immutable after construction
 */
class TypeMapper {
public:
    explicit TypeMapper(int max_timestamp_precision = 6);

    [[nodiscard]] TypeMapping map(const TypeRef& source) const;

    [[nodiscard]] static std::span<const TypeRule> rules();

private:
    [[nodiscard]] static bool matches(const TypeRule& rule, const TypeRef& source);

    int max_precision_;
};

} // namespace ddlbridge
