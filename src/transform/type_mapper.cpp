#include "transform/type_mapper.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>

namespace ddlbridge {

namespace {

// T-SQL DATETIME2 / TIME / DATETIMEOFFSET default fractional precision
constexpr int kSourceDefaultPrecision = 7;

constexpr std::array TYPE_RULES = {
    // Exact numerics
    TypeRule{"BIGINT",            ArgShape::NONE, "BIGINT",           ArgTransform::DROP,  ""},
    TypeRule{"INT",               ArgShape::NONE, "INTEGER",          ArgTransform::DROP,  ""},
    TypeRule{"INTEGER",           ArgShape::NONE, "INTEGER",          ArgTransform::DROP,  ""},
    TypeRule{"SMALLINT",          ArgShape::NONE, "SMALLINT",         ArgTransform::DROP,  ""},
    TypeRule{"TINYINT",           ArgShape::NONE, "SMALLINT",         ArgTransform::DROP,  ""},
    TypeRule{"BIT",               ArgShape::NONE, "BOOLEAN",          ArgTransform::DROP,  ""},
    TypeRule{"BOOLEAN",           ArgShape::NONE, "BOOLEAN",          ArgTransform::DROP,  ""},
    TypeRule{"DECIMAL",           ArgShape::ANY,  "NUMERIC",          ArgTransform::KEEP,  ""},
    TypeRule{"NUMERIC",           ArgShape::ANY,  "NUMERIC",          ArgTransform::KEEP,  ""},
    TypeRule{"MONEY",             ArgShape::NONE, "NUMERIC",          ArgTransform::FIXED, "19,4"},
    TypeRule{"SMALLMONEY",        ArgShape::NONE, "NUMERIC",          ArgTransform::FIXED, "10,4"},

    // Approximate numerics
    TypeRule{"FLOAT",             ArgShape::NONE, "DOUBLE PRECISION", ArgTransform::DROP,  ""},
    TypeRule{"FLOAT",             ArgShape::ONE,  "DOUBLE PRECISION", ArgTransform::FLOAT_BITS, ""},
    TypeRule{"REAL",              ArgShape::NONE, "REAL",             ArgTransform::DROP,  ""},
    TypeRule{"DOUBLE PRECISION",  ArgShape::NONE, "DOUBLE PRECISION", ArgTransform::DROP,  ""},

    // Character strings
    TypeRule{"NVARCHAR",          ArgShape::MAX,  "TEXT",             ArgTransform::DROP,  ""},
    TypeRule{"VARCHAR",           ArgShape::MAX,  "TEXT",             ArgTransform::DROP,  ""},
    TypeRule{"NVARCHAR",          ArgShape::ONE,  "VARCHAR",          ArgTransform::KEEP,  ""},
    TypeRule{"VARCHAR",           ArgShape::ONE,  "VARCHAR",          ArgTransform::KEEP,  ""},
    TypeRule{"NVARCHAR",          ArgShape::NONE, "VARCHAR",          ArgTransform::FIXED, "1"},
    TypeRule{"VARCHAR",           ArgShape::NONE, "VARCHAR",          ArgTransform::FIXED, "1"},
    TypeRule{"NCHAR",             ArgShape::ONE,  "CHAR",             ArgTransform::KEEP,  ""},
    TypeRule{"CHAR",              ArgShape::ONE,  "CHAR",             ArgTransform::KEEP,  ""},
    TypeRule{"NCHAR",             ArgShape::NONE, "CHAR",             ArgTransform::FIXED, "1"},
    TypeRule{"CHAR",              ArgShape::NONE, "CHAR",             ArgTransform::FIXED, "1"},
    TypeRule{"NTEXT",             ArgShape::NONE, "TEXT",             ArgTransform::DROP,  ""},
    TypeRule{"TEXT",              ArgShape::NONE, "TEXT",             ArgTransform::DROP,  ""},
    TypeRule{"SYSNAME",           ArgShape::NONE, "VARCHAR",          ArgTransform::FIXED, "128"},

    // Date and time
    TypeRule{"DATE",              ArgShape::NONE, "DATE",             ArgTransform::DROP,  ""},
    TypeRule{"DATETIME2",         ArgShape::ANY,  "TIMESTAMP",        ArgTransform::CLAMP_PRECISION, ""},
    TypeRule{"DATETIME",          ArgShape::NONE, "TIMESTAMP",        ArgTransform::FIXED, "3"},
    TypeRule{"SMALLDATETIME",     ArgShape::NONE, "TIMESTAMP",        ArgTransform::FIXED, "0"},
    TypeRule{"DATETIMEOFFSET",    ArgShape::ANY,  "TIMESTAMPTZ",      ArgTransform::CLAMP_PRECISION, ""},
    TypeRule{"TIME",              ArgShape::ANY,  "TIME",             ArgTransform::CLAMP_PRECISION, ""},
    TypeRule{"TIMESTAMP",         ArgShape::ONE,  "TIMESTAMP",        ArgTransform::CLAMP_PRECISION, ""},
    TypeRule{"TIMESTAMPTZ",       ArgShape::ANY,  "TIMESTAMPTZ",      ArgTransform::CLAMP_PRECISION, ""},

    // Binary
    TypeRule{"VARBINARY",         ArgShape::ANY,  "BYTEA",            ArgTransform::DROP,  ""},
    TypeRule{"BINARY",            ArgShape::ANY,  "BYTEA",            ArgTransform::DROP,  ""},
    TypeRule{"IMAGE",             ArgShape::NONE, "BYTEA",            ArgTransform::DROP,  ""},
    TypeRule{"ROWVERSION",        ArgShape::NONE, "BYTEA",            ArgTransform::DROP,  ""},
    TypeRule{"BYTEA",             ArgShape::NONE, "BYTEA",            ArgTransform::DROP,  ""},

    // Other
    TypeRule{"UNIQUEIDENTIFIER",  ArgShape::NONE, "UUID",             ArgTransform::DROP,  ""},
    TypeRule{"UUID",              ArgShape::NONE, "UUID",             ArgTransform::DROP,  ""},
    TypeRule{"XML",               ArgShape::NONE, "XML",              ArgTransform::DROP,  ""},

    // Spatial (PostGIS)
    TypeRule{"GEOGRAPHY",         ArgShape::NONE, "geography",        ArgTransform::DROP,  "", TypeFeature::GEOGRAPHY},
    TypeRule{"GEOMETRY",          ArgShape::NONE, "geometry",         ArgTransform::DROP,  "", TypeFeature::GEOMETRY},
};

} // anonymous namespace

TypeMapper::TypeMapper(int max_timestamp_precision)
    : max_precision_(std::clamp(max_timestamp_precision, 0, 6)) {}

std::span<const TypeRule> TypeMapper::rules() {
    return TYPE_RULES;
}

bool TypeMapper::matches(const TypeRule& rule, const TypeRef& source) {
    if (!utils::iequals(rule.source, source.name)) return false;

    const bool has_max = source.args.size() == 1 && utils::iequals(source.args[0], "MAX");
    switch (rule.shape) {
        case ArgShape::NONE: return source.args.empty();
        case ArgShape::ONE:  return source.args.size() == 1 && !has_max;
        case ArgShape::TWO:  return source.args.size() == 2;
        case ArgShape::ANY:  return !has_max;
        case ArgShape::MAX:  return has_max;
    }
    return false;
}

TypeMapping TypeMapper::map(const TypeRef& source) const {
    TypeMapping result;
    result.type = source;

    const auto it = std::ranges::find_if(TYPE_RULES, [&source](const TypeRule& rule) {
        return matches(rule, source);
    });
    if (it == TYPE_RULES.end()) {
        return result;
    }

    const TypeRule& rule = *it;
    result.mapped = true;
    result.feature = rule.feature;
    result.type.name = std::string(rule.target);
    result.type.args.clear();

    switch (rule.transform) {
        case ArgTransform::DROP:
            break;
        case ArgTransform::KEEP:
            result.type.args = source.args;
            break;
        case ArgTransform::FIXED:
            result.type.args = utils::split(std::string(rule.fixed_args), ',');
            break;
        case ArgTransform::CLAMP_PRECISION: {
            int precision = kSourceDefaultPrecision;
            if (!source.args.empty()) {
                precision = utils::try_parse_int<int>(source.args[0]).value_or(kSourceDefaultPrecision);
            }
            result.type.args.push_back(std::to_string(std::clamp(precision, 0, max_precision_)));
            break;
        }
        case ArgTransform::FLOAT_BITS: {
            const int bits = utils::try_parse_int<int>(source.args[0]).value_or(53);
            result.type.name = (bits <= 24) ? "REAL" : "DOUBLE PRECISION";
            break;
        }
    }
    return result;
}

} // namespace ddlbridge
