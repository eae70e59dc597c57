#include "emit/output_validator.hpp"

// libpg_query C API
extern "C" {
#include "pg_query.h"
}

#include <algorithm>
#include <format>
#include <string>

namespace ddlbridge {

Result<void> OutputValidator::validate(std::string_view sql) {
    const std::string text(sql);
    PgQueryParseResult parse_result = pg_query_parse(text.c_str());

    if (!parse_result.error) {
        pg_query_free_parse_result(parse_result);
        return Result<void>::ok();
    }

    std::string message = parse_result.error->message
        ? parse_result.error->message
        : "Unknown parse error";

    // cursorpos is a 1-based character offset, 0 when unknown
    const int cursor = parse_result.error->cursorpos;
    if (cursor > 0) {
        const size_t pos = std::min(static_cast<size_t>(cursor - 1), text.size());
        const auto line = 1 + std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(pos), '\n');
        message = std::format("line {}: {}", line, message);
    }

    pg_query_free_parse_result(parse_result);
    return Result<void>::error(ErrorCategory::VALIDATION_ERROR, std::move(message));
}

} // namespace ddlbridge
