#pragma once

#include "core/error.hpp"
#include <string_view>

namespace ddlbridge {

/**
 * @brief Checks emitted DDL with PostgreSQL's own grammar (libpg_query)
 *
 * Syntax only: object existence, types from extensions (geography) and
 * constraint targets are not resolved.
 */
class OutputValidator {
public:
    /**
     * @brief Parse `sql` as a PostgreSQL script
     * @return ok, or VALIDATION_ERROR with "line N: <parser message>"
     */
    [[nodiscard]] static Result<void> validate(std::string_view sql);
};

} // namespace ddlbridge
