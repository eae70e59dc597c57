#pragma once

#include "core/types.hpp"

namespace ddlbridge {

/**
 * @brief Abstract conversion-state interface
 *
 * Answers whether a table already has converted output. Backed by the
 * output tree (OutputTree), or by an in-memory set for testing. Read-only
 * for the duration of a conversion run.
 */
class IConversionState {
public:
    virtual ~IConversionState() = default;

    [[nodiscard]] virtual bool has_output(const ObjectKey& key) const = 0;
};

} // namespace ddlbridge
