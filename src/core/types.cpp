#include "core/types.hpp"
#include "core/utils.hpp"

namespace ddlbridge {

ObjectKey ObjectKey::from(std::string_view schema, std::string_view table) {
    ObjectKey key;
    key.schema = schema.empty() ? std::string(kDefaultSchema) : utils::to_lower(schema);
    key.table = utils::to_lower(table);
    return key;
}

std::string TypeRef::to_string() const {
    if (args.empty()) return name;

    std::string out = name;
    out += '(';
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out += ',';
        out += args[i];
    }
    out += ')';
    return out;
}

const Column* TableNode::find_column(std::string_view column_name) const {
    for (const auto& col : columns) {
        if (utils::iequals(col.name, column_name)) {
            return &col;
        }
    }
    return nullptr;
}

} // namespace ddlbridge
