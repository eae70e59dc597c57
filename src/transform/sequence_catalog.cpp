#include "transform/sequence_catalog.hpp"
#include "transform/identifier_rules.hpp"

namespace ddlbridge {

SequenceCatalog::SequenceCatalog(std::string suffix)
    : suffix_(std::move(suffix)) {}

bool SequenceCatalog::add(const SequenceNode& source) {
    SequenceNode entry = source;
    entry.name = IdentifierRules::sequence_name(source.name, suffix_);
    entry.implicit = false;
    const std::string key = entry.name.full_name();
    return sequences_.emplace(key, std::move(entry)).second;
}

const SequenceNode* SequenceCatalog::find(const QualifiedName& target) const {
    const auto it = sequences_.find(target.full_name());
    return (it != sequences_.end()) ? &it->second : nullptr;
}

} // namespace ddlbridge
