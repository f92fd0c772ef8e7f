#pragma once
#include "entity_extractor.hpp"
#include "result.hpp"
#include "../store/record_store.hpp"
#include <optional>
#include <string>

namespace bankmatch {

// Exact legal-name shortcut. Compares normalized names only.
class ExactNameMatcher {
public:
    explicit ExactNameMatcher(RecordStore& store) : store_(store) {}

    // Looks up entities.full_name, or the raw query when no full-name hint
    // was extracted. A store failure is logged and reported as a miss.
    std::optional<RetrievalResult> match(const QueryEntities& entities,
                                         const std::string& raw_query);

private:
    RecordStore& store_;
};

} // namespace bankmatch
