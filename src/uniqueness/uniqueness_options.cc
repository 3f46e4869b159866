#include "uniqueness_options.h"

#include <absl/strings/str_cat.h>

#include "../common/configuration.h"

namespace Claimstone {

std::vector<std::string> UniquenessOptions::Validate() const {
    std::vector<std::string> errors;

    if (ttl_seconds.has_value() && *ttl_seconds <= 0) {
        errors.push_back(absl::StrCat("TTL must be a positive number of seconds, got ", *ttl_seconds));
    }
    if (column_prefix.empty()) {
        errors.push_back("Column prefix must not be empty");
    }
    if (probe_token.has_value() && probe_token->empty()) {
        errors.push_back("Probe token override must not be empty");
    }
    if (lock_timeout.count() <= 0) {
        errors.push_back("Lock timeout must be positive");
    }
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].column_family.name.empty() || rows[i].row_key.empty()) {
            errors.push_back(absl::StrCat("Row ", i, " needs a column family and a row key"));
        }
    }
    return errors;
}

UniquenessOptions UniquenessOptions::FromConfig(const Configuration& config) {
    const auto& uniqueness = config.config().uniqueness;

    UniquenessOptions options;
    int ttl = uniqueness.ttl_seconds.get();
    if (ttl > 0) {
        options.ttl_seconds = ttl;
    }
    options.consistency_level = parseConsistencyLevel(uniqueness.consistency_level.get());
    options.column_prefix = uniqueness.column_prefix.get();
    options.lock_timeout = std::chrono::milliseconds(uniqueness.lock_timeout_ms.get());
    options.fail_on_stale_lock = uniqueness.fail_on_stale_lock.get();
    return options;
}

} // namespace Claimstone
