#include "idempotency.hpp"
#include <core/path_utils.hpp>

bool needs_run(const std::vector<std::string>& paths) {
    for (const auto& p : paths) {
        auto size = file_size(p);
        if (!size || *size == 0) return true;
    }
    return false;
}

bool is_up_to_date(const std::string& derived, const std::string& parent) {
    auto derived_time = modified_time(derived);
    if (!derived_time) return false;
    auto parent_time = modified_time(parent);
    if (!parent_time) return true;
    return *derived_time >= *parent_time;
}
