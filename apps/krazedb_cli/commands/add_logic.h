#pragma once

#include "krazedb/store/domain_store.h"

#include <ostream>
#include <string>
#include <vector>

// execute_add: add every line to the store and print the batch summary to out.
// The summary is printed even when storage fails mid-batch; the failure goes to err and the
// return value is 1. Takes only the store interface so tests can run it on in-memory storage.
int execute_add(const std::vector<std::string>& lines, bool validate,
                krazedb::store::DomainStore& store, std::ostream& out, std::ostream& err);

// format_add_summary renders the one-line counts summary, e.g.
// "Processed 3 domains: 2 new, 1 duplicates (33.33%)".
[[nodiscard]] std::string format_add_summary(const krazedb::store::AddReport& report);
