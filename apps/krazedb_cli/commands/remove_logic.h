#pragma once

#include "krazedb/store/domain_store.h"

#include <ostream>
#include <string>
#include <vector>

// execute_remove: remove every target from the store and print the batch summary to out.
// Targets that were not present are listed but do not change the exit status; only a
// storage failure returns 1.
int execute_remove(const std::vector<std::string>& targets, krazedb::store::DomainStore& store,
                   std::ostream& out, std::ostream& err);
