#pragma once

#include "krazedb/storage/set_storage.h"
#include "krazedb/store/domain_store.h"

#include <ostream>

// Read-only commands. Each prints its result to out and returns 1 only on storage failure;
// an absent collection prints nothing (print), 0 (count) or no names (projects).
int execute_print(krazedb::store::DomainStore& store, std::ostream& out, std::ostream& err);
int execute_count(krazedb::store::DomainStore& store, std::ostream& out, std::ostream& err);
int execute_projects(krazedb::storage::ISetStorage& storage, std::ostream& out, std::ostream& err);
