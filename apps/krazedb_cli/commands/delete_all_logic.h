#pragma once

#include "krazedb/store/domain_store.h"

#include <istream>
#include <ostream>
#include <string>

// is_affirmative accepts "y" / "yes" in any case, ignoring surrounding whitespace.
[[nodiscard]] bool is_affirmative(const std::string& answer);

// execute_delete_all: delete the whole collection.
// Without pre_confirmed the user is prompted on out and the answer is read from in; anything
// other than y/yes cancels with exit status 0 and no storage mutation.
// Returns 1 only on storage failure.
int execute_delete_all(bool pre_confirmed, krazedb::store::DomainStore& store, std::istream& in,
                       std::ostream& out, std::ostream& err);
