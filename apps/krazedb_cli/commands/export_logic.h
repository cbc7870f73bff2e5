#pragma once

#include "krazedb/store/domain_store.h"

#include <ostream>
#include <string>

// execute_export: render a snapshot of the collection and write it to output_path.
// An empty collection still produces a (empty) artifact, with a warning on err.
// Returns 1 on storage failure or when the file cannot be written.
int execute_export(const std::string& output_path, krazedb::store::ExportFormat format,
                   krazedb::store::DomainStore& store, std::ostream& out, std::ostream& err);
