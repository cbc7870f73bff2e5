#include "query_logic.h"

int execute_print(krazedb::store::DomainStore& store, std::ostream& out, std::ostream& err) {
  const auto domains = store.list();
  if (!domains.has_value()) {
    err << "Error: " << domains.error().message << "\n";
    return 1;
  }

  if (domains.value().empty()) {
    err << "Warning: no domains found in " << store.collection().display_name()
        << " collection\n";
    return 0;
  }

  for (const auto& domain : domains.value()) {
    out << domain << "\n";
  }
  return 0;
}

int execute_count(krazedb::store::DomainStore& store, std::ostream& out, std::ostream& err) {
  const auto count = store.count();
  if (!count.has_value()) {
    err << "Error: " << count.error().message << "\n";
    return 1;
  }

  out << count.value() << "\n";
  return 0;
}

int execute_projects(krazedb::storage::ISetStorage& storage, std::ostream& out,
                     std::ostream& err) {
  const auto projects = krazedb::store::list_projects(storage);
  if (!projects.has_value()) {
    err << "Error: " << projects.error().message << "\n";
    return 1;
  }

  for (const auto& name : projects.value()) {
    out << name << "\n";
  }
  return 0;
}
