#include "delete_all_logic.h"

#include "krazedb/core/normalization.h"

bool is_affirmative(const std::string& answer) {
  const std::string normalized = krazedb::core::normalize_entry(answer);
  return normalized == "y" || normalized == "yes";
}

int execute_delete_all(const bool pre_confirmed, krazedb::store::DomainStore& store,
                       std::istream& in, std::ostream& out, std::ostream& err) {
  using krazedb::store::DeleteConfirmation;

  DeleteConfirmation confirmation =
      pre_confirmed ? DeleteConfirmation::kConfirmed : DeleteConfirmation::kUnconfirmed;

  if (confirmation == DeleteConfirmation::kUnconfirmed) {
    out << "Are you sure you want to delete ALL domains from the "
        << store.collection().display_name() << " collection? (y/N): ";
    out.flush();

    std::string answer;
    if (std::getline(in, answer) && is_affirmative(answer)) {
      confirmation = DeleteConfirmation::kConfirmed;
    }
  }

  const auto result = store.delete_collection(confirmation);
  if (!result.has_value()) {
    if (result.error().kind == krazedb::store::StoreErrorKind::kConfirmationRequired) {
      out << "Delete operation cancelled\n";
      return 0;
    }
    err << "Error: " << result.error().message << "\n";
    return 1;
  }

  if (!result.value().existed) {
    err << "Warning: no domains existed in " << store.collection().display_name()
        << " collection\n";
    return 0;
  }

  out << "All domains deleted successfully (" << result.value().deleted_entries << " removed)\n";
  return 0;
}
