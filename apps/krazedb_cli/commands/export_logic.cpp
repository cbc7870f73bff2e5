#include "export_logic.h"

#include "krazedb/io/domain_file.h"

int execute_export(const std::string& output_path, const krazedb::store::ExportFormat format,
                   krazedb::store::DomainStore& store, std::ostream& out, std::ostream& err) {
  const auto artifact = store.export_snapshot(format);
  if (!artifact.has_value()) {
    err << "Error: export failed: " << artifact.error().message << "\n";
    return 1;
  }

  if (artifact.value().domain_count == 0) {
    err << "Warning: no domains found in " << store.collection().display_name()
        << " collection\n";
  }

  const auto written = krazedb::io::write_text_file(output_path, artifact.value().content);
  if (!written.has_value()) {
    err << "Error: " << written.error() << "\n";
    return 1;
  }

  const char* format_name = format == krazedb::store::ExportFormat::kJson ? "json" : "text";
  out << "Exported " << artifact.value().domain_count << " domains to " << output_path << " ("
      << format_name << " format)\n";
  return 0;
}
