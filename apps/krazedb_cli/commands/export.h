#pragma once

// cmd_export: write the collection to --file as text (default) or json (--format json).
int cmd_export(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
