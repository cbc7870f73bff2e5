#pragma once

// cmd_print:    print every domain of the collection, sorted
// cmd_count:    print the number of domains in the collection
// cmd_projects: print the names of all project collections
int cmd_print(int argc, char* argv[]);     // NOLINT(modernize-avoid-c-arrays)
int cmd_count(int argc, char* argv[]);     // NOLINT(modernize-avoid-c-arrays)
int cmd_projects(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
