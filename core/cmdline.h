#ifndef HAPLOMIX_CMDLINE_H_
#define HAPLOMIX_CMDLINE_H_

#include <string>

namespace haplomix {

struct Processed_cmd_line {
  std::string tree_filename;
  bool rm_unstable;
  bool rm_backmut;
  bool leaves_only;

  // What to print (in this order)
  bool dump;
  bool hap_table;
  bool positions;
  bool mutation_counts;
};

// Exits the process on --help, --version or invalid options
auto process_args(int argc, char** argv) -> Processed_cmd_line;

}  // namespace haplomix

#endif // HAPLOMIX_CMDLINE_H_
