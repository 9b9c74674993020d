#include "cmdline.h"

#include <cstdlib>
#include <iostream>

#include "absl/strings/str_format.h"
#include "cxxopts.hpp"

#include "version.h"

namespace haplomix {

auto process_args(int argc, char** argv) -> Processed_cmd_line {

  cxxopts::Options options("haplomix", "haplomix - Haplogroup definitions from a phylotree CSV file");

  options.add_options("Generic options")
      ("version", "print version string")
      ("h,help", "print usage")
      ;

  options.add_options("Input")
      ("tree", "input phylotree CSV file (one node per line, indentation by leading empty fields)",
       cxxopts::value<std::string>())
      ("rm-unstable", "Exclude every site where some variant is annotated as unstable, e.g., '(C16519T)'",
       cxxopts::value<bool>()->default_value("false"))
      ("rm-backmut", "Exclude every site where some variant is annotated as a back-mutation, e.g., 'T152C!'",
       cxxopts::value<bool>()->default_value("false"))
      ;

  options.add_options("Output (to stdout)")
      ("dump", "Indented listing of every node and its own variants",
       cxxopts::value<bool>()->default_value("false"))
      ("hap-table", "Every haplogroup with all the variants that define it, one per line",
       cxxopts::value<bool>()->default_value("false"))
      ("leaves-only", "Only list tips in --hap-table",
       cxxopts::value<bool>()->default_value("false"))
      ("positions", "Retained variant sites (1-based), one per line",
       cxxopts::value<bool>()->default_value("false"))
      ("mutation-counts", "For each site, the number of mutations to each derived allele",
       cxxopts::value<bool>()->default_value("false"))
      ;

  try {
    auto opts = options.parse(argc, argv);

    if (opts.count("version")) {
      std::cout << absl::StreamFormat("haplomix Version %s (build %d, commit %s)",
                                      k_haplomix_version_string,
                                      k_haplomix_build_number,
                                      k_haplomix_commit_string) << "\n";
      std::exit(EXIT_SUCCESS);
    }
    if (opts.count("help")) {
      std::cout << options.help() << "\n";
      std::exit(EXIT_SUCCESS);
    }

    if (not opts.count("tree")) {
      std::cerr << "ERROR: Must specify an input tree with --tree\n" << options.help() << "\n";
      std::exit(EXIT_FAILURE);
    }

    auto result = Processed_cmd_line{
      .tree_filename = opts["tree"].as<std::string>(),
      .rm_unstable = opts["rm-unstable"].as<bool>(),
      .rm_backmut = opts["rm-backmut"].as<bool>(),
      .leaves_only = opts["leaves-only"].as<bool>(),
      .dump = opts["dump"].as<bool>(),
      .hap_table = opts["hap-table"].as<bool>(),
      .positions = opts["positions"].as<bool>(),
      .mutation_counts = opts["mutation-counts"].as<bool>()};

    if (result.leaves_only && not result.hap_table) {
      std::cerr << "WARNING: --leaves-only has no effect without --hap-table\n";
    }
    if (not (result.dump || result.hap_table || result.positions || result.mutation_counts)) {
      result.dump = true;  // Something sensible by default
    }

    return result;

  } catch (cxxopts::exceptions::exception& x) {
    std::cerr << "ERROR: " << x.what() << "\n" << options.help() << "\n";
    std::exit(EXIT_FAILURE);
  }
}

}  // namespace haplomix
