#include "version.h"

namespace haplomix {

const std::string k_haplomix_version_string = "0.9.0";
const int k_haplomix_build_number = 1;
const std::string k_haplomix_commit_string = "unknown";

}  // namespace haplomix
