#ifndef HAPLOMIX_VERSION_H_
#define HAPLOMIX_VERSION_H_

#include <string>

namespace haplomix {

extern const std::string k_haplomix_version_string;
extern const int k_haplomix_build_number;
extern const std::string k_haplomix_commit_string;

}  // namespace haplomix

#endif // HAPLOMIX_VERSION_H_
