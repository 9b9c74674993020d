#ifndef HAPLOMIX_ESTD_H_
#define HAPLOMIX_ESTD_H_

// estd contains extensions to std that probably should have been there
namespace estd {

// Debug support (we try very hard not to use conditional compilation)
#ifndef NDEBUG
inline constexpr bool is_debug_enabled = true;
#else
inline constexpr bool is_debug_enabled = false;
#endif

}  // namespace estd

#endif // HAPLOMIX_ESTD_H_
