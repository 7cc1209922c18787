#ifndef STRONGBOX_VERSION_HPP
#define STRONGBOX_VERSION_HPP

// ============================================================================
// Strongbox - Version Header
// ============================================================================

namespace strongbox {

inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 2;
inline constexpr int VERSION_PATCH = 0;

inline constexpr const char* VERSION_STRING = "0.2.0";

} // namespace strongbox

#endif // STRONGBOX_VERSION_HPP
