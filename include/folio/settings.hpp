#ifndef FOLIO_SETTINGS_HPP
#define FOLIO_SETTINGS_HPP

#include <cstddef>

#ifndef NDEBUG // debug builds
#define FOLIO_IF_DEBUG(...) __VA_ARGS__
#else // release builds
#define FOLIO_IF_DEBUG(...)
#endif

namespace folio {

/// @brief The default limit for how deeply submodels may be nested inside each other
/// before the layouter refuses to descend further.
inline constexpr std::size_t default_max_layout_depth = 256;

} // namespace folio

#endif
