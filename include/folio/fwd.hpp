#ifndef FOLIO_FWD_HPP
#define FOLIO_FWD_HPP

#include "folio/settings.hpp"

FOLIO_IF_DEBUG() // silence unused warning for settings.hpp

namespace folio {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define FOLIO_ENUM_STRING_CASE8(...)                                                               \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Boxed_Model;
struct Collecting_Logger;
struct Command;
enum struct Command_Kind : Default_Underlying;
enum struct Decoration : Default_Underlying;
struct Diagnostic;
struct Feedback;
struct Ignorant_Logger;
struct Layout_Context;
struct Layout_Scheduler;
struct Logger;
struct Model;
struct Node;
enum struct Node_Kind : Default_Underlying;
template <typename>
struct Pass;
enum struct Severity : Default_Underlying;
struct Source_Position;
struct Source_Span;
template <typename>
struct Spanned;
struct Stream_Logger;
struct Syntax_Model;
template <typename>
struct Task;

} // namespace folio

#endif
