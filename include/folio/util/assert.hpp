#ifndef FOLIO_ASSERT_HPP
#define FOLIO_ASSERT_HPP

#include "ulight/impl/assert.hpp"

namespace folio {

using ulight::assert_fail;
using ulight::Assertion_Error;
using ulight::Assertion_Error_Type;

#define FOLIO_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define FOLIO_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define FOLIO_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)
#define FOLIO_DEBUG_ASSERT_UNREACHABLE(...) ULIGHT_DEBUG_ASSERT_UNREACHABLE(__VA_ARGS__)

} // namespace folio

#endif
