//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/assert.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

namespace colwire {

void ColwireAssertInternal(bool condition, const char *condition_name, const char *file, int linenr);

} // namespace colwire

#if defined(NDEBUG) && !defined(COLWIRE_FORCE_ASSERT)
#define D_ASSERT(condition)
#else
#define D_ASSERT(condition) colwire::ColwireAssertInternal(bool(condition), #condition, __FILE__, __LINE__)
#endif
