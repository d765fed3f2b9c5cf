#include "colwire/common/assert.hpp"
#include "colwire/common/exception.hpp"

namespace colwire {

void ColwireAssertInternal(bool condition, const char *condition_name, const char *file, int linenr) {
	if (condition) {
		return;
	}
	throw InternalException("Assertion triggered in file \"%s\" on line %d: %s", file, linenr, condition_name);
}

} // namespace colwire
