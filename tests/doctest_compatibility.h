#ifndef DOCTEST_COMPATIBILITY_H
#define DOCTEST_COMPATIBILITY_H

// Catch-style spellings on top of doctest.
#include <doctest/doctest.h>

#define SECTION(name) DOCTEST_SUBCASE(name)

#endif  // DOCTEST_COMPATIBILITY_H
