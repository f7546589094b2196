// doctest entry point for tp90x-tests. Every other test_*.cpp only holds TEST_CASEs.
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
