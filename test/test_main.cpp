// Test driver: build with the other test_*.cpp files and link Boost.Test.
#define BOOST_TEST_MODULE blmatch_tests
#include <boost/test/unit_test.hpp>
