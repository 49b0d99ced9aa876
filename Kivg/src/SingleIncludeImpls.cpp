#define GABE_CPP_PRINT_IMPL
#include <cppUtils/cppPrint.hpp>
#undef GABE_CPP_PRINT_IMPL

#define GABE_CPP_UTILS_IMPL
#include <cppUtils/cppUtils.hpp>
#undef GABE_CPP_UTILS_IMPL

#define GABE_CPP_TESTS_IMPL
#include <cppUtils/cppTests.hpp>
#undef GABE_CPP_TESTS_IMPL
