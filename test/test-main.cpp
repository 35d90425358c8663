#define BOOST_TEST_MODULE TransportationTests
#include <boost/test/unit_test.hpp>
