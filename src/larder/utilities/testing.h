#ifndef LARDER_UTILITIES_TESTING_H
#define LARDER_UTILITIES_TESTING_H

#include <catch2/catch.hpp>

#endif
