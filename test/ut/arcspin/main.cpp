//=============================================================================
// arcspin Tests - Main Entry Point
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

int main() {
    return boost::ut::cfg<>.run();
}
