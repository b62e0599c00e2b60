#include "adder.hpp"

int Adder::operator()(int a, int b) const {
    return a + b;
}
