#pragma once

struct Adder {
    int operator()(int a, int b) const;
};
