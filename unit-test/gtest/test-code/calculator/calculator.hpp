#pragma once

class Calculator {
public:
    int add(int a, int b) const;
    int subtract(int a, int b) const;
    int multiply(int a, int b) const;

    /**
     * @throw std::invalid_argument b 为 0
     */
    int divide(int a, int b) const;
};
