#pragma once

#include <random>
#include <vector>
#include <string>
#include <stdexcept>

namespace mockapi {

class Random {
public:
    // Per-thread engine, the listener may run handlers concurrently
    static std::mt19937& engine() {
        thread_local std::mt19937 gen(std::random_device{}());
        return gen;
    }

    // Uniform distribution [min, max]
    static double uniform(double min, double max) {
        std::uniform_real_distribution<double> dist(min, max);
        return dist(engine());
    }

    // Uniform integer [min, max]
    static int uniformInt(int min, int max) {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(engine());
    }

    // Uniform pick from a non-empty list
    static const std::string& choice(const std::vector<std::string>& items) {
        if (items.empty()) {
            throw std::invalid_argument("Random::choice on empty list");
        }
        return items[static_cast<size_t>(uniformInt(0, static_cast<int>(items.size()) - 1))];
    }
};

} // namespace mockapi
