#include "util/string_utils.hpp"

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

std::string join(const std::vector<std::string>& inputs, const std::string& connector) {
    std::string output;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (i > 0) {
            output += connector;
        }
        output += inputs[i];
    }
    return output;
}

std::string formatFixedPoint(double num, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << num;
    return ss.str();
}
