#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <string>
#include <vector>

std::string join(const std::vector<std::string>& inputs, const std::string& connector);
std::string formatFixedPoint(double num, int precision);

#endif // STRING_UTILS_HPP
