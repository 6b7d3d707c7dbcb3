#pragma once

#include <errut/booltype.h>
#include <cstdlib>
#include <string>
#include <limits>
#include <sstream>
#include <iomanip>

namespace halolens
{

inline errut::bool_t getenv(const std::string &key, std::string &value)
{
	if (!std::getenv(key.c_str()))
		return "No environment variable '" + key + "' is found";
	value = std::string(std::getenv(key.c_str()));
	return true;
}

/** Formats a value with enough digits to read it back unchanged. */
inline std::string double_to_string(double d)
{
	std::stringstream ss;
	ss << std::setprecision(std::numeric_limits<double>::max_digits10) << d;
	return ss.str();
}

} // end namespace
