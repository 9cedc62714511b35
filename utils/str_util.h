#ifndef STR_UTIL_H
#define STR_UTIL_H

#include <string>
#include <vector>

#define LEFTSTRIP 0
#define RIGHTSTRIP 1
#define BOTHSTRIP 2

int startswith(const std::string &s, const std::string &sub);
// runs of delimiter characters count as one; empty fields are not returned
std::vector<std::string> split(const std::string &str, const std::string &delim);
std::string do_strip(const std::string &str, int striptype, const std::string &chars);
std::string strip(const std::string &str, const std::string &chars = " \t");
std::string lstrip(const std::string &str, const std::string &chars = " \t");
std::string rstrip(const std::string &str, const std::string &chars = " \t");

#endif
