#include "str_util.h"

int startswith(const std::string &s, const std::string &sub)
{
    return s.compare(0, sub.size(), sub) == 0 ? 1 : 0;
}

std::vector<std::string> split(const std::string &str, const std::string &delim)
{
    std::vector<std::string> res;
    std::string::size_type start = str.find_first_not_of(delim);
    while (start != std::string::npos)
    {
        std::string::size_type end = str.find_first_of(delim, start);
        if (end == std::string::npos)
        {
            res.push_back(str.substr(start));
            break;
        }
        res.push_back(str.substr(start, end - start));
        start = str.find_first_not_of(delim, end);
    }
    return res;
}

std::string do_strip(const std::string &str, int striptype, const std::string &chars)
{
    std::string::size_type i = 0;
    std::string::size_type j = str.size();

    if (striptype != RIGHTSTRIP)
    {
        i = str.find_first_not_of(chars);
        if (i == std::string::npos)
            return "";
    }
    if (striptype != LEFTSTRIP)
    {
        j = str.find_last_not_of(chars);
        if (j == std::string::npos)
            return "";
        j++;
    }
    if (i == 0 && j == str.size())
        return str;
    return str.substr(i, j - i);
}

std::string strip(const std::string &str, const std::string &chars)
{
    return do_strip(str, BOTHSTRIP, chars);
}

std::string lstrip(const std::string &str, const std::string &chars)
{
    return do_strip(str, LEFTSTRIP, chars);
}

std::string rstrip(const std::string &str, const std::string &chars)
{
    return do_strip(str, RIGHTSTRIP, chars);
}
