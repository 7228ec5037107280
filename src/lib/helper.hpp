#pragma once

#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <climits>

#include "Errors.hpp"

#define PBWIDTH 60

inline bool endWith(std::string const &fullString, std::string const &ending)
{
    if (fullString.length() >= ending.length())
    {
        return (0 == fullString.compare (fullString.length() - ending.length(), ending.length(), ending));
    }
    else
    {
        return false;
    }
}

inline std::string ltrim(std::string s)
{
    s.erase(s.begin(), std::find_if(s.begin(), s.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    return s;
}
inline std::string rtrim(std::string s)
{
    s.erase(std::find_if(s.rbegin(), s.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), s.end());
    return s;
}
inline std::string trim(std::string s) { return rtrim(ltrim(std::move(s))); }

inline std::string to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return std::toupper(c); });
    return s;
}

inline std::vector<std::string> splitByDelimiter(std::string line, const std::string& del)
{
    std::vector<std::string> tokens;
    size_t pos = 0;
    std::string token;
    while ((pos = line.find(del)) != std::string::npos) {
        token = line.substr(0, pos);
        tokens.push_back(token);
        line.erase(0, pos + del.length());
    }
    tokens.push_back(line);

    return tokens;
}

//splits on any whitespace and drops empty tokens, used for tool parameter lists
inline std::vector<std::string> splitByWhitespace(const std::string& line)
{
    std::vector<std::string> tokens;
    std::string token;
    for(const char c : line)
    {
        if(std::isspace(static_cast<unsigned char>(c)))
        {
            if(!token.empty()){tokens.push_back(token); token.clear();}
        }
        else
        {
            token += c;
        }
    }
    if(!token.empty()){tokens.push_back(token);}
    return tokens;
}

inline std::string joinStrings(const std::vector<std::string>& elements, const std::string& del)
{
    std::string joined;
    for(size_t i = 0; i < elements.size(); ++i)
    {
        if(i){joined += del;}
        joined += elements.at(i);
    }
    return joined;
}

inline void ullong_save_add(unsigned long long& a, const unsigned long long& b)
{
   if( (b>0) && ( (ULLONG_MAX - b) < a ) )
   {
       std::cerr << "ERROR ULONG OVERFLOW\n";
       a = ULLONG_MAX;
   }
   else
   {
       a += b;
   }
}

inline void printProgress(double percentage, std::ostream& os = std::cout)
{
    int val = (int) (percentage*100);
    int loadLength = (int) (percentage * PBWIDTH);
    int emptyLength = PBWIDTH - loadLength;
    os << "\t\r[" << std::string(loadLength, '|') << std::string(emptyLength, ' ') << "] " << val << "%" << std::flush;
}
