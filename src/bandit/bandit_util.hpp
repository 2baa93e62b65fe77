#pragma once
#include "macro_util.h"
#include "errors.hpp"
#include <vector>
#include <string>
#include <algorithm>
#include <memory>
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <random>
#include <cmath>
#include <ctime>
#include <limits>

namespace drugsim {

typedef unsigned int uint;

typedef std::vector<std::vector<double> > vec2Double;

//RNG engine type threaded through the model
typedef std::mt19937 RandomEngine;

const double infinity = std::numeric_limits<double>::infinity();

inline void printMsg(const std::string& msg)
{
#if DRUGSIM_DEBUG
    std::cout << msg << std::endl;
#endif
}

template<class T>
void printVec(const std::string& name, const std::vector<T>& vec)
{
#if DRUGSIM_DEBUG
    std::cout << name+": ";
    for (const auto& i:vec) {
        std::cout << i << " ";
    }
    std::cout << std::endl;
#endif
}

template<class T>
void printVar(const std::string& name, const T& var)
{
#if DRUGSIM_DEBUG
    std::cout << name+": ";
    std::cout << var << " ";
    std::cout << std::endl;
#endif
}

// index of the largest element; ties go to the lowest index
template<class T>
uint vectorMaxIndex(const std::vector<T>& elems)
{
    uint m = 0;
    T mv = elems[0];
    for (uint i = 0; i<elems.size(); ++i) {
        if (elems[i]>mv) {
            mv = elems[i];
            m = i;
        }
    }
    return m;
}

template<class T>
T vectorSum(const std::vector<T>& elems)
{
    T s = 0;
    for (uint i = 0; i<elems.size(); ++i) {
        s += elems[i];
    }
    return s;
}

//int -> string
inline std::string itos(int number)
{
    std::stringstream ss;
    ss << number;
    return ss.str();
}

//double -> string
inline std::string dtos(double number)
{
    std::stringstream ss;
    ss << number;
    return ss.str();
}

//split by char
inline std::vector<std::string> split(const std::string& str, char delim)
{
    std::vector<std::string> res;
    std::string::size_type current = 0, found;
    while ((found = str.find_first_of(delim, current))!=std::string::npos) {
        res.push_back(std::string(str, current, found-current));
        current = found+1;
    }
    res.push_back(std::string(str, current, str.size()-current));
    return res;
}

//split by whitespace, dropping empty tokens
inline std::vector<std::string> tokenize(const std::string& str)
{
    std::vector<std::string> res;
    std::istringstream iss(str);
    std::string token;
    while (iss >> token) {
        res.push_back(token);
    }
    return res;
}

// strict string -> double; the whole token must be consumed
inline bool parseDouble(const std::string& str, double& value)
{
    std::istringstream iss(str);
    iss >> value;
    return !iss.fail() && iss.eof();
}

inline std::vector<std::string> readlines(const std::string& filename, bool skipBlankLine = true)
{
    std::ifstream ifs(filename);
    if (!ifs.is_open()) {
        throw ConfigurationError("file "+filename+" not found");
    }
    std::vector<std::string> lines;
    std::string str;
    while (std::getline(ifs, str)) {
        if (skipBlankLine && (str.find_first_not_of(" \t\r")==std::string::npos)) continue;
        lines.push_back(str);
    }
    ifs.close();
    return lines;
}

} //namespace
