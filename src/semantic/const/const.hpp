#pragma once
// file const.hpp
// defines the compile-time values the semantic model can report for an expression

#include <cstdint>
#include <string>
#include <variant>

namespace semantic{

struct IntConst{
    int64_t value;
    bool operator==(const IntConst&) const = default;
};
struct BoolConst{
    bool value;
    bool operator==(const BoolConst&) const = default;
};
struct CharConst{
    char value;
    bool operator==(const CharConst&) const = default;
};
struct StringConst{
    std::string value;
    bool operator==(const StringConst&) const = default;
};
struct NullConst{
    bool operator==(const NullConst&) const = default;
};

using ConstVariant = std::variant<IntConst,BoolConst,CharConst,StringConst,NullConst>;

}
