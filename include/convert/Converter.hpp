#pragma once

#include <chrono>
#include <filesystem>
#include <string_view>

namespace mds::convert {

enum class Direction {
    ToRemote, // local text encoding -> remote binary encoding (push)
    ToLocal   // remote binary encoding -> local text encoding (pull)
};

std::string_view to_string(Direction d);

// Narrow gateway to the external document converter. Implementations either leave a
// complete file at `output` or throw ConversionError with nothing written there.
class Converter {
public:
    virtual ~Converter() = default;

    virtual void convert(const std::filesystem::path& input,
                         const std::filesystem::path& output,
                         Direction direction,
                         std::chrono::milliseconds timeout) = 0;
};

}
