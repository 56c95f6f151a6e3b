#pragma once

#include "util/timestamp.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace mds::util {

[[nodiscard]] std::string readFileToString(const std::filesystem::path& path);

// Writes content to a sibling temp file, fsyncs it and renames it over dest.
// Readers see either the previous file or the complete new one.
void writeFileAtomically(const std::filesystem::path& dest, std::string_view content);

// Same guarantee as writeFileAtomically, with the content streamed from src.
void replaceAtomically(const std::filesystem::path& src, const std::filesystem::path& dest);

[[nodiscard]] Timestamp modifiedTime(const std::filesystem::path& path);

[[nodiscard]] std::string generate_random_suffix(size_t length = 8);

[[nodiscard]] std::filesystem::path tempSiblingFor(const std::filesystem::path& dest);

[[nodiscard]] std::filesystem::path expandHome(const std::filesystem::path& path);

}
