#pragma once

#include "convert/Converter.hpp"

#include <string>

namespace mds::config {
struct ConverterConfig;
}

namespace mds::convert {

class Pandoc final : public Converter {
public:
    explicit Pandoc(const config::ConverterConfig& cfg);

    void convert(const std::filesystem::path& input,
                 const std::filesystem::path& output,
                 Direction direction,
                 std::chrono::milliseconds timeout) override;

private:
    std::string binary_;
    std::string localFormat_;
    std::string remoteFormat_;
};

}
