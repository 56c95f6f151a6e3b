#include "convert/Pandoc.hpp"
#include "config/Config.hpp"
#include "util/process.hpp"
#include "util/files.hpp"
#include "util/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

namespace fs = std::filesystem;

namespace mds::convert {

Pandoc::Pandoc(const config::ConverterConfig& cfg)
    : binary_(cfg.binary), localFormat_(cfg.local_format), remoteFormat_(cfg.remote_format) {}

void Pandoc::convert(const fs::path& input, const fs::path& output, const Direction direction,
                     const std::chrono::milliseconds timeout) {
    const auto& from = direction == Direction::ToRemote ? localFormat_ : remoteFormat_;
    const auto& to = direction == Direction::ToRemote ? remoteFormat_ : localFormat_;

    // keep the real extension last so pandoc's own output sniffing agrees with -t
    const auto tmp = output.parent_path() /
        fmt::format(".{}.part-{}{}", output.stem().string(), util::generate_random_suffix(), output.extension().string());

    const std::vector<std::string> argv = {
        binary_, "-f", from, "-t", to, input.string(), "-o", tmp.string()
    };

    log::Registry::convert()->debug("[Pandoc] {} {} -> {}", to_string(direction), input.string(), output.string());

    std::error_code ec;
    util::process::Result res;
    try {
        res = util::process::run(argv, timeout);
    } catch (const ProcessError& e) {
        fs::remove(tmp, ec);
        throw ConversionError(fmt::format("Converting {} failed: {}", input.filename().string(), e.what()));
    }

    if (!res.ok()) {
        fs::remove(tmp, ec);
        const auto reason = res.exit_code == 127
            ? fmt::format("'{}' not found on PATH", binary_)
            : fmt::format("exit code {}: {}", res.exit_code, res.output);
        log::Registry::convert()->warn("[Pandoc] Converting {} failed with {}", input.string(), reason);
        throw ConversionError(fmt::format("Converting {} failed with {}", input.filename().string(), reason));
    }

    if (!fs::exists(tmp, ec))
        throw ConversionError(fmt::format("Converter produced no output for {}", input.filename().string()));

    fs::rename(tmp, output, ec);
    if (ec) {
        const auto reason = ec.message();
        fs::remove(tmp, ec);
        throw ConversionError(fmt::format("Failed to move converted {} into place: {}", output.filename().string(), reason));
    }
}

}
