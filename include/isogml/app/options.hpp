#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../output/naming.hpp"
#include <datapod/datapod.hpp>
#include <string_view>
#include <utility>

namespace isogml::app {

    inline constexpr const char *DEFAULT_TASK_FILE = "./TASKDATA.XML";

    // ─── Run options ─────────────────────────────────────────────────────────────
    struct RunOptions {
        dp::String task_file = DEFAULT_TASK_FILE;
        output::Format format = output::Format::Gml;
        bool cartesian = false;   // local ENU millimetres instead of geodetic fixed point
        bool simulate = true;     // partition by geometry and simulate each record
        dp::String output_dir = "."; // where output files are written
        bool show_help = false;

        RunOptions &set_task_file(dp::String v) {
            task_file = std::move(v);
            return *this;
        }
        RunOptions &set_format(output::Format v) {
            format = v;
            return *this;
        }
        RunOptions &set_cartesian(bool v) {
            cartesian = v;
            return *this;
        }
        RunOptions &set_simulate(bool v) {
            simulate = v;
            return *this;
        }
        RunOptions &set_output_dir(dp::String v) {
            output_dir = std::move(v);
            return *this;
        }
    };

    inline const char *usage() noexcept {
        return "Usage: isogml_convert [options] [TASKDATA.XML]\n"
               "  -o=FORMAT, -output=FORMAT  output format, one of [GML, CSV] (default GML)\n"
               "  -c, -cartesian             write local Cartesian coordinates in mm\n"
               "  -n, -nosimulation          keep the GNSS antenna trace, no geometry simulation\n"
               "  -h, -help                  show this text\n";
    }

    inline Result<output::Format> parse_format(std::string_view value) {
        if (value == "GML" || value == "gml")
            return Result<output::Format>::ok(output::Format::Gml);
        if (value == "CSV" || value == "csv")
            return Result<output::Format>::ok(output::Format::Csv);
        return Result<output::Format>::err(
            Error::invalid_argument("unknown output type '" + dp::String(value) + "', expected [GML, CSV]"));
    }

    // Flags start with '-'; anything else is the task file path
    inline Result<RunOptions> parse_args(int argc, const char *const *argv) {
        RunOptions opts;
        for (int i = 1; i < argc; ++i) {
            std::string_view arg(argv[i]);
            if (arg.empty() || arg.front() != '-') {
                opts.task_file = dp::String(arg);
                continue;
            }

            auto eq = arg.find('=');
            std::string_view flag = arg.substr(0, eq);
            std::string_view value = eq == std::string_view::npos ? std::string_view() : arg.substr(eq + 1);

            if (flag == "-o" || flag == "-output") {
                auto format = parse_format(value);
                if (!format.is_ok())
                    return Result<RunOptions>::err(format.error());
                opts.format = format.value();
            } else if ((flag == "-c" || flag == "-cartesian") && eq == std::string_view::npos) {
                opts.cartesian = true;
            } else if ((flag == "-n" || flag == "-nosimulation") && eq == std::string_view::npos) {
                opts.simulate = false;
            } else if ((flag == "-h" || flag == "-help") && eq == std::string_view::npos) {
                opts.show_help = true;
            } else {
                return Result<RunOptions>::err(Error::invalid_argument("unknown parameter '" + dp::String(arg) + "'"));
            }
        }
        return Result<RunOptions>::ok(std::move(opts));
    }

} // namespace isogml::app
