#include <isogml.hpp>
#include <echo/echo.hpp>

using namespace isogml;
using namespace isogml::app;

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed.is_ok()) {
        echo::error(parsed.error().message);
        echo::info(usage());
        return 2;
    }

    auto options = std::move(parsed.value());
    if (options.show_help) {
        echo::info(usage());
        return 0;
    }

    echo::info("Converting ", options.task_file, " to ", output::to_string(options.format),
               options.simulate ? "" : " (no simulation)", options.cartesian ? " (cartesian)" : "");

    Converter converter(std::move(options));
    bool ok = converter.run();

    if (ok) {
        echo::info("Done: ", converter.files_written(), " files written");
        return 0;
    }
    echo::error("Conversion finished with errors, ", converter.files_written(), " files written");
    return 1;
}
