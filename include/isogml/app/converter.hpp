#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../geometry/record.hpp"
#include "../geometry/resolver.hpp"
#include "../output/csv_writer.hpp"
#include "../output/gml_writer.hpp"
#include "../output/naming.hpp"
#include "../sim/trajectory.hpp"
#include "../task/loader.hpp"
#include "../task/task_data.hpp"
#include "../timelog/decoder.hpp"
#include "options.hpp"
#include <algorithm>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <filesystem>
#include <utility>

namespace isogml::app {

    // ─── Per time-log state ──────────────────────────────────────────────────────
    // Built fresh for every time-log; nothing carries over to the next one.
    struct TimelogContext {
        dp::String name; // TLG A
        timelog::TimelogChannels channels;
        dp::Vector<geometry::GeometryRecord> records;

        TimelogContext(dp::String tlg, const dp::Vector<geometry::GeometryRecord> &resolved)
            : name(std::move(tlg)), records(resolved) {
            geometry::clear_channels(records);
        }
    };

    // ─── Converter ───────────────────────────────────────────────────────────────
    class Converter {
        RunOptions options_;
        usize files_written_ = 0;

      public:
        explicit Converter(RunOptions options) : options_(std::move(options)) {}

        const RunOptions &options() const noexcept { return options_; }
        usize files_written() const noexcept { return files_written_; }

        // Overall success is the AND of every task and time-log outcome
        bool run() {
            auto loaded = task::load_task_document(options_.task_file);
            if (!loaded.is_ok()) {
                echo::category("isogml.app").error(loaded.error().message);
                return false;
            }
            return run(loaded.value());
        }

        bool run(const task::TaskDocument &doc) {
            bool ok = true;
            for (const auto &t : doc.tasks) {
                if (!convert_task(doc, t))
                    ok = false;
            }
            return ok;
        }

      private:
        bool convert_task(const task::TaskDocument &doc, const task::Task &t) {
            echo::category("isogml.app").info("task ", t.id, " (", t.designator, "): ", t.timelogs.size(), " time-logs");

            auto geometry = geometry::resolve(doc.devices, t);
            bool ok = geometry.success;

            for (const auto &tlg : t.timelogs) {
                TimelogContext ctx(tlg, geometry.records);
                if (!convert_timelog(doc, t, ctx))
                    ok = false;
            }
            return ok;
        }

        bool convert_timelog(const task::TaskDocument &doc, const task::Task &t, TimelogContext &ctx) {
            auto schema_path = task::detail::sibling_file(doc.directory, ctx.name, ".XML");
            auto binary_path = task::detail::sibling_file(doc.directory, ctx.name, ".BIN");
            if (!schema_path.has_value() || !binary_path.has_value()) {
                echo::category("isogml.app").error("time-log ", ctx.name, ": header or binary file missing");
                return false;
            }

            auto decoded = timelog::decode_file(*schema_path, *binary_path, doc.devices);
            if (!decoded.is_ok()) {
                echo::category("isogml.app").error("time-log ", ctx.name, ": ", decoded.error().message);
                return false;
            }
            ctx.channels = std::move(decoded.value());

            bool ok = true;
            geometry::partition(ctx.channels.data, ctx.records, options_.simulate);

            bool simulated = false;
            if (options_.simulate) {
                sim::TrajectorySimulator simulator(sim::SimulationOptions{}.set_cartesian(options_.cartesian));
                simulated = simulator.simulate(ctx.channels.header, ctx.records);
                if (!simulated)
                    ok = false;
            }

            dp::Vector<dp::String> descriptions;
            for (auto &record : ctx.records) {
                if (!record.is_original() && record.data_channels.empty())
                    continue;
                const auto &header = simulated ? record.header_channels : ctx.channels.header;
                if (header.rows() == 0) {
                    echo::category("isogml.app").debug("record ", record.element, " has no rows, skipped");
                    continue;
                }

                // Equal designators would map two records onto one file
                dp::String description = record.is_original() ? dp::String() : record.description;
                if (std::find(descriptions.begin(), descriptions.end(), description) != descriptions.end()) {
                    echo::category("isogml.app")
                        .warn("description '", description, "' repeats, adding element id ", record.element);
                    description += "_" + record.element;
                }
                descriptions.push_back(description);

                if (!write_record(t, ctx.name, description, header, record.data_channels))
                    ok = false;
            }
            return ok;
        }

        bool write_record(const task::Task &t, const dp::String &timelog_name, const dp::String &description,
                          const timelog::ChannelSet &header, const timelog::ChannelSet &data) {
            dp::String base = output::output_base_name(t.farm, t.field, t.designator, description, header);
            dp::String file = output::output_file_name(base, timelog_name, options_.format);
            dp::String path((std::filesystem::path(options_.output_dir.c_str()) / file.c_str()).string());

            auto written = options_.format == output::Format::Csv
                               ? output::write_csv(path, header, data)
                               : write_gml(t, path, header, data);
            if (!written.is_ok()) {
                echo::category("isogml.app").error("writing ", path, " failed: ", written.error().message);
                return false;
            }
            ++files_written_;
            return true;
        }

        Result<void> write_gml(const task::Task &t, const dp::String &path, const timelog::ChannelSet &header,
                               const timelog::ChannelSet &data) const {
            if (options_.cartesian && options_.simulate) {
                echo::category("isogml.app").warn("GML coordinates are geodetic; cartesian output is written as-is");
            }
            return output::write_gml(path, t.designator, header, data);
        }
    };

} // namespace isogml::app
