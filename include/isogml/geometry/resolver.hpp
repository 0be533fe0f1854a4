#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../task/device_description.hpp"
#include "../task/task_data.hpp"
#include "../timelog/channel.hpp"
#include "point3.hpp"
#include "record.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <utility>

namespace isogml::geometry {

    // ─── Offset extraction ───────────────────────────────────────────────────────
    // Per axis (DDI 134/135/136): a DPD makes the axis dynamic, otherwise a DPT
    // supplies a constant in mm. y and z are negated (ISO 11783 +y right, +z down).
    inline Result<Point3> extract_offset(const task::DeviceDescription &graph, const task::ElementRef &ref) {
        struct Axis {
            DDI code;
            f64 sign;
            f64 Point3::*value;
            dp::Optional<DynamicRef> Point3::*dynamic;
        };
        static const Axis AXES[] = {
            {ddi::DEVICE_ELEMENT_OFFSET_X, 1.0, &Point3::x, &Point3::dyn_x},
            {ddi::DEVICE_ELEMENT_OFFSET_Y, -1.0, &Point3::y, &Point3::dyn_y},
            {ddi::DEVICE_ELEMENT_OFFSET_Z, -1.0, &Point3::z, &Point3::dyn_z},
        };

        Point3 p;
        for (const auto &axis : AXES) {
            auto pd = graph.process_data_for(ref, axis.code);
            if (!pd.is_ok())
                return Result<Point3>::err(pd.error());
            if (pd.value() != nullptr) {
                p.*axis.dynamic = DynamicRef{ref.element->id, axis.code};
                continue;
            }

            auto pt = graph.property_for(ref, axis.code);
            if (!pt.is_ok())
                return Result<Point3>::err(pt.error());
            if (pt.value() != nullptr)
                p.*axis.value = static_cast<f64>(pt.value()->value) * MM_TO_M * axis.sign;
        }
        return Result<Point3>::ok(p);
    }

    inline Result<Point3> extract_offset(const task::DeviceDescription &graph, const XmlId &element) {
        auto ref = graph.find_element(element);
        if (!ref.is_ok())
            return Result<Point3>::err(ref.error());
        return extract_offset(graph, ref.value());
    }

    inline Result<bool> has_offset(const task::DeviceDescription &graph, const task::ElementRef &ref) {
        auto p = extract_offset(graph, ref);
        if (!p.is_ok())
            return Result<bool>::err(p.error());
        return Result<bool>::ok(!p.value().is_default());
    }

    // ─── Resolution outcome ──────────────────────────────────────────────────────
    // `records` always ends with the "original" record, even when success is false.
    struct ResolveOutcome {
        dp::Vector<GeometryRecord> records;
        bool success = true;
    };

    class GeometryResolver {
        const task::DeviceDescription &graph_;
        dp::Vector<XmlId> covered_navigation_;

      public:
        explicit GeometryResolver(const task::DeviceDescription &graph) : graph_(graph) {}

        ResolveOutcome resolve(const task::Task &task) {
            ResolveOutcome out;
            covered_navigation_.clear();

            auto built = build(task, out.records);
            if (!built.is_ok()) {
                echo::category("isogml.geometry")
                    .warn("geometry resolution for task ", task.id, " failed: ", built.error().message,
                          "; continuing with ", out.records.size(), " records");
                out.success = false;
            }

            out.records.push_back(original_record());

            for (const auto &r : out.records) {
                echo::category("isogml.geometry")
                    .debug(to_string(r.connection), " ", r.element, " (", r.description, ")");
            }
            return out;
        }

      private:
        Result<void> build(const task::Task &task, dp::Vector<GeometryRecord> &records) {
            for (const auto &cnn : task.connections) {
                auto r = resolve_connection(cnn, records);
                if (!r.is_ok())
                    return r;
            }

            for (const auto *device : task_devices(task)) {
                const auto *nav = device->navigation_element();
                if (!nav || is_covered(nav->id))
                    continue;
                auto r = resolve_mounted(*device, *nav, records);
                if (!r.is_ok())
                    return r;
            }
            return {};
        }

        // Steps for a hitch: the side carrying the GNSS antenna is the tractor
        Result<void> resolve_connection(const task::Connection &cnn, dp::Vector<GeometryRecord> &records) {
            auto side0 = graph_.find_element(cnn.element0);
            if (!side0.is_ok())
                return Result<void>::err(side0.error());
            auto side1 = graph_.find_element(cnn.element1);
            if (!side1.is_ok())
                return Result<void>::err(side1.error());

            task::ElementRef tractor = side0.value();
            task::ElementRef implement = side1.value();
            if (tractor.device->id != cnn.device0 || implement.device->id != cnn.device1) {
                return Result<void>::err(Error::geometry("connection elements " + cnn.element0 + "/" + cnn.element1 +
                                                         " do not belong to " + cnn.device0 + "/" + cnn.device1));
            }

            // Assumes the GNSS-bearing device is the towing vehicle
            if (!tractor.device->has_navigation()) {
                std::swap(tractor, implement);
                echo::category("isogml.geometry")
                    .debug("connection ", cnn.device0, " - ", cnn.device1, ": ", tractor.device->id, " taken as tractor");
            }
            if (!tractor.device->has_navigation()) {
                echo::category("isogml.geometry")
                    .warn("connection ", cnn.device0, " - ", cnn.device1, " has no navigation reference, skipped");
                return {};
            }

            const auto *nav = tractor.device->navigation_element();
            auto nav_offset = extract_offset(graph_, task::ElementRef{tractor.device, nav});
            if (!nav_offset.is_ok())
                return Result<void>::err(nav_offset.error());
            auto tractor_connector = extract_offset(graph_, tractor);
            if (!tractor_connector.is_ok())
                return Result<void>::err(tractor_connector.error());
            auto implement_connector = extract_offset(graph_, implement);
            if (!implement_connector.is_ok())
                return Result<void>::err(implement_connector.error());
            auto yaw = find_yaw(*tractor.device);
            if (!yaw.is_ok())
                return Result<void>::err(yaw.error());

            auto root = graph_.root_element(*implement.device);
            if (!root.is_ok())
                return Result<void>::err(root.error());

            auto emit = [&](const task::DeviceElement &element) -> Result<void> {
                task::ElementRef ref{implement.device, &element};
                auto point = extract_offset(graph_, ref);
                if (!point.is_ok())
                    return Result<void>::err(point.error());

                GeometryRecord r;
                r.element = element.id;
                r.description = task::DeviceDescription::describe(ref);
                r.connection = ConnectionType::Towed;
                r.tractor_navigation_point = nav_offset.value();
                r.tractor_connector_point = tractor_connector.value();
                r.implement_connector_point = implement_connector.value();
                r.implement_element_point = point.value();
                r.yaw_reference = yaw.value();
                records.push_back(std::move(r));
                return {};
            };

            for (const auto &element : implement.device->elements) {
                if (&element == root.value())
                    continue;
                auto offset = has_offset(graph_, task::ElementRef{implement.device, &element});
                if (!offset.is_ok())
                    return Result<void>::err(offset.error());
                if (!offset.value())
                    continue;
                auto r = emit(element);
                if (!r.is_ok())
                    return r;
            }
            auto r = emit(*root.value());
            if (!r.is_ok())
                return r;

            covered_navigation_.push_back(nav->id);
            echo::category("isogml.geometry")
                .info("hitch ", tractor.device->id, " -> ", implement.device->id, " resolved");
            return {};
        }

        // Antenna directly on the device: every point shares the vehicle heading
        Result<void> resolve_mounted(const task::Device &device, const task::DeviceElement &nav,
                                     dp::Vector<GeometryRecord> &records) {
            auto nav_offset = extract_offset(graph_, task::ElementRef{&device, &nav});
            if (!nav_offset.is_ok())
                return Result<void>::err(nav_offset.error());
            auto yaw = find_yaw(device);
            if (!yaw.is_ok())
                return Result<void>::err(yaw.error());
            auto root = graph_.root_element(device);
            if (!root.is_ok())
                return Result<void>::err(root.error());

            auto emit = [&](const task::DeviceElement &element, Point3 point) {
                GeometryRecord r;
                r.element = element.id;
                r.description = task::DeviceDescription::describe(task::ElementRef{&device, &element});
                r.connection = ConnectionType::Mounted;
                r.tractor_navigation_point = nav_offset.value();
                r.implement_element_point = std::move(point);
                r.yaw_reference = yaw.value();
                records.push_back(std::move(r));
            };

            auto root_point = extract_offset(graph_, task::ElementRef{&device, root.value()});
            if (!root_point.is_ok())
                return Result<void>::err(root_point.error());
            emit(*root.value(), root_point.value());

            for (const auto &element : device.elements) {
                if (&element == root.value())
                    continue;
                auto point = extract_offset(graph_, task::ElementRef{&device, &element});
                if (!point.is_ok())
                    return Result<void>::err(point.error());
                if (!point.value().is_default())
                    emit(element, point.value());
            }

            covered_navigation_.push_back(nav.id);
            return {};
        }

        // DDI 144 on any element of the device
        Result<dp::Optional<DynamicRef>> find_yaw(const task::Device &device) const {
            for (const auto &element : device.elements) {
                auto pd = graph_.process_data_for(task::ElementRef{&device, &element}, ddi::YAW_ANGLE);
                if (!pd.is_ok())
                    return Result<dp::Optional<DynamicRef>>::err(pd.error());
                if (pd.value() != nullptr) {
                    return Result<dp::Optional<DynamicRef>>::ok(
                        dp::Optional<DynamicRef>(DynamicRef{element.id, ddi::YAW_ANGLE}));
                }
            }
            return Result<dp::Optional<DynamicRef>>::ok(dp::Optional<DynamicRef>());
        }

        // Devices assigned to the task (DAN); every device when none are listed
        dp::Vector<const task::Device *> task_devices(const task::Task &task) const {
            dp::Vector<const task::Device *> out;
            if (task.device_refs.empty()) {
                for (const auto &d : graph_.devices())
                    out.push_back(&d);
                return out;
            }
            for (const auto &id : task.device_refs) {
                auto d = graph_.find_device(id);
                if (d.is_ok()) {
                    out.push_back(d.value());
                } else {
                    echo::category("isogml.geometry").warn(d.error().message);
                }
            }
            return out;
        }

        bool is_covered(const XmlId &nav) const noexcept {
            for (const auto &id : covered_navigation_) {
                if (id == nav)
                    return true;
            }
            return false;
        }
    };

    inline ResolveOutcome resolve(const task::DeviceDescription &graph, const task::Task &task) {
        GeometryResolver resolver(graph);
        return resolver.resolve(task);
    }

    // ─── Channel partition ───────────────────────────────────────────────────────
    // With simulation a data channel goes to every record owning its element or
    // reading a point axis from it; the rest land in "original". Without
    // simulation everything lands in "original".
    inline void partition(const timelog::ChannelSet &data, dp::Vector<GeometryRecord> &records, bool simulate) {
        GeometryRecord *original = nullptr;
        for (auto &r : records) {
            if (r.is_original())
                original = &r;
        }
        if (!original) {
            records.push_back(original_record());
            original = &records.back();
        }

        for (const auto &column : data.columns()) {
            bool assigned = false;
            if (simulate && column.identity().has_value()) {
                const auto &id = *column.identity();
                for (auto &r : records) {
                    if (r.is_original())
                        continue;
                    if (r.element == id.element || r.references(id)) {
                        r.data_channels.add(column);
                        assigned = true;
                    }
                }
            }
            if (!assigned)
                original->data_channels.add(column);
        }
    }

    inline void clear_channels(dp::Vector<GeometryRecord> &records) {
        for (auto &r : records)
            r.clear_channels();
    }

} // namespace isogml::geometry
