#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace isogml::task {

    // ─── Device process data (DPD) ───────────────────────────────────────────────
    // A dynamically logged value; its samples arrive through the time-log.
    struct ProcessDataDefinition {
        ObjectID object_id = 0;
        DDI ddi = 0;
        dp::String designator;
    };

    // ─── Device property (DPT) ───────────────────────────────────────────────────
    // A fixed value, e.g. a constant element offset in mm.
    struct PropertyDefinition {
        ObjectID object_id = 0;
        DDI ddi = 0;
        i32 value = 0;
        dp::String designator;
    };

    // ─── Device element (DET) ────────────────────────────────────────────────────
    struct DeviceElement {
        XmlId id;
        DeviceElementType type = DeviceElementType::Device;
        ObjectID object_id = 0;
        dp::String designator;
        ElementNumber number = 0;
        ObjectID parent_object_id = 0;
        dp::Vector<ObjectID> object_refs; // DOR children

        // Fluent setters
        DeviceElement &set_id(XmlId v) {
            id = std::move(v);
            return *this;
        }
        DeviceElement &set_type(DeviceElementType v) {
            type = v;
            return *this;
        }
        DeviceElement &set_object_id(ObjectID v) {
            object_id = v;
            return *this;
        }
        DeviceElement &set_designator(dp::String v) {
            designator = std::move(v);
            return *this;
        }
        DeviceElement &set_parent(ObjectID v) {
            parent_object_id = v;
            return *this;
        }
        DeviceElement &add_ref(ObjectID v) {
            object_refs.push_back(v);
            return *this;
        }

        bool is_navigation() const noexcept { return type == DeviceElementType::NavigationReference; }
    };

    // ─── Device (DVC) ────────────────────────────────────────────────────────────
    struct Device {
        XmlId id;
        dp::String designator;
        dp::Vector<DeviceElement> elements;
        dp::Vector<ProcessDataDefinition> process_data;
        dp::Vector<PropertyDefinition> properties;

        Device &set_id(XmlId v) {
            id = std::move(v);
            return *this;
        }
        Device &set_designator(dp::String v) {
            designator = std::move(v);
            return *this;
        }
        Device &add_element(DeviceElement v) {
            elements.push_back(std::move(v));
            return *this;
        }
        Device &add_process_data(ProcessDataDefinition v) {
            process_data.push_back(std::move(v));
            return *this;
        }
        Device &add_property(PropertyDefinition v) {
            properties.push_back(std::move(v));
            return *this;
        }

        const DeviceElement *navigation_element() const noexcept {
            for (const auto &e : elements) {
                if (e.is_navigation())
                    return &e;
            }
            return nullptr;
        }

        bool has_navigation() const noexcept { return navigation_element() != nullptr; }
    };

    // ─── Connection (CNN) ────────────────────────────────────────────────────────
    // Pairs two devices' connector elements, i.e. a physical hitch.
    struct Connection {
        XmlId device0;
        XmlId element0;
        XmlId device1;
        XmlId element1;
    };

    // Element together with the device that owns it
    struct ElementRef {
        const Device *device = nullptr;
        const DeviceElement *element = nullptr;
    };

    // ─── Device description graph ────────────────────────────────────────────────
    // Read-only for the whole run. Lookups return Result; zero or more than one
    // match is a SchemaMismatch.
    class DeviceDescription {
        dp::Vector<Device> devices_;

      public:
        DeviceDescription() = default;
        explicit DeviceDescription(dp::Vector<Device> devices) : devices_(std::move(devices)) {}

        DeviceDescription &add_device(Device d) {
            devices_.push_back(std::move(d));
            return *this;
        }

        const dp::Vector<Device> &devices() const noexcept { return devices_; }

        Result<const Device *> find_device(const XmlId &id) const {
            const Device *found = nullptr;
            usize matches = 0;
            for (const auto &d : devices_) {
                if (d.id == id) {
                    found = &d;
                    ++matches;
                }
            }
            if (matches != 1)
                return Result<const Device *>::err(Error::not_unique("device " + id, matches));
            return Result<const Device *>::ok(found);
        }

        Result<ElementRef> find_element(const XmlId &id) const {
            ElementRef found;
            usize matches = 0;
            for (const auto &d : devices_) {
                for (const auto &e : d.elements) {
                    if (e.id == id) {
                        found = ElementRef{&d, &e};
                        ++matches;
                    }
                }
            }
            if (matches != 1)
                return Result<ElementRef>::err(Error::not_unique("device element " + id, matches));
            return Result<ElementRef>::ok(found);
        }

        // Device reference point element: the type Device element, or else the one
        // without a parent
        Result<const DeviceElement *> root_element(const Device &device) const {
            const DeviceElement *found = nullptr;
            usize matches = 0;
            for (const auto &e : device.elements) {
                if (e.type == DeviceElementType::Device) {
                    found = &e;
                    ++matches;
                }
            }
            if (matches == 0) {
                for (const auto &e : device.elements) {
                    if (e.parent_object_id == 0) {
                        found = &e;
                        ++matches;
                    }
                }
            }
            if (matches != 1)
                return Result<const DeviceElement *>::err(Error::not_unique("root element of " + device.id, matches));
            return Result<const DeviceElement *>::ok(found);
        }

        // DPD with the given DDI linked from the element's object references.
        // Absence is not an error (nullptr); ambiguity is.
        Result<const ProcessDataDefinition *> process_data_for(const ElementRef &ref, DDI ddi) const {
            const ProcessDataDefinition *found = nullptr;
            usize matches = 0;
            for (auto obj : ref.element->object_refs) {
                for (const auto &pd : ref.device->process_data) {
                    if (pd.object_id == obj && pd.ddi == ddi) {
                        found = &pd;
                        ++matches;
                    }
                }
            }
            if (matches > 1)
                return Result<const ProcessDataDefinition *>::err(
                    Error::not_unique("process data " + ddi_label(ref, ddi), matches));
            return Result<const ProcessDataDefinition *>::ok(found);
        }

        // DPT with the given DDI linked from the element's object references
        Result<const PropertyDefinition *> property_for(const ElementRef &ref, DDI ddi) const {
            const PropertyDefinition *found = nullptr;
            usize matches = 0;
            for (auto obj : ref.element->object_refs) {
                for (const auto &pt : ref.device->properties) {
                    if (pt.object_id == obj && pt.ddi == ddi) {
                        found = &pt;
                        ++matches;
                    }
                }
            }
            if (matches > 1)
                return Result<const PropertyDefinition *>::err(
                    Error::not_unique("property " + ddi_label(ref, ddi), matches));
            return Result<const PropertyDefinition *>::ok(found);
        }

        // Human readable label: designators, falling back to identifiers
        static dp::String describe(const ElementRef &ref) {
            dp::String dev = ref.device->designator.empty() ? ref.device->id : ref.device->designator;
            dp::String det = ref.element->designator.empty() ? ref.element->id : ref.element->designator;
            return dev + "_" + det;
        }

      private:
        static dp::String ddi_label(const ElementRef &ref, DDI ddi) {
            return dp::String(std::to_string(ddi)) + " on " + ref.element->id;
        }
    };

} // namespace isogml::task
